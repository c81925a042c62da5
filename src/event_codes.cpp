#include "event_codes.hpp"

#include <linux/input.h>
#include <linux/input-event-codes.h>
#include <libevdev-1.0/libevdev/libevdev.h>
#include <cstdio>
#include <functional>
#include <map>

namespace evdevkit {

namespace {

struct TypeEntry {
    std::string name;
    int max = -1;
    std::vector<std::string> code_names;
};

struct Registry {
    std::vector<TypeEntry> types;  // indexed by type value, empty name = unknown
    std::vector<EventType> type_list;
    std::vector<std::string> property_names;  // indexed by property value
    std::vector<InputProperty> property_list;
    std::map<std::string, EventBit, std::less<>> bits_by_name;
    std::map<std::string, InputProperty, std::less<>> properties_by_name;
};

// Kernel headers leave gaps in the code ranges (reserved codes). Those get
// a generated name so every code a device can report still classifies.
std::string synthesize_code_name(const std::string& type_name, unsigned int code) {
    std::string prefix = type_name.substr(0, 3) == "EV_" ? type_name.substr(3) : type_name;
    char buf[16];
    snprintf(buf, sizeof(buf), "_0x%02X", code);
    return prefix + buf;
}

Registry build_registry() {
    Registry reg;
    reg.types.resize(EV_CNT);

    for (unsigned int type = 0; type < EV_CNT; type++) {
        const char* type_name = libevdev_event_type_get_name(type);
        if (!type_name) {
            continue;
        }

        TypeEntry& entry = reg.types[type];
        entry.name = type_name;
        entry.max = libevdev_event_type_get_max(type);

        EventType event_type{static_cast<uint16_t>(type)};
        reg.type_list.push_back(event_type);
        reg.bits_by_name.emplace(entry.name, event_type);

        for (int code = 0; code <= entry.max; code++) {
            const char* code_name = libevdev_event_code_get_name(type, code);
            std::string name = code_name ? code_name : synthesize_code_name(entry.name, code);
            entry.code_names.push_back(name);
            reg.bits_by_name.emplace(name, EventCode{static_cast<uint16_t>(type),
                                                     static_cast<uint16_t>(code)});
        }
    }

    reg.property_names.resize(INPUT_PROP_CNT);
    for (unsigned int prop = 0; prop < INPUT_PROP_CNT; prop++) {
        const char* prop_name = libevdev_property_get_name(prop);
        if (!prop_name) {
            continue;
        }
        reg.property_names[prop] = prop_name;
        InputProperty property{static_cast<uint16_t>(prop)};
        reg.property_list.push_back(property);
        reg.properties_by_name.emplace(prop_name, property);
    }

    return reg;
}

const Registry& table() {
    static const Registry instance = build_registry();
    return instance;
}

const TypeEntry* find_type(unsigned int type) {
    const Registry& reg = table();
    if (type >= reg.types.size() || reg.types[type].name.empty()) {
        return nullptr;
    }
    return &reg.types[type];
}

} // namespace

bool EventType::is_valid() const {
    return find_type(value) != nullptr;
}

std::string_view EventType::name() const {
    const TypeEntry* entry = find_type(value);
    return entry ? std::string_view(entry->name) : std::string_view();
}

int EventType::max() const {
    const TypeEntry* entry = find_type(value);
    return entry ? entry->max : -1;
}

std::vector<EventCode> EventType::codes() const {
    std::vector<EventCode> result;
    const TypeEntry* entry = find_type(value);
    if (!entry) {
        return result;
    }
    for (int code = 0; code <= entry->max; code++) {
        result.push_back(EventCode{value, static_cast<uint16_t>(code)});
    }
    return result;
}

bool EventCode::is_valid() const {
    const TypeEntry* entry = find_type(type);
    return entry && static_cast<int>(value) <= entry->max;
}

std::string_view EventCode::name() const {
    if (!is_valid()) {
        return std::string_view();
    }
    return find_type(type)->code_names[value];
}

bool InputProperty::is_valid() const {
    const Registry& reg = table();
    return value < reg.property_names.size() && !reg.property_names[value].empty();
}

std::string_view InputProperty::name() const {
    if (!is_valid()) {
        return std::string_view();
    }
    return table().property_names[value];
}

EventType type_of(const EventBit& bit) {
    if (std::holds_alternative<EventCode>(bit)) {
        return std::get<EventCode>(bit).event_type();
    }
    return std::get<EventType>(bit);
}

std::string_view name_of(const EventBit& bit) {
    if (std::holds_alternative<EventCode>(bit)) {
        return std::get<EventCode>(bit).name();
    }
    return std::get<EventType>(bit).name();
}

namespace registry {

const std::vector<EventType>& event_types() {
    return table().type_list;
}

const std::vector<InputProperty>& properties() {
    return table().property_list;
}

std::optional<EventType> evbit(unsigned int type) {
    if (!find_type(type)) {
        return std::nullopt;
    }
    return EventType{static_cast<uint16_t>(type)};
}

std::optional<EventCode> evbit(unsigned int type, unsigned int code) {
    const TypeEntry* entry = find_type(type);
    if (!entry || static_cast<int>(code) > entry->max) {
        return std::nullopt;
    }
    return EventCode{static_cast<uint16_t>(type), static_cast<uint16_t>(code)};
}

std::optional<InputProperty> propbit(unsigned int prop) {
    InputProperty property{static_cast<uint16_t>(prop)};
    if (prop > UINT16_MAX || !property.is_valid()) {
        return std::nullopt;
    }
    return property;
}

std::optional<EventBit> bit_from_name(std::string_view name) {
    const Registry& reg = table();
    auto it = reg.bits_by_name.find(name);
    if (it != reg.bits_by_name.end()) {
        return it->second;
    }

    // Aliases (BTN_MOUSE for BTN_LEFT, ...) are only known to libevdev.
    std::string name_str(name);
    int type = libevdev_event_type_from_code_name(name_str.c_str());
    if (type < 0) {
        return std::nullopt;
    }
    int code = libevdev_event_code_from_code_name(name_str.c_str());
    if (code < 0) {
        return std::nullopt;
    }
    auto event_code = evbit(type, code);
    if (!event_code) {
        return std::nullopt;
    }
    return EventBit(*event_code);
}

std::optional<EventType> type_from_name(std::string_view name) {
    auto bit = bit_from_name(name);
    if (!bit || !std::holds_alternative<EventType>(*bit)) {
        return std::nullopt;
    }
    return std::get<EventType>(*bit);
}

std::optional<EventCode> code_from_name(std::string_view name) {
    auto bit = bit_from_name(name);
    if (!bit || !std::holds_alternative<EventCode>(*bit)) {
        return std::nullopt;
    }
    return std::get<EventCode>(*bit);
}

std::optional<InputProperty> property_from_name(std::string_view name) {
    const Registry& reg = table();
    auto it = reg.properties_by_name.find(name);
    if (it == reg.properties_by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace registry

} // namespace evdevkit
