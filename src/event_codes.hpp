#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace evdevkit {

struct EventCode;

// One EV_* event type. Only types known to the registry are valid.
struct EventType {
    uint16_t value = 0;

    bool is_valid() const;
    std::string_view name() const;
    // Highest code of this type, -1 if the type carries no codes.
    int max() const;
    std::vector<EventCode> codes() const;

    bool operator==(const EventType& other) const { return value == other.value; }
    bool operator!=(const EventType& other) const { return value != other.value; }
    bool operator<(const EventType& other) const { return value < other.value; }
};

// A (type, code) pair, e.g. EV_ABS/ABS_X.
struct EventCode {
    uint16_t type = 0;
    uint16_t value = 0;

    bool is_valid() const;
    std::string_view name() const;
    EventType event_type() const { return EventType{type}; }

    bool operator==(const EventCode& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const EventCode& other) const { return !(*this == other); }
    bool operator<(const EventCode& other) const {
        if (type != other.type) return type < other.type;
        return value < other.value;
    }
};

struct InputProperty {
    uint16_t value = 0;

    bool is_valid() const;
    std::string_view name() const;

    bool operator==(const InputProperty& other) const { return value == other.value; }
    bool operator!=(const InputProperty& other) const { return value != other.value; }
    bool operator<(const InputProperty& other) const { return value < other.value; }
};

// Either a whole event type or a single code of a type.
using EventBit = std::variant<EventType, EventCode>;

EventType type_of(const EventBit& bit);
std::string_view name_of(const EventBit& bit);

// Process-wide immutable table of all event types, codes and properties,
// built once on first use. Lookups never throw.
namespace registry {

const std::vector<EventType>& event_types();
const std::vector<InputProperty>& properties();

std::optional<EventType> evbit(unsigned int type);
std::optional<EventCode> evbit(unsigned int type, unsigned int code);
std::optional<InputProperty> propbit(unsigned int prop);

std::optional<EventType> type_from_name(std::string_view name);
std::optional<EventCode> code_from_name(std::string_view name);
std::optional<InputProperty> property_from_name(std::string_view name);
// Type or code, whichever the name denotes.
std::optional<EventBit> bit_from_name(std::string_view name);

} // namespace registry

} // namespace evdevkit
