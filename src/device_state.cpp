#include "device_state.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <linux/input-event-codes.h>
#include <algorithm>

namespace evdevkit {

namespace {

const EventCode mt_slot_code{EV_ABS, ABS_MT_SLOT};

// Devices that set ABS_MT_SLOT - 1 only reuse the ABS_MT_* range for
// plain axes. They have no slots.
const EventCode fake_mt_code{EV_ABS, ABS_MT_SLOT - 1};

// libevdev's MAX_SLOTS
constexpr int max_slots = 60;

} // namespace

void DeviceState::set_id(const IdUpdate& update) {
    if (update.bustype) ident.id.bustype = *update.bustype;
    if (update.vendor) ident.id.vendor = *update.vendor;
    if (update.product) ident.id.product = *update.product;
    if (update.version) ident.id.version = *update.version;
}

bool DeviceState::is_boolean_type(uint16_t type) {
    return type == EV_KEY || type == EV_LED || type == EV_SW || type == EV_SND;
}

bool DeviceState::has_event(const EventBit& bit) const {
    if (std::holds_alternative<EventType>(bit)) {
        const EventType& type = std::get<EventType>(bit);
        if (!type.is_valid()) return false;
        return type.value == EV_SYN || types.count(type.value) > 0;
    }

    const EventCode& code = std::get<EventCode>(bit);
    if (!code.is_valid() || !has_event(code.event_type())) {
        return false;
    }
    return code.type == EV_SYN || codes.count(code) > 0;
}

bool DeviceState::has_property(const InputProperty& prop) const {
    return props.count(prop.value) > 0;
}

void DeviceState::enable(const EventBit& bit, const EnableData& data) {
    if (std::holds_alternative<EventType>(bit)) {
        const EventType& type = std::get<EventType>(bit);
        if (!type.is_valid()) {
            throw InvalidArgumentError("unknown event type " + std::to_string(type.value));
        }
        types.insert(type.value);
        return;
    }

    const EventCode& code = std::get<EventCode>(bit);
    if (!code.is_valid()) {
        throw InvalidArgumentError("unknown event code " + std::to_string(code.type) +
                                   "/" + std::to_string(code.value));
    }

    if (code.type == EV_ABS && !std::holds_alternative<AbsInfo>(data)) {
        throw InvalidArgumentError(std::string(code.name()) + " requires AbsInfo data");
    }
    if (code.type == EV_REP && !std::holds_alternative<int>(data)) {
        throw InvalidArgumentError(std::string(code.name()) + " requires an integer value");
    }

    types.insert(code.type);
    codes.insert(code);

    if (code.type == EV_ABS) {
        // Unset fields are zero on a freshly enabled axis
        AbsInfo stored = AbsInfo::from_kernel(std::get<AbsInfo>(data).to_kernel());
        axes[code.value] = stored;
        if (code == mt_slot_code) {
            init_slots(stored);
        }
    } else if (code.type == EV_REP) {
        values[code] = std::get<int>(data);
    }
}

void DeviceState::disable(const EventBit& bit) {
    if (std::holds_alternative<EventType>(bit)) {
        const EventType& type = std::get<EventType>(bit);
        if (type.value != EV_SYN) {
            types.erase(type.value);
        }
        return;
    }

    const EventCode& code = std::get<EventCode>(bit);
    if (code.type == EV_SYN) {
        return;
    }
    codes.erase(code);
    if (code == mt_slot_code) {
        slots.clear();
        slot_index = 0;
    }
}

void DeviceState::enable_property(const InputProperty& prop) {
    if (!prop.is_valid()) {
        throw InvalidArgumentError("unknown input property " + std::to_string(prop.value));
    }
    props.insert(prop.value);
}

void DeviceState::disable_property(const InputProperty& prop) {
    props.erase(prop.value);
}

std::map<EventType, std::vector<EventCode>> DeviceState::evbits() const {
    std::map<EventType, std::vector<EventCode>> result;
    for (const auto& type : registry::event_types()) {
        if (!has_event(type)) continue;

        std::vector<EventCode>& enabled = result[type];
        for (const auto& code : type.codes()) {
            if (has_event(code)) {
                enabled.push_back(code);
            }
        }
    }
    return result;
}

std::vector<InputProperty> DeviceState::properties() const {
    std::vector<InputProperty> result;
    for (const auto& prop : registry::properties()) {
        if (has_property(prop)) {
            result.push_back(prop);
        }
    }
    return result;
}

std::optional<AbsInfo> DeviceState::absinfo(const EventCode& code) const {
    if (code.type != EV_ABS || !has_event(code)) {
        return std::nullopt;
    }
    auto it = axes.find(code.value);
    if (it == axes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AbsInfo> DeviceState::set_absinfo(const EventCode& code, const AbsInfo& new_values) {
    if (code.type != EV_ABS || !has_event(code)) {
        return std::nullopt;
    }
    AbsInfo& stored = axes[code.value];
    stored.merge(new_values);
    if (code == mt_slot_code && new_values.maximum) {
        resize_slots(stored);
    }
    return stored;
}

std::optional<int> DeviceState::event_value(const EventBit& bit) const {
    if (!std::holds_alternative<EventCode>(bit)) {
        return std::nullopt;
    }
    const EventCode& code = std::get<EventCode>(bit);
    if (!has_event(code)) {
        return std::nullopt;
    }

    if (code.type == EV_ABS) {
        auto it = axes.find(code.value);
        return it != axes.end() ? it->second.value.value_or(0) : 0;
    }

    auto it = values.find(code);
    return it != values.end() ? it->second : 0;
}

std::optional<int> DeviceState::set_event_value(const EventBit& bit, int value) {
    if (!std::holds_alternative<EventCode>(bit)) {
        throw InvalidArgumentError("cannot assign a value to event type " +
                                   std::string(name_of(bit)));
    }
    const EventCode& code = std::get<EventCode>(bit);
    if (!has_event(code)) {
        return std::nullopt;
    }

    switch (code.type) {
        case EV_ABS:
            if (code == mt_slot_code && slots_active()) {
                if (value < 0 || value >= static_cast<int>(slots.size())) {
                    throw InvalidArgumentError("slot " + std::to_string(value) + " out of range");
                }
                slot_index = value;
            } else if (code.value > ABS_MT_SLOT && slots_active()) {
                slots[slot_index][code.value] = value;
            }
            axes[code.value].value = value;
            break;
        case EV_KEY:
        case EV_LED:
        case EV_SW:
        case EV_SND:
            values[code] = value != 0 ? 1 : 0;
            break;
        case EV_REP:
            values[code] = value;
            break;
        default:
            // No state is kept for relative, misc or sync codes
            return std::nullopt;
    }

    return event_value(code);
}

void DeviceState::check_slot_args(unsigned int slot, const EventCode& code) const {
    auto count = num_slots();
    if (!count) {
        throw InvalidArgumentError("device does not support slots");
    }
    if (slot >= static_cast<unsigned int>(*count)) {
        throw InvalidArgumentError("slot " + std::to_string(slot) + " out of range");
    }
    if (code.type != EV_ABS || code.value <= ABS_MT_SLOT || !code.is_valid()) {
        throw InvalidArgumentError("not a multitouch slot code");
    }
}

std::optional<int> DeviceState::slot_value(unsigned int slot, const EventCode& code) const {
    check_slot_args(slot, code);
    if (!has_event(code)) {
        return std::nullopt;
    }

    const auto& slot_values = slots[slot];
    auto it = slot_values.find(code.value);
    return it != slot_values.end() ? it->second : 0;
}

std::optional<int> DeviceState::set_slot_value(unsigned int slot, const EventCode& code, int value) {
    check_slot_args(slot, code);
    if (!has_event(code)) {
        return std::nullopt;
    }

    slots[slot][code.value] = value;
    if (static_cast<int>(slot) == slot_index) {
        axes[code.value].value = value;
    }
    return value;
}

bool DeviceState::slots_active() const {
    return !slots.empty() && has_event(mt_slot_code) && !has_event(fake_mt_code);
}

std::optional<int> DeviceState::num_slots() const {
    if (!slots_active()) {
        return std::nullopt;
    }
    return static_cast<int>(slots.size());
}

std::optional<int> DeviceState::current_slot() const {
    if (!num_slots()) {
        return std::nullopt;
    }
    return slot_index;
}

// Slot count for an ABS_MT_SLOT axis, capped at max_slots. 0 if the
// maximum is negative.
int DeviceState::slot_count(const AbsInfo& slot_axis) {
    int64_t count = static_cast<int64_t>(slot_axis.maximum.value_or(-1)) + 1;
    if (count <= 0) {
        return 0;
    }
    if (count > max_slots) {
        EVDEVKIT_DEBUG_LOG("Capping %lld slots at %d\n", static_cast<long long>(count), max_slots);
        return max_slots;
    }
    return static_cast<int>(count);
}

void DeviceState::init_slots(const AbsInfo& slot_axis) {
    int count = slot_count(slot_axis);
    if (count == 0) {
        slots.clear();
        slot_index = 0;
        return;
    }
    slots.assign(count, std::map<uint16_t, int>());
    slot_index = std::clamp(slot_axis.value.value_or(0), 0, count - 1);
}

// Keeps the values of slots that survive the new maximum
void DeviceState::resize_slots(const AbsInfo& slot_axis) {
    int count = slot_count(slot_axis);
    slots.resize(count);
    slot_index = count == 0 ? 0 : std::clamp(slot_index, 0, count - 1);
}

void DeviceState::apply(const InputEvent& ev) {
    if (!ev.value || !has_event(ev.code)) {
        return;
    }
    const int value = *ev.value;
    const EventCode& code = ev.code;

    if (code.type == EV_ABS) {
        if (code == mt_slot_code && slots_active()) {
            // A slot outside the advertised range leaves the mirror as is
            if (value < 0 || value >= static_cast<int>(slots.size())) {
                return;
            }
            slot_index = value;
        } else if (code.value > ABS_MT_SLOT && slots_active()) {
            slots[slot_index][code.value] = value;
        }
        axes[code.value].value = value;
    } else if (is_boolean_type(code.type)) {
        values[code] = value != 0 ? 1 : 0;
    } else if (code.type == EV_REP) {
        values[code] = value;
    }
}

} // namespace evdevkit
