#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "event_codes.hpp"
#include "input_event.hpp"

namespace evdevkit {

struct DeviceId {
    uint16_t bustype = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;
    uint16_t version = 0;

    bool operator==(const DeviceId& other) const {
        return bustype == other.bustype && vendor == other.vendor &&
               product == other.product && version == other.version;
    }
    bool operator!=(const DeviceId& other) const { return !(*this == other); }
};

// Partial id assignment: only the fields that are set are applied.
struct IdUpdate {
    std::optional<uint16_t> bustype;
    std::optional<uint16_t> vendor;
    std::optional<uint16_t> product;
    std::optional<uint16_t> version;
};

struct DeviceIdentity {
    std::string name;
    std::optional<std::string> phys;
    std::optional<std::string> uniq;
    DeviceId id;
    int driver_version = 0;
};

// Payload for DeviceState::enable(): AbsInfo for EV_ABS codes, the repeat
// value for EV_REP codes, nothing otherwise.
using EnableData = std::variant<std::monostate, AbsInfo, int>;

// In-memory mirror of one evdev device: identity, enabled capabilities,
// axis calibration, current values and multi-touch slots.
//
// Disabling a type clears only the type bit. Its codes stay recorded and
// become reachable again when the type is re-enabled, and their stored
// values persist throughout. EV_SYN is always enabled.
class DeviceState {
public:
    DeviceState() = default;

    const DeviceIdentity& identity() const { return ident; }
    void set_name(const std::string& name) { ident.name = name; }
    void set_phys(const std::optional<std::string>& phys) { ident.phys = phys; }
    void set_uniq(const std::optional<std::string>& uniq) { ident.uniq = uniq; }
    void set_id(const IdUpdate& update);
    void set_driver_version(int version) { ident.driver_version = version; }

    // Capabilities
    bool has_event(const EventBit& bit) const;
    bool has_property(const InputProperty& prop) const;
    void enable(const EventBit& bit, const EnableData& data = {});
    void disable(const EventBit& bit);
    void enable_property(const InputProperty& prop);
    void disable_property(const InputProperty& prop);

    std::map<EventType, std::vector<EventCode>> evbits() const;
    std::vector<InputProperty> properties() const;

    // Axis calibration. Returns the stored AbsInfo after any merge, or
    // nullopt if code is not an enabled EV_ABS code.
    std::optional<AbsInfo> absinfo(const EventCode& code) const;
    std::optional<AbsInfo> set_absinfo(const EventCode& code, const AbsInfo& new_values);

    // Current values. Writing through a bare type throws InvalidArgumentError.
    std::optional<int> event_value(const EventBit& bit) const;
    std::optional<int> set_event_value(const EventBit& bit, int value);

    // Multi-touch. num_slots is the ABS_MT_SLOT maximum + 1, capped at 60
    // like libevdev, and absent while ABS_MT_SLOT - 1 is enabled (the
    // device only borrows the ABS_MT_* codes). Throws InvalidArgumentError
    // when the device has no slots, slot >= num_slots, or code is not an
    // ABS_MT_* code above ABS_MT_SLOT.
    std::optional<int> slot_value(unsigned int slot, const EventCode& code) const;
    std::optional<int> set_slot_value(unsigned int slot, const EventCode& code, int value);

    std::optional<int> num_slots() const;
    std::optional<int> current_slot() const;

    // Folds one delivered event into the mirror.
    void apply(const InputEvent& ev);

private:
    DeviceIdentity ident;
    std::set<uint16_t> types;
    std::set<EventCode> codes;
    std::set<uint16_t> props;
    std::map<uint16_t, AbsInfo> axes;
    std::map<EventCode, int> values;
    std::vector<std::map<uint16_t, int>> slots;
    int slot_index = 0;

    void check_slot_args(unsigned int slot, const EventCode& code) const;
    bool slots_active() const;
    static int slot_count(const AbsInfo& slot_axis);
    void init_slots(const AbsInfo& slot_axis);
    void resize_slots(const AbsInfo& slot_axis);
    static bool is_boolean_type(uint16_t type);
};

} // namespace evdevkit
