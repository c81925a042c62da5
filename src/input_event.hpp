#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <linux/input.h>

#include "event_codes.hpp"

namespace evdevkit {

// One observed or synthesized event. Events read from a device always
// carry a value; a caller-built event may leave it unset, which
// Device::send_events rejects. An invalid code counts as absent.
struct InputEvent {
    EventCode code;
    std::optional<int32_t> value;
    int64_t sec = 0;
    int64_t usec = 0;

    EventType type() const { return code.event_type(); }

    // True if this event is of the given type or code and, when given,
    // carries the given value.
    bool matches(const EventBit& bit, std::optional<int32_t> expected = std::nullopt) const;
};

std::ostream& operator<<(std::ostream& os, const InputEvent& ev);

// struct input_absinfo with every field optional. Unset fields are left
// untouched when written to a device, and unknown when read back.
struct AbsInfo {
    std::optional<int32_t> minimum;
    std::optional<int32_t> maximum;
    std::optional<int32_t> fuzz;
    std::optional<int32_t> flat;
    std::optional<int32_t> resolution;
    std::optional<int32_t> value;

    static AbsInfo from_kernel(const struct input_absinfo& abs);
    // Unset fields become 0.
    struct input_absinfo to_kernel() const;
    // Copies every field that is set in other.
    void merge(const AbsInfo& other);

    bool operator==(const AbsInfo& other) const;
    bool operator!=(const AbsInfo& other) const { return !(*this == other); }
};

} // namespace evdevkit
