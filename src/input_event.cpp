#include "input_event.hpp"

#include <cstring>
#include <iomanip>

namespace evdevkit {

bool InputEvent::matches(const EventBit& bit, std::optional<int32_t> expected) const {
    if (std::holds_alternative<EventType>(bit)) {
        if (type() != std::get<EventType>(bit)) return false;
    } else if (code != std::get<EventCode>(bit)) {
        return false;
    }

    if (expected) {
        return value && *value == *expected;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const InputEvent& ev) {
    os << ev.sec << "." << std::setfill('0') << std::setw(6) << ev.usec << std::setfill(' ') << " ";

    if (ev.code.is_valid()) {
        os << ev.type().name() << " " << ev.code.name();
    } else {
        os << "type " << ev.code.type << " code " << ev.code.value;
    }

    if (ev.value) {
        os << " " << *ev.value;
    } else {
        os << " (no value)";
    }
    return os;
}

AbsInfo AbsInfo::from_kernel(const struct input_absinfo& abs) {
    AbsInfo info;
    info.minimum = abs.minimum;
    info.maximum = abs.maximum;
    info.fuzz = abs.fuzz;
    info.flat = abs.flat;
    info.resolution = abs.resolution;
    info.value = abs.value;
    return info;
}

struct input_absinfo AbsInfo::to_kernel() const {
    struct input_absinfo abs;
    memset(&abs, 0, sizeof(abs));
    abs.minimum = minimum.value_or(0);
    abs.maximum = maximum.value_or(0);
    abs.fuzz = fuzz.value_or(0);
    abs.flat = flat.value_or(0);
    abs.resolution = resolution.value_or(0);
    abs.value = value.value_or(0);
    return abs;
}

void AbsInfo::merge(const AbsInfo& other) {
    if (other.minimum) minimum = other.minimum;
    if (other.maximum) maximum = other.maximum;
    if (other.fuzz) fuzz = other.fuzz;
    if (other.flat) flat = other.flat;
    if (other.resolution) resolution = other.resolution;
    if (other.value) value = other.value;
}

bool AbsInfo::operator==(const AbsInfo& other) const {
    return minimum == other.minimum && maximum == other.maximum &&
           fuzz == other.fuzz && flat == other.flat &&
           resolution == other.resolution && value == other.value;
}

} // namespace evdevkit
