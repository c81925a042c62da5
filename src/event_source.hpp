#pragma once

#include <ctime>
#include <linux/input.h>

#include "device_state.hpp"

namespace evdevkit {

enum class ReadFlag {
    Normal,
    Blocking,
    Sync,
    ForceSync
};

enum class ReadStatus {
    Success,
    Sync,   // record belongs to a sync sequence or announces one
    Again   // nothing available
};

// The codec and device node behind a Device: reads kernel event records,
// answers capability queries at attach time and applies ioctl-level
// changes. Capability and value writes are mirrored into the source so
// that its own filtering and sync bookkeeping match the DeviceState.
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual int fd() const = 0;
    virtual bool is_blocking() const = 0;

    // Reads the next record under the given flag. ForceSync regenerates
    // the sync sequence and returns its first record. Throws
    // std::system_error on read failure.
    virtual ReadStatus next_event(ReadFlag flag, struct input_event& ev) = 0;

    virtual void change_fd(int fd) = 0;
    virtual void set_clock_id(clockid_t clock) = 0;
    // 0 on success, negative errno on failure
    virtual int grab(bool enable) = 0;

    // Fills state with what the device reports right now.
    virtual void load_state(DeviceState& state) = 0;

    // Throws std::system_error if the kernel refuses.
    virtual void kernel_set_abs_info(const EventCode& code, const struct input_absinfo& abs) = 0;

    virtual void set_identity(const DeviceIdentity& identity) = 0;
    virtual void enable(const EventBit& bit, const EnableData& data) = 0;
    virtual void disable(const EventBit& bit) = 0;
    virtual void enable_property(const InputProperty& prop) = 0;
    virtual void disable_property(const InputProperty& prop) = 0;
    virtual void set_abs_info(const EventCode& code, const struct input_absinfo& abs) = 0;
    virtual void set_event_value(const EventCode& code, int value) = 0;
    virtual void set_slot_value(unsigned int slot, const EventCode& code, int value) = 0;
};

} // namespace evdevkit
