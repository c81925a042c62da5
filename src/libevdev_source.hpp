#ifndef EVDEVKIT_LIBEVDEV_SOURCE_HPP
#define EVDEVKIT_LIBEVDEV_SOURCE_HPP

#include <libevdev-1.0/libevdev/libevdev.h>

#include "event_source.hpp"

namespace evdevkit {

// EventSource over libevdev. The file descriptor stays owned by the
// caller and is never closed here.
class LibevdevSource : public EventSource {
public:
    // Throws InvalidFileError if libevdev cannot initialize from fd.
    explicit LibevdevSource(int fd);
    ~LibevdevSource() override;

    LibevdevSource(const LibevdevSource&) = delete;
    LibevdevSource& operator=(const LibevdevSource&) = delete;

    int fd() const override;
    bool is_blocking() const override;
    ReadStatus next_event(ReadFlag flag, struct input_event& ev) override;

    void change_fd(int fd) override;
    void set_clock_id(clockid_t clock) override;
    int grab(bool enable) override;

    void load_state(DeviceState& state) override;
    void kernel_set_abs_info(const EventCode& code, const struct input_absinfo& abs) override;

    void set_identity(const DeviceIdentity& identity) override;
    void enable(const EventBit& bit, const EnableData& data) override;
    void disable(const EventBit& bit) override;
    void enable_property(const InputProperty& prop) override;
    void disable_property(const InputProperty& prop) override;
    void set_abs_info(const EventCode& code, const struct input_absinfo& abs) override;
    void set_event_value(const EventCode& code, int value) override;
    void set_slot_value(unsigned int slot, const EventCode& code, int value) override;

    struct libevdev* get() const { return dev; }

private:
    struct libevdev* dev;

    ReadStatus translate(int rc) const;
};

} // namespace evdevkit

#endif // EVDEVKIT_LIBEVDEV_SOURCE_HPP
