#ifndef EVDEVKIT_VIRTUAL_DEVICE_HPP
#define EVDEVKIT_VIRTUAL_DEVICE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <libevdev-1.0/libevdev/libevdev.h>
#include <libevdev-1.0/libevdev/libevdev-uinput.h>

#include "device_state.hpp"

namespace evdevkit {

// A kernel-visible device created through uinput.
class UinputDevice {
public:
    virtual ~UinputDevice() = default;

    virtual int get_fd() const = 0;
    virtual std::string devnode() const = 0;
    virtual std::string syspath() const = 0;

    // Throws std::system_error if the write fails.
    virtual void write_event(uint16_t type, uint16_t code, int32_t value) = 0;
};

class UinputFactory {
public:
    virtual ~UinputFactory() = default;

    // uinput_fd < 0 lets the implementation open /dev/uinput itself.
    // Throws std::system_error if the kernel refuses the device.
    virtual std::unique_ptr<UinputDevice> create(const DeviceState& state, int uinput_fd) = 0;
};

// uinput device built with libevdev from a DeviceState snapshot.
class VirtualDevice : public UinputDevice {
public:
    explicit VirtualDevice(int uinput_fd = -1);
    ~VirtualDevice() override;

    VirtualDevice(const VirtualDevice&) = delete;
    VirtualDevice& operator=(const VirtualDevice&) = delete;

    // Throws std::system_error if the device cannot be created.
    void initialize(const DeviceState& state);
    void cleanup();

    int get_fd() const override;
    bool is_ready() const { return ready; }
    std::string devnode() const override;
    std::string syspath() const override;

    void write_event(uint16_t type, uint16_t code, int32_t value) override;

private:
    int uinput_fd;
    struct libevdev* dev;
    struct libevdev_uinput* uidev;
    bool ready;

    void setup_device(const DeviceState& state);
    void enable_events(const DeviceState& state);
    void enable_properties(const DeviceState& state);
    void create_device();
};

class LibevdevUinputFactory : public UinputFactory {
public:
    std::unique_ptr<UinputDevice> create(const DeviceState& state, int uinput_fd) override;
};

} // namespace evdevkit

#endif // EVDEVKIT_VIRTUAL_DEVICE_HPP
