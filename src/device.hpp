#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device_state.hpp"
#include "event_codes.hpp"
#include "event_source.hpp"
#include "event_stream.hpp"
#include "input_event.hpp"
#include "virtual_device.hpp"

namespace evdevkit {

// An evdev device, either backed by an event node or built by hand.
//
//     int fd = open("/dev/input/event0", O_RDONLY | O_NONBLOCK);
//     evdevkit::Device dev(fd);
//     for (const auto& ev : dev.events()) { ... }
//
//     evdevkit::Device manual;
//     manual.set_name("test device");
//     manual.enable(evdevkit::EventCode{EV_REL, REL_X});
//
// A manual device never has a file descriptor. Descriptors passed in
// remain owned by the caller. The device clock is CLOCK_MONOTONIC.
class Device {
public:
    Device();
    // Throws InvalidFileError if fd is not an evdev node.
    explicit Device(int fd);
    explicit Device(std::unique_ptr<EventSource> source);
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    // Identity
    const std::string& name() const { return state.identity().name; }
    void set_name(const std::string& name);
    const std::optional<std::string>& phys() const { return state.identity().phys; }
    void set_phys(const std::optional<std::string>& phys);
    const std::optional<std::string>& uniq() const { return state.identity().uniq; }
    void set_uniq(const std::optional<std::string>& uniq);
    const DeviceId& id() const { return state.identity().id; }
    void set_id(const IdUpdate& update);
    int driver_version() const { return state.identity().driver_version; }

    // -1 for manual and uinput devices.
    int fd() const;
    // Rebinds to a new descriptor for the same device. Throws
    // InvalidFileError on a manual device. A held grab is re-issued; if
    // the previous descriptor is still open that re-grab fails silently.
    void set_fd(int fd);

    // Capabilities
    std::map<EventType, std::vector<EventCode>> evbits() const { return state.evbits(); }
    std::vector<InputProperty> properties() const { return state.properties(); }
    bool has_event(const EventBit& bit) const { return state.has_event(bit); }
    bool has_property(const InputProperty& prop) const { return state.has_property(prop); }

    // EV_ABS codes need AbsInfo data (unset fields become 0), EV_REP codes
    // an int. Enabling a code enables its type.
    void enable(const EventBit& bit, const EnableData& data = {});
    void enable(const InputProperty& prop);
    // Events of a disabled type or code are discarded from then on.
    void disable(const EventBit& bit);
    void disable(const InputProperty& prop);

    std::optional<int> num_slots() const { return state.num_slots(); }
    std::optional<int> current_slot() const { return state.current_slot(); }

    // Reads the axis calibration or, with new_values, merges the set
    // fields into it. kernel = true also writes the result to the kernel
    // device, which persists beyond this process; it requires new_values.
    std::optional<AbsInfo> absinfo(const EventCode& code,
                                   const std::optional<AbsInfo>& new_values = std::nullopt,
                                   bool kernel = false);

    std::optional<int> event_value(const EventBit& bit,
                                   std::optional<int> new_value = std::nullopt);
    std::optional<int> slot_value(unsigned int slot, const EventCode& code,
                                  std::optional<int> new_value = std::nullopt);

    // Pending events. On a blocking descriptor this waits for at least
    // one event; on a non-blocking one it ends when nothing is pending.
    EventStream events();
    // Events that bring the caller's view back in line with the device
    // after SYN_DROPPED. force is needed after set_fd().
    EventStream sync(bool force = false);
    StreamState stream_state() const { return synchronizer.state(); }

    // uinput
    std::unique_ptr<Device> create_uinput_device(int uinput_fd = -1);
    void set_uinput_factory(std::shared_ptr<UinputFactory> factory);
    std::optional<std::string> devnode() const;
    std::optional<std::string> syspath() const;
    // Only valid on a device returned by create_uinput_device(). The
    // batch should end with EV_SYN/SYN_REPORT; none is added here.
    void send_events(const std::vector<InputEvent>& events);

    void grab();
    void ungrab();
    bool is_grabbed() const { return grabbed; }

    const DeviceState& device_state() const { return state; }

private:
    DeviceState state;
    std::unique_ptr<EventSource> source;
    Synchronizer synchronizer;
    std::shared_ptr<UinputFactory> uinput_factory;
    std::unique_ptr<UinputDevice> uinput;
    bool grabbed;

    void attach(std::unique_ptr<EventSource> new_source);
};

} // namespace evdevkit
