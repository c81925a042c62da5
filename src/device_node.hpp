#ifndef EVDEVKIT_DEVICE_NODE_HPP
#define EVDEVKIT_DEVICE_NODE_HPP

#include <memory>
#include <string>

#include "device.hpp"

namespace evdevkit {

// One opened /dev/input/eventX node and the Device attached to it.
// The node owns the descriptor; the Device only borrows it.
struct DeviceNode {
    std::string path;
    std::string resolved_path;
    int fd;
    std::unique_ptr<Device> device;

    DeviceNode() : fd(-1) {}
    ~DeviceNode() { close_and_free(); }

    DeviceNode(const DeviceNode&) = delete;
    DeviceNode& operator=(const DeviceNode&) = delete;

    // Returns false and sets errno if the node cannot be opened. Throws
    // InvalidFileError if it is not an evdev node. A refused grab is
    // reported and the node stays open ungrabbed.
    bool open_and_init(bool grab_enabled);
    void close_and_free();

    bool is_open() const { return fd >= 0 && device != nullptr; }
};

} // namespace evdevkit

#endif // EVDEVKIT_DEVICE_NODE_HPP
