#include "device_node.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <limits.h>
#include <cstdlib>
#include <iostream>

namespace evdevkit {

bool DeviceNode::open_and_init(bool grab_enabled) {
    close_and_free();

    char real_path[PATH_MAX];
    if (realpath(path.c_str(), real_path) == nullptr) {
        return false;
    }
    resolved_path = real_path;

    fd = open(resolved_path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        return false;
    }

    try {
        device = std::make_unique<Device>(fd);
    } catch (const InvalidFileError&) {
        close(fd);
        fd = -1;
        throw;
    }

    if (grab_enabled) {
        try {
            device->grab();
        } catch (const DeviceGrabError& e) {
            // Do not fail open
            std::cerr << resolved_path << ": " << e.what() << "\n";
        }
    }

    return true;
}

void DeviceNode::close_and_free() {
    if (device) {
        if (device->is_grabbed()) {
            device->ungrab();
        }
        device.reset();
    }
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
    resolved_path.clear();
}

} // namespace evdevkit
