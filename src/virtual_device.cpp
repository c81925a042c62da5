#include "virtual_device.hpp"
#include "log.hpp"

#include <linux/input-event-codes.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace evdevkit {

VirtualDevice::VirtualDevice(int uinput_fd)
    : uinput_fd(uinput_fd), dev(nullptr), uidev(nullptr), ready(false) {
}

VirtualDevice::~VirtualDevice() {
    cleanup();
}

void VirtualDevice::initialize(const DeviceState& state) {
    if (ready) {
        return;
    }

    try {
        setup_device(state);
        enable_events(state);
        enable_properties(state);
        create_device();
    } catch (...) {
        cleanup();
        throw;
    }

    ready = true;
}

void VirtualDevice::cleanup() {
    if (uidev) {
        libevdev_uinput_destroy(uidev);
        uidev = nullptr;
    }
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
    ready = false;
}

void VirtualDevice::setup_device(const DeviceState& state) {
    dev = libevdev_new();
    if (!dev) {
        throw std::system_error(ENOMEM, std::generic_category(), "Failed to allocate libevdev device");
    }

    const DeviceIdentity& ident = state.identity();
    libevdev_set_name(dev, ident.name.c_str());
    if (ident.phys) libevdev_set_phys(dev, ident.phys->c_str());
    if (ident.uniq) libevdev_set_uniq(dev, ident.uniq->c_str());
    libevdev_set_id_bustype(dev, ident.id.bustype);
    libevdev_set_id_vendor(dev, ident.id.vendor);
    libevdev_set_id_product(dev, ident.id.product);
    libevdev_set_id_version(dev, ident.id.version);
}

void VirtualDevice::enable_events(const DeviceState& state) {
    for (const auto& [type, codes] : state.evbits()) {
        if (libevdev_enable_event_type(dev, type.value) < 0) {
            throw std::system_error(EINVAL, std::generic_category(),
                                    "Failed to enable event type " + std::string(type.name()));
        }

        for (const auto& code : codes) {
            int rc;
            if (code.type == EV_ABS) {
                struct input_absinfo abs = state.absinfo(code).value_or(AbsInfo()).to_kernel();
                rc = libevdev_enable_event_code(dev, code.type, code.value, &abs);
            } else if (code.type == EV_REP) {
                int repeat = state.event_value(code).value_or(0);
                rc = libevdev_enable_event_code(dev, code.type, code.value, &repeat);
            } else {
                rc = libevdev_enable_event_code(dev, code.type, code.value, nullptr);
            }

            if (rc < 0) {
                throw std::system_error(EINVAL, std::generic_category(),
                                        "Failed to enable event code " + std::string(code.name()));
            }
        }
    }
}

void VirtualDevice::enable_properties(const DeviceState& state) {
    for (const auto& prop : state.properties()) {
        if (libevdev_enable_property(dev, prop.value) < 0) {
            throw std::system_error(EINVAL, std::generic_category(),
                                    "Failed to enable property " + std::string(prop.name()));
        }
    }
}

void VirtualDevice::create_device() {
    int fd = uinput_fd >= 0 ? uinput_fd : LIBEVDEV_UINPUT_OPEN_MANAGED;
    int rc = libevdev_uinput_create_from_device(dev, fd, &uidev);
    if (rc < 0) {
        uidev = nullptr;
        throw std::system_error(-rc, std::generic_category(), "Failed to create uinput device");
    }

    EVDEVKIT_DEBUG_LOG("Created uinput device %s at %s\n",
                       libevdev_get_name(dev), devnode().c_str());
}

int VirtualDevice::get_fd() const {
    return uidev ? libevdev_uinput_get_fd(uidev) : -1;
}

std::string VirtualDevice::devnode() const {
    const char* node = uidev ? libevdev_uinput_get_devnode(uidev) : nullptr;
    return node ? node : "";
}

std::string VirtualDevice::syspath() const {
    const char* path = uidev ? libevdev_uinput_get_syspath(uidev) : nullptr;
    return path ? path : "";
}

void VirtualDevice::write_event(uint16_t type, uint16_t code, int32_t value) {
    if (!ready || !uidev) {
        throw std::system_error(EBADF, std::generic_category(), "uinput device not ready");
    }

    int rc = libevdev_uinput_write_event(uidev, type, code, value);
    if (rc < 0) {
        throw std::system_error(-rc, std::generic_category(), "Failed to write uinput event");
    }
}

std::unique_ptr<UinputDevice> LibevdevUinputFactory::create(const DeviceState& state, int uinput_fd) {
    auto device = std::make_unique<VirtualDevice>(uinput_fd);
    device->initialize(state);
    return device;
}

} // namespace evdevkit
