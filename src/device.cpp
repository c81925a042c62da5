#include "device.hpp"
#include "errors.hpp"
#include "libevdev_source.hpp"
#include "log.hpp"

#include <linux/input-event-codes.h>
#include <cstring>
#include <ctime>

namespace evdevkit {

Device::Device() : synchronizer(state), grabbed(false) {
}

Device::Device(int fd) : Device(std::make_unique<LibevdevSource>(fd)) {
}

Device::Device(std::unique_ptr<EventSource> source) : synchronizer(state), grabbed(false) {
    if (!source) {
        throw InvalidFileError("no event source");
    }
    attach(std::move(source));
}

Device::~Device() = default;

void Device::attach(std::unique_ptr<EventSource> new_source) {
    source = std::move(new_source);
    source->load_state(state);
    source->set_clock_id(CLOCK_MONOTONIC);
    synchronizer.attach(source.get());
}

void Device::set_name(const std::string& name) {
    state.set_name(name);
    if (source) source->set_identity(state.identity());
}

void Device::set_phys(const std::optional<std::string>& phys) {
    state.set_phys(phys);
    if (source) source->set_identity(state.identity());
}

void Device::set_uniq(const std::optional<std::string>& uniq) {
    state.set_uniq(uniq);
    if (source) source->set_identity(state.identity());
}

void Device::set_id(const IdUpdate& update) {
    state.set_id(update);
    if (source) source->set_identity(state.identity());
}

int Device::fd() const {
    return source ? source->fd() : -1;
}

void Device::set_fd(int fd) {
    if (!source) {
        throw InvalidFileError("device was created without a file descriptor");
    }

    source->change_fd(fd);
    source->set_clock_id(CLOCK_MONOTONIC);

    if (grabbed) {
        // Fails if the previous descriptor still holds the grab. That is
        // left to the caller, who must close the old descriptor first.
        int rc = source->grab(true);
        if (rc < 0) {
            EVDEVKIT_DEBUG_LOG("Re-grab after fd change failed: %s\n", strerror(-rc));
        }
    }
}

void Device::enable(const EventBit& bit, const EnableData& data) {
    state.enable(bit, data);
    if (source) source->enable(bit, data);
}

void Device::enable(const InputProperty& prop) {
    state.enable_property(prop);
    if (source) source->enable_property(prop);
}

void Device::disable(const EventBit& bit) {
    state.disable(bit);
    if (source) source->disable(bit);
}

void Device::disable(const InputProperty& prop) {
    state.disable_property(prop);
    if (source) source->disable_property(prop);
}

std::optional<AbsInfo> Device::absinfo(const EventCode& code,
                                       const std::optional<AbsInfo>& new_values,
                                       bool kernel) {
    if (kernel && !new_values) {
        throw InvalidArgumentError("kernel absinfo commit requires new values");
    }
    if (!new_values) {
        return state.absinfo(code);
    }
    if (kernel && !source) {
        throw InvalidFileError("kernel absinfo commit requires a file descriptor");
    }

    auto current = state.absinfo(code);
    if (!current) {
        return std::nullopt;
    }
    AbsInfo merged = *current;
    merged.merge(*new_values);

    if (source) {
        if (kernel) {
            source->kernel_set_abs_info(code, merged.to_kernel());
        }
        source->set_abs_info(code, merged.to_kernel());
    }
    return state.set_absinfo(code, *new_values);
}

std::optional<int> Device::event_value(const EventBit& bit, std::optional<int> new_value) {
    if (!new_value) {
        return state.event_value(bit);
    }

    auto result = state.set_event_value(bit, *new_value);
    if (result && source) {
        source->set_event_value(std::get<EventCode>(bit), *new_value);
    }
    return result;
}

std::optional<int> Device::slot_value(unsigned int slot, const EventCode& code,
                                      std::optional<int> new_value) {
    if (!new_value) {
        return state.slot_value(slot, code);
    }

    auto result = state.set_slot_value(slot, code, *new_value);
    if (result && source) {
        source->set_slot_value(slot, code, *new_value);
    }
    return result;
}

EventStream Device::events() {
    return synchronizer.events();
}

EventStream Device::sync(bool force) {
    return synchronizer.sync(force);
}

std::unique_ptr<Device> Device::create_uinput_device(int uinput_fd) {
    auto device = std::make_unique<Device>();
    device->set_name(name());
    device->set_phys(phys());
    device->set_uniq(uniq());

    IdUpdate update;
    update.bustype = id().bustype;
    update.vendor = id().vendor;
    update.product = id().product;
    update.version = id().version;
    device->set_id(update);

    for (const auto& [type, codes] : evbits()) {
        device->enable(type);
        for (const auto& code : codes) {
            if (type.value == EV_ABS) {
                device->enable(code, absinfo(code).value_or(AbsInfo()));
            } else if (type.value == EV_REP) {
                device->enable(code, event_value(code).value_or(0));
            } else {
                device->enable(code);
            }
        }
    }

    for (const auto& prop : properties()) {
        device->enable(prop);
    }

    std::shared_ptr<UinputFactory> factory = uinput_factory;
    if (!factory) {
        factory = std::make_shared<LibevdevUinputFactory>();
    }
    device->uinput_factory = factory;
    device->uinput = factory->create(device->state, uinput_fd);
    return device;
}

void Device::set_uinput_factory(std::shared_ptr<UinputFactory> factory) {
    uinput_factory = std::move(factory);
}

std::optional<std::string> Device::devnode() const {
    if (!uinput) {
        return std::nullopt;
    }
    std::string node = uinput->devnode();
    if (node.empty()) {
        return std::nullopt;
    }
    return node;
}

std::optional<std::string> Device::syspath() const {
    if (!uinput) {
        return std::nullopt;
    }
    std::string path = uinput->syspath();
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
}

void Device::send_events(const std::vector<InputEvent>& events) {
    if (!uinput) {
        throw InvalidFileError("not a uinput device");
    }

    for (const auto& ev : events) {
        if (!ev.code.is_valid()) {
            throw InvalidArgumentError("event without a valid code");
        }
        if (!ev.value) {
            throw InvalidArgumentError("event " + std::string(ev.code.name()) + " has no value");
        }
    }

    for (const auto& ev : events) {
        uinput->write_event(ev.code.type, ev.code.value, *ev.value);
    }
}

void Device::grab() {
    if (!source) {
        grabbed = false;
        throw DeviceGrabError("device has no file descriptor");
    }

    int rc = source->grab(true);
    if (rc < 0) {
        grabbed = false;
        throw DeviceGrabError(std::string("Failed to grab device: ") + strerror(-rc));
    }
    grabbed = true;
}

void Device::ungrab() {
    if (source) {
        int rc = source->grab(false);
        if (rc < 0) {
            EVDEVKIT_DEBUG_LOG("Ungrab failed: %s\n", strerror(-rc));
        }
    }
    grabbed = false;
}

} // namespace evdevkit
