#include "libevdev_source.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <linux/input-event-codes.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace evdevkit {

LibevdevSource::LibevdevSource(int fd) : dev(nullptr) {
    if (fd < 0) {
        throw InvalidFileError("invalid file descriptor");
    }

    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        dev = nullptr;
        throw InvalidFileError(std::string("Failed to init libevdev: ") + strerror(-rc));
    }
}

LibevdevSource::~LibevdevSource() {
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
}

int LibevdevSource::fd() const {
    return libevdev_get_fd(dev);
}

bool LibevdevSource::is_blocking() const {
    int flags = fcntl(fd(), F_GETFL);
    if (flags < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl(F_GETFL)");
    }
    return (flags & O_NONBLOCK) == 0;
}

ReadStatus LibevdevSource::translate(int rc) const {
    if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
        return ReadStatus::Success;
    }
    if (rc == LIBEVDEV_READ_STATUS_SYNC) {
        return ReadStatus::Sync;
    }
    if (rc == -EAGAIN) {
        return ReadStatus::Again;
    }
    throw std::system_error(-rc, std::generic_category(), "libevdev_next_event");
}

ReadStatus LibevdevSource::next_event(ReadFlag flag, struct input_event& ev) {
    switch (flag) {
        case ReadFlag::Normal:
            return translate(libevdev_next_event(dev, LIBEVDEV_READ_FLAG_NORMAL, &ev));
        case ReadFlag::Blocking:
            return translate(libevdev_next_event(dev, LIBEVDEV_READ_FLAG_NORMAL | LIBEVDEV_READ_FLAG_BLOCKING, &ev));
        case ReadFlag::Sync:
            return translate(libevdev_next_event(dev, LIBEVDEV_READ_FLAG_SYNC, &ev));
        case ReadFlag::ForceSync: {
            // The forced read only hands back the SYN_DROPPED marker that
            // starts the sync; the first real record follows in sync mode.
            ReadStatus status = translate(libevdev_next_event(dev, LIBEVDEV_READ_FLAG_FORCE_SYNC, &ev));
            if (status == ReadStatus::Again) {
                return status;
            }
            return translate(libevdev_next_event(dev, LIBEVDEV_READ_FLAG_SYNC, &ev));
        }
    }
    return ReadStatus::Again;
}

void LibevdevSource::change_fd(int fd) {
    if (fd < 0 || libevdev_change_fd(dev, fd) < 0) {
        throw InvalidFileError("Failed to change libevdev fd");
    }
}

void LibevdevSource::set_clock_id(clockid_t clock) {
    int rc = libevdev_set_clock_id(dev, clock);
    if (rc < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev_set_clock_id failed: %s\n", strerror(-rc));
    }
}

int LibevdevSource::grab(bool enable) {
    return libevdev_grab(dev, enable ? LIBEVDEV_GRAB : LIBEVDEV_UNGRAB);
}

void LibevdevSource::load_state(DeviceState& state) {
    const char* name = libevdev_get_name(dev);
    const char* phys = libevdev_get_phys(dev);
    const char* uniq = libevdev_get_uniq(dev);

    state.set_name(name ? name : "");
    state.set_phys(phys ? std::optional<std::string>(phys) : std::nullopt);
    state.set_uniq(uniq ? std::optional<std::string>(uniq) : std::nullopt);

    IdUpdate id;
    id.bustype = static_cast<uint16_t>(libevdev_get_id_bustype(dev));
    id.vendor = static_cast<uint16_t>(libevdev_get_id_vendor(dev));
    id.product = static_cast<uint16_t>(libevdev_get_id_product(dev));
    id.version = static_cast<uint16_t>(libevdev_get_id_version(dev));
    state.set_id(id);
    state.set_driver_version(libevdev_get_driver_version(dev));

    for (const auto& type : registry::event_types()) {
        if (!libevdev_has_event_type(dev, type.value)) continue;
        state.enable(type);

        for (const auto& code : type.codes()) {
            if (!libevdev_has_event_code(dev, code.type, code.value)) continue;

            if (code.type == EV_ABS) {
                const struct input_absinfo* abs = libevdev_get_abs_info(dev, code.value);
                if (!abs) continue;
                state.enable(code, AbsInfo::from_kernel(*abs));
            } else if (code.type == EV_REP) {
                state.enable(code, libevdev_get_event_value(dev, EV_REP, code.value));
            } else {
                state.enable(code);
                if (code.type == EV_KEY || code.type == EV_LED || code.type == EV_SW || code.type == EV_SND) {
                    state.set_event_value(code, libevdev_get_event_value(dev, code.type, code.value));
                }
            }
        }
    }

    for (const auto& prop : registry::properties()) {
        if (libevdev_has_property(dev, prop.value)) {
            state.enable_property(prop);
        }
    }

    auto num_slots = state.num_slots();
    int kernel_slots = libevdev_get_num_slots(dev);
    if (num_slots && kernel_slots > 0) {
        int count = std::min(*num_slots, kernel_slots);
        for (int slot = 0; slot < count; slot++) {
            for (int code = ABS_MT_SLOT + 1; code <= ABS_MAX; code++) {
                EventCode mt_code{EV_ABS, static_cast<uint16_t>(code)};
                if (!state.has_event(mt_code)) continue;
                state.set_slot_value(slot, mt_code, libevdev_get_slot_value(dev, slot, code));
            }
        }

        int current = libevdev_get_current_slot(dev);
        if (current >= 0 && current < count) {
            state.set_event_value(EventCode{EV_ABS, ABS_MT_SLOT}, current);
        }
    }
}

void LibevdevSource::kernel_set_abs_info(const EventCode& code, const struct input_absinfo& abs) {
    int rc = libevdev_kernel_set_abs_info(dev, code.value, &abs);
    if (rc < 0) {
        throw std::system_error(-rc, std::generic_category(), "libevdev_kernel_set_abs_info");
    }
}

void LibevdevSource::set_identity(const DeviceIdentity& identity) {
    libevdev_set_name(dev, identity.name.c_str());
    libevdev_set_phys(dev, identity.phys ? identity.phys->c_str() : nullptr);
    libevdev_set_uniq(dev, identity.uniq ? identity.uniq->c_str() : nullptr);
    libevdev_set_id_bustype(dev, identity.id.bustype);
    libevdev_set_id_vendor(dev, identity.id.vendor);
    libevdev_set_id_product(dev, identity.id.product);
    libevdev_set_id_version(dev, identity.id.version);
}

void LibevdevSource::enable(const EventBit& bit, const EnableData& data) {
    if (std::holds_alternative<EventType>(bit)) {
        if (libevdev_enable_event_type(dev, std::get<EventType>(bit).value) < 0) {
            EVDEVKIT_DEBUG_LOG("libevdev refused to enable %s\n", std::string(name_of(bit)).c_str());
        }
        return;
    }

    const EventCode& code = std::get<EventCode>(bit);
    int rc;
    if (std::holds_alternative<AbsInfo>(data)) {
        struct input_absinfo abs = std::get<AbsInfo>(data).to_kernel();
        rc = libevdev_enable_event_code(dev, code.type, code.value, &abs);
    } else if (std::holds_alternative<int>(data)) {
        int repeat = std::get<int>(data);
        rc = libevdev_enable_event_code(dev, code.type, code.value, &repeat);
    } else {
        rc = libevdev_enable_event_code(dev, code.type, code.value, nullptr);
    }
    if (rc < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused to enable %s\n", std::string(code.name()).c_str());
    }
}

void LibevdevSource::disable(const EventBit& bit) {
    int rc;
    if (std::holds_alternative<EventType>(bit)) {
        rc = libevdev_disable_event_type(dev, std::get<EventType>(bit).value);
    } else {
        const EventCode& code = std::get<EventCode>(bit);
        rc = libevdev_disable_event_code(dev, code.type, code.value);
    }
    if (rc < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused to disable %s\n", std::string(name_of(bit)).c_str());
    }
}

void LibevdevSource::enable_property(const InputProperty& prop) {
    if (libevdev_enable_property(dev, prop.value) < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused to enable property %d\n", prop.value);
    }
}

void LibevdevSource::disable_property(const InputProperty& prop) {
    if (libevdev_disable_property(dev, prop.value) < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused to disable property %d\n", prop.value);
    }
}

void LibevdevSource::set_abs_info(const EventCode& code, const struct input_absinfo& abs) {
    libevdev_set_abs_info(dev, code.value, &abs);
}

void LibevdevSource::set_event_value(const EventCode& code, int value) {
    if (libevdev_set_event_value(dev, code.type, code.value, value) < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused value %d for %s\n", value, std::string(code.name()).c_str());
    }
}

void LibevdevSource::set_slot_value(unsigned int slot, const EventCode& code, int value) {
    if (libevdev_set_slot_value(dev, slot, code.value, value) < 0) {
        EVDEVKIT_DEBUG_LOG("libevdev refused slot %u value %d for %s\n", slot, value, std::string(code.name()).c_str());
    }
}

} // namespace evdevkit
