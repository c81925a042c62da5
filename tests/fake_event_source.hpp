#pragma once

#include <deque>
#include <vector>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <linux/input.h>

#include "event_source.hpp"

// Scripted EventSource. Records queued in live_records are handed out
// for Normal/Blocking reads, sync_records for Sync/ForceSync reads.
// Everything the device asks of it is recorded for inspection. A nonzero
// read_errno is thrown as std::system_error once the queue runs dry.
class FakeEventSource : public evdevkit::EventSource {
public:
    explicit FakeEventSource(const evdevkit::DeviceState& initial = evdevkit::DeviceState(), int fd = 3)
        : initial(initial), current_fd(fd) {}

    static struct input_event record(uint16_t type, uint16_t code, int32_t value,
                                     long sec = 0, long usec = 0) {
        struct input_event ev;
        memset(&ev, 0, sizeof(ev));
        ev.input_event_sec = sec;
        ev.input_event_usec = usec;
        ev.type = type;
        ev.code = code;
        ev.value = value;
        return ev;
    }

    std::deque<struct input_event> live_records;
    std::deque<struct input_event> sync_records;
    std::vector<evdevkit::ReadFlag> flags;
    std::vector<int> fd_changes;
    std::vector<clockid_t> clocks;
    std::vector<bool> grab_calls;
    std::vector<std::pair<evdevkit::EventCode, struct input_absinfo>> kernel_abs;
    std::vector<std::pair<evdevkit::EventCode, struct input_absinfo>> local_abs;
    std::vector<std::pair<evdevkit::EventCode, int>> value_writes;
    bool blocking = false;
    int grab_result = 0;
    int load_count = 0;
    int read_errno = 0;

    int fd() const override { return current_fd; }
    bool is_blocking() const override { return blocking; }

    evdevkit::ReadStatus next_event(evdevkit::ReadFlag flag, struct input_event& ev) override {
        flags.push_back(flag);
        bool sync = (flag == evdevkit::ReadFlag::Sync || flag == evdevkit::ReadFlag::ForceSync);
        std::deque<struct input_event>& queue = sync ? sync_records : live_records;
        if (queue.empty()) {
            if (read_errno != 0) {
                throw std::system_error(read_errno, std::generic_category(), "read");
            }
            return evdevkit::ReadStatus::Again;
        }
        ev = queue.front();
        queue.pop_front();
        return sync ? evdevkit::ReadStatus::Sync : evdevkit::ReadStatus::Success;
    }

    void change_fd(int fd) override {
        current_fd = fd;
        fd_changes.push_back(fd);
    }
    void set_clock_id(clockid_t clock) override { clocks.push_back(clock); }

    int grab(bool enable) override {
        grab_calls.push_back(enable);
        return enable ? grab_result : 0;
    }

    void load_state(evdevkit::DeviceState& state) override {
        load_count++;
        state = initial;
    }

    void kernel_set_abs_info(const evdevkit::EventCode& code, const struct input_absinfo& abs) override {
        kernel_abs.emplace_back(code, abs);
    }

    void set_identity(const evdevkit::DeviceIdentity&) override {}
    void enable(const evdevkit::EventBit&, const evdevkit::EnableData&) override {}
    void disable(const evdevkit::EventBit&) override {}
    void enable_property(const evdevkit::InputProperty&) override {}
    void disable_property(const evdevkit::InputProperty&) override {}

    void set_abs_info(const evdevkit::EventCode& code, const struct input_absinfo& abs) override {
        local_abs.emplace_back(code, abs);
    }
    void set_event_value(const evdevkit::EventCode& code, int value) override {
        value_writes.emplace_back(code, value);
    }
    void set_slot_value(unsigned int, const evdevkit::EventCode&, int) override {}

private:
    evdevkit::DeviceState initial;
    int current_fd;
};
