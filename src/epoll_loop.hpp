#ifndef EVDEVKIT_EPOLL_LOOP_HPP
#define EVDEVKIT_EPOLL_LOOP_HPP

#include <vector>
#include <functional>
#include <sys/epoll.h>

#include "device_node.hpp"
#include "event_stream.hpp"
#include "input_event.hpp"

namespace evdevkit {

// Waits for readiness on any number of device nodes and drains the ready
// ones through Device::events().
class EpollLoop {
public:
    using EventCallback = std::function<void(DeviceNode*, const InputEvent&)>;
    using DropCallback = std::function<void(DeviceNode*)>;
    using DisconnectCallback = std::function<void(DeviceNode*)>;

    EpollLoop();
    ~EpollLoop();

    EpollLoop(const EpollLoop&) = delete;
    EpollLoop& operator=(const EpollLoop&) = delete;

    bool initialize();
    void cleanup();

    bool add_device(DeviceNode* node);
    bool remove_device(DeviceNode* node);

    // Returns the number of ready descriptors, 0 on timeout or signal,
    // -1 on error.
    int run_once(int timeout_ms = 250);

    void set_event_callback(EventCallback callback) { event_callback = callback; }
    void set_drop_callback(DropCallback callback) { drop_callback = callback; }
    void set_disconnect_callback(DisconnectCallback callback) { disconnect_callback = callback; }

    // With resync on, sync events are delivered through the event
    // callback right after the drop callback. Otherwise the caller is left
    // with the gap.
    void set_resync_on_drop(bool enabled) { resync_on_drop = enabled; }

    bool is_running() const { return epoll_fd >= 0; }
    size_t device_count() const { return active_devices.size(); }

private:
    int epoll_fd;
    bool resync_on_drop;
    std::vector<DeviceNode*> active_devices;
    EventCallback event_callback;
    DropCallback drop_callback;
    DisconnectCallback disconnect_callback;

    static constexpr int max_ready = 8;

    bool is_active(const DeviceNode* node) const;
    bool deliver(DeviceNode* node, EventStream stream, const char* what);
    void handle_device_event(DeviceNode* node);
    void handle_disconnect(DeviceNode* node);
};

} // namespace evdevkit

#endif // EVDEVKIT_EPOLL_LOOP_HPP
