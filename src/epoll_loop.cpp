#include "epoll_loop.hpp"
#include "errors.hpp"
#include "event_stream.hpp"
#include "log.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <system_error>
#include <algorithm>

namespace evdevkit {

EpollLoop::EpollLoop() : epoll_fd(-1), resync_on_drop(true) {
}

EpollLoop::~EpollLoop() {
    cleanup();
}

bool EpollLoop::initialize() {
    epoll_fd = epoll_create1(0);
    if (epoll_fd < 0) {
        perror("Failed to create epoll");
        return false;
    }
    return true;
}

void EpollLoop::cleanup() {
    if (epoll_fd >= 0) {
        close(epoll_fd);
        epoll_fd = -1;
    }
    active_devices.clear();
}

bool EpollLoop::add_device(DeviceNode* node) {
    if (!node || epoll_fd < 0 || !node->is_open()) {
        return false;
    }
    if (is_active(node)) {
        return true;
    }

    // The node itself rides along so readiness needs no fd lookup
    struct epoll_event interest = {};
    interest.events = EPOLLIN;
    interest.data.ptr = node;

    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, node->fd, &interest) < 0) {
        perror("Failed to watch device");
        return false;
    }
    active_devices.push_back(node);
    return true;
}

bool EpollLoop::remove_device(DeviceNode* node) {
    if (!is_active(node)) {
        return false;
    }
    if (node->fd >= 0 && epoll_ctl(epoll_fd, EPOLL_CTL_DEL, node->fd, nullptr) < 0) {
        EVDEVKIT_DEBUG_LOG("EPOLL_CTL_DEL failed for %s\n", node->resolved_path.c_str());
    }
    active_devices.erase(std::find(active_devices.begin(), active_devices.end(), node));
    return true;
}

bool EpollLoop::is_active(const DeviceNode* node) const {
    return node && std::find(active_devices.begin(), active_devices.end(), node) != active_devices.end();
}

int EpollLoop::run_once(int timeout_ms) {
    if (epoll_fd < 0) {
        return -1;
    }

    struct epoll_event ready[max_ready];
    int count = epoll_wait(epoll_fd, ready, max_ready, timeout_ms);
    if (count < 0) {
        if (errno == EINTR) return 0;
        perror("epoll_wait failed");
        return -1;
    }

    for (int i = 0; i < count; i++) {
        auto* node = static_cast<DeviceNode*>(ready[i].data.ptr);
        // An earlier entry in this batch may have dropped the node
        if (!is_active(node)) {
            continue;
        }

        if (ready[i].events & (EPOLLHUP | EPOLLERR)) {
            handle_disconnect(node);
        } else if (ready[i].events & EPOLLIN) {
            handle_device_event(node);
        }
    }
    return count;
}

// Hands every event of the stream to the event callback. Returns false
// once the node has been disconnected.
bool EpollLoop::deliver(DeviceNode* node, EventStream stream, const char* what) {
    try {
        for (const auto& ev : stream) {
            if (event_callback) event_callback(node, ev);
        }
    } catch (const std::system_error& e) {
        if (e.code().value() == ENODEV) {
            handle_disconnect(node);
            return false;
        }
        std::cerr << node->resolved_path << ": " << what << " failed: " << e.what() << "\n";
    }
    return true;
}

void EpollLoop::handle_device_event(DeviceNode* node) {
    if (!node->is_open()) {
        return;
    }

    try {
        if (!deliver(node, node->device->events(), "read")) {
            return;
        }
    } catch (const EventsDroppedError&) {
        if (drop_callback) drop_callback(node);
        if (resync_on_drop) {
            deliver(node, node->device->sync(), "sync");
        }
    }
}

void EpollLoop::handle_disconnect(DeviceNode* node) {
    std::cout << "Disconnect " << node->resolved_path << "\n";
    remove_device(node);
    node->close_and_free();

    if (disconnect_callback) {
        disconnect_callback(node);
    }
}

} // namespace evdevkit
