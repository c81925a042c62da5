#pragma once

#include <iterator>
#include <optional>

#include "device_state.hpp"
#include "event_source.hpp"
#include "input_event.hpp"

namespace evdevkit {

enum class StreamState {
    Live,       // streaming normally
    Resyncing,  // SYN_DROPPED delivered, sync() not yet drained
    Detached    // no source, or the last non-blocking read came back empty
};

class EventStream;

// Pulls raw records from an EventSource, classifies them against the
// registry, filters codes that are disabled on the read path, folds them
// into the DeviceState and hands them out one at a time.
class Synchronizer {
public:
    explicit Synchronizer(DeviceState& state);

    void attach(EventSource* source);
    bool attached() const { return source != nullptr; }

    // Live events. Blocking mode of the source is checked once per call.
    EventStream events();
    // Catch-up events after SYN_DROPPED, or a full forced resync.
    EventStream sync(bool force);

    StreamState state() const { return stream_state; }

private:
    friend class EventStream;

    DeviceState& device_state;
    EventSource* source;
    StreamState stream_state;

    std::optional<InputEvent> classify(const struct input_event& raw);
    void finish(bool resync);
};

// Lazy, finite sequence of events. Each pull reads one record from the
// device. In a live stream, the pull following a delivered SYN_DROPPED
// throws EventsDroppedError.
class EventStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = InputEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const InputEvent*;
        using reference = const InputEvent&;

        iterator() : stream(nullptr) {}
        explicit iterator(EventStream* stream);

        reference operator*() const { return *current; }
        pointer operator->() const { return &*current; }
        iterator& operator++();

        bool operator==(const iterator& other) const { return !current && !other.current; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        EventStream* stream;
        std::optional<InputEvent> current;
    };

    // An empty stream
    EventStream();

    // Move-only: the drop signal belongs to exactly one stream. A
    // moved-from stream is empty.
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;
    EventStream(EventStream&& other) noexcept;
    EventStream& operator=(EventStream&& other) noexcept;

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    std::optional<InputEvent> next();

private:
    friend class Synchronizer;

    EventStream(Synchronizer* owner, ReadFlag first_flag, ReadFlag flag, bool live);

    Synchronizer* owner;
    ReadFlag first_flag;
    ReadFlag flag;
    bool live;
    bool started;
    bool drop_pending;
    bool finished;
};

} // namespace evdevkit
