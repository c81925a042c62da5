#include "event_stream.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <linux/input-event-codes.h>

namespace evdevkit {

Synchronizer::Synchronizer(DeviceState& state)
    : device_state(state), source(nullptr), stream_state(StreamState::Detached) {
}

void Synchronizer::attach(EventSource* new_source) {
    source = new_source;
    stream_state = source ? StreamState::Live : StreamState::Detached;
}

EventStream Synchronizer::events() {
    if (!source) {
        stream_state = StreamState::Detached;
        return EventStream();
    }

    ReadFlag flag = source->is_blocking() ? ReadFlag::Blocking : ReadFlag::Normal;
    if (stream_state != StreamState::Resyncing) {
        stream_state = StreamState::Live;
    }
    return EventStream(this, flag, flag, true);
}

EventStream Synchronizer::sync(bool force) {
    if (!source) {
        stream_state = StreamState::Detached;
        return EventStream();
    }

    stream_state = StreamState::Resyncing;
    return EventStream(this, force ? ReadFlag::ForceSync : ReadFlag::Sync, ReadFlag::Sync, false);
}

std::optional<InputEvent> Synchronizer::classify(const struct input_event& raw) {
    auto code = registry::evbit(raw.type, raw.code);
    if (!code) {
        EVDEVKIT_DEBUG_LOG("Skipping unknown event type %d code %d\n", raw.type, raw.code);
        return std::nullopt;
    }

    // Disabled types and codes never reach the caller
    if (code->type != EV_SYN && !device_state.has_event(*code)) {
        return std::nullopt;
    }

    InputEvent ev;
    ev.code = *code;
    ev.value = raw.value;
    ev.sec = raw.input_event_sec;
    ev.usec = raw.input_event_usec;

    device_state.apply(ev);
    return ev;
}

void Synchronizer::finish(bool resync) {
    if (resync) {
        stream_state = StreamState::Live;
    } else if (stream_state != StreamState::Resyncing) {
        stream_state = StreamState::Detached;
    }
}

EventStream::EventStream()
    : owner(nullptr), first_flag(ReadFlag::Normal), flag(ReadFlag::Normal),
      live(false), started(false), drop_pending(false), finished(true) {
}

EventStream::EventStream(Synchronizer* owner, ReadFlag first_flag, ReadFlag flag, bool live)
    : owner(owner), first_flag(first_flag), flag(flag),
      live(live), started(false), drop_pending(false), finished(false) {
}

EventStream::EventStream(EventStream&& other) noexcept
    : owner(other.owner), first_flag(other.first_flag), flag(other.flag),
      live(other.live), started(other.started), drop_pending(other.drop_pending),
      finished(other.finished) {
    other.owner = nullptr;
    other.drop_pending = false;
    other.finished = true;
}

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        owner = other.owner;
        first_flag = other.first_flag;
        flag = other.flag;
        live = other.live;
        started = other.started;
        drop_pending = other.drop_pending;
        finished = other.finished;

        other.owner = nullptr;
        other.drop_pending = false;
        other.finished = true;
    }
    return *this;
}

std::optional<InputEvent> EventStream::next() {
    if (!owner || finished) {
        return std::nullopt;
    }

    if (drop_pending) {
        drop_pending = false;
        finished = true;
        throw EventsDroppedError();
    }

    while (true) {
        ReadFlag current = started ? flag : first_flag;
        started = true;

        struct input_event raw;
        if (owner->source->next_event(current, raw) == ReadStatus::Again) {
            finished = true;
            owner->finish(!live);
            return std::nullopt;
        }

        auto ev = owner->classify(raw);
        if (!ev) {
            continue;
        }

        if (live && ev->code == EventCode{EV_SYN, SYN_DROPPED}) {
            EVDEVKIT_DEBUG_LOG("SYN_DROPPED at %lld.%06lld\n",
                               static_cast<long long>(ev->sec), static_cast<long long>(ev->usec));
            drop_pending = true;
            owner->stream_state = StreamState::Resyncing;
        }
        return ev;
    }
}

EventStream::iterator::iterator(EventStream* stream) : stream(stream), current(stream->next()) {
}

EventStream::iterator& EventStream::iterator::operator++() {
    current = stream->next();
    return *this;
}

} // namespace evdevkit
