#pragma once

#include "iflow/protocol/events.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace iflow {

// ═══════════════════════════════════════════════════════════════════════════
// EventChannel
// ═══════════════════════════════════════════════════════════════════════════
// Unbounded, ordered, multi-producer / single-consumer queue of Domain Events.
// Producers never block; closing the channel signals end-of-session to the
// consumer once the queued events are drained.

class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;
    EventChannel(EventChannel&&) = delete;
    EventChannel& operator=(EventChannel&&) = delete;

    /// Enqueue an event. Returns false (and drops it) once the channel is closed.
    bool push(Event event);

    /// Block until an event is available. nullopt: closed and drained.
    [[nodiscard]] std::optional<Event> receive();

    /// nullopt on timeout, or when closed and drained (see is_closed()).
    [[nodiscard]] std::optional<Event> receive_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<Event> try_receive();

    void close() noexcept;

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] std::optional<Event> pop_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_{false};
};

}  // namespace iflow
