#include "iflow/client/event_channel.hpp"

namespace iflow {

bool EventChannel::push(Event event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<Event> EventChannel::receive() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return (queue_.empty() == false) || closed_; });
    return pop_locked();
}

std::optional<Event> EventChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return (queue_.empty() == false) || closed_; });
    return pop_locked();
}

std::optional<Event> EventChannel::try_receive() {
    std::lock_guard lock(mutex_);
    return pop_locked();
}

void EventChannel::close() noexcept {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::optional<Event> EventChannel::pop_locked() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

}  // namespace iflow
