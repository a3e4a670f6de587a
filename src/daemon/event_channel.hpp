#pragma once

#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Multi-producer queue with non-blocking receive. The optional notify hook
// runs after every send (the daemon uses it to poke its eventfd).
template <typename T>
class EventChannel {
public:
    using NotifyCallback = std::function<void()>;

    EventChannel() = default;
    explicit EventChannel(NotifyCallback notify) : notify_(std::move(notify)) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void send(T value) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(value));
        }
        if (notify_) notify_();
    }

    std::optional<T> try_recv() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T v = std::move(queue_.front());
        queue_.pop_front();
        return v;
    }

    std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out(std::make_move_iterator(queue_.begin()),
                           std::make_move_iterator(queue_.end()));
        queue_.clear();
        return out;
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    NotifyCallback notify_;
};
