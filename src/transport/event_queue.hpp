/**
 * @file event_queue.hpp
 * @brief Multi-producer, single-consumer queue drained without blocking.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace server_browser {

/**
 * @brief Event stream handed out by a daemon for browse/monitor sessions.
 *
 * Producers are the daemon's background threads; the consumer is the host
 * cycle. The consumer never waits: try_pop() and drain() return immediately
 * with whatever is queued. A consumer abandons the stream by dropping its
 * shared_ptr; producers notice via close() or an expired weak_ptr and stop
 * pushing.
 */
template <typename T>
class EventQueue {
public:
    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Returns false when the queue was closed and the event dropped.
    bool push(T event) {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        events_.push_back(std::move(event));
        return true;
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (events_.empty()) return std::nullopt;
        T event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    /// Take every queued event in enqueue order.
    [[nodiscard]] std::vector<T> drain() {
        std::deque<T> taken;
        {
            std::lock_guard lock(mutex_);
            taken.swap(events_);
        }
        return std::vector<T>(std::make_move_iterator(taken.begin()),
                              std::make_move_iterator(taken.end()));
    }

    /// Stop accepting events. Already queued events can still be drained.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return events_.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::deque<T> events_;
    bool closed_ = false;
};

}  // namespace server_browser
