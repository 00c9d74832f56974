#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "core/Constants.hpp"

namespace gitpulse {

/**
 * @brief Bounded FIFO message channel between the caller and the stats worker
 *
 * Messages are delivered in push order. push() blocks while @p capacity
 * messages are queued. Once closed, push() drops its message and returns
 * false (waking a blocked pusher), and pops drain what is left before
 * returning nullopt. Closing is how an abandoned run's messages are
 * discarded.
 */
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = Constants::CHANNEL_CAPACITY) : limit(std::max<size_t>(capacity, 1)) {}

    bool push(T message) {
        {
            std::unique_lock<std::mutex> lock(mtx);
            notFull.wait(lock, [this] { return closed || queue.size() < limit; });
            if (closed) return false;
            queue.push_back(std::move(message));
        }
        cv.notify_one();
        return true;
    }

    size_t capacity() const { return limit; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return queue.size();
    }

    /// Block until a message arrives or the channel is closed and empty
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return closed || !queue.empty(); });
        return takeLocked();
    }

    /// Like pop(), but gives up at @p deadline
    std::optional<T> popUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait_until(lock, deadline, [this] { return closed || !queue.empty(); });
        return takeLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            closed = true;
        }
        cv.notify_all();
        notFull.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mtx);
        return closed;
    }

private:
    std::optional<T> takeLocked() {
        if (queue.empty()) return std::nullopt;
        T message = std::move(queue.front());
        queue.pop_front();
        notFull.notify_one();
        return message;
    }

    const size_t limit;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable notFull;
    std::deque<T> queue;
    bool closed{false};
};

}
