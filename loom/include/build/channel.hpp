//! # Completion Channel
//!
//! Unbounded multi-producer, single-consumer queue carrying pipeline results
//! from worker threads back to the coordinator. The receiver blocks on a
//! condition variable instead of polling.
//!
//! After `close()`, sends are rejected and receivers drain what is left,
//! then get `std::nullopt`.

#ifndef LOOM_BUILD_CHANNEL_HPP
#define LOOM_BUILD_CHANNEL_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace loom::build {

template <typename T> class Channel {
public:
    /// Returns false if the channel is closed; `value` is dropped.
    auto send(T value) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            queue_.push(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Blocks until a value arrives or the channel is closed and empty.
    auto recv() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;

    auto pop_locked() -> std::optional<T> {
        if (queue_.empty())
            return std::nullopt;
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop();
        return value;
    }
};

} // namespace loom::build

#endif // LOOM_BUILD_CHANNEL_HPP
