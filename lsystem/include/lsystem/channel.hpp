#ifndef LSYSTEM_CHANNEL_HPP
#define LSYSTEM_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace lsystem {

/**
 * Unbounded multi-producer, multi-consumer FIFO queue with blocking receive.
 *
 * After close(), send() is refused but values already queued can still be
 * received; receive() returns an empty optional once the channel is closed
 * and drained.
 */
template<typename T>
class Channel {
private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;

    std::optional<T> pop_front_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        return value;
    }

public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel was closed
    bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until a value is available or the channel is closed and empty
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_front_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return pop_front_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_front_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};

} // namespace lsystem

#endif // LSYSTEM_CHANNEL_HPP
