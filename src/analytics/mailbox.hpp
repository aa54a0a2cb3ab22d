/**
 * @file mailbox.hpp
 * @brief Bounded multi-producer/single-consumer channel.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>

namespace search_analytics {

/**
 * @brief Fixed-capacity inbox for the aggregator thread.
 *
 * Producers never wait for room: try_send() refuses the message when the
 * mailbox is full, so a request thread only ever pays for one short lock.
 */
template <typename T>
class BoundedMailbox {
public:
    explicit BoundedMailbox(size_t capacity) : capacity_(capacity) {}

    BoundedMailbox(const BoundedMailbox&) = delete;
    BoundedMailbox& operator=(const BoundedMailbox&) = delete;

    /// Enqueue unless full; false means the message was dropped.
    bool try_send(T message);

    /**
     * @brief Wait for the next message until @p deadline or a stop request.
     *
     * @return nullopt on timeout or stop.
     */
    template <typename Clock, typename Dur>
    std::optional<T> receive_until(const std::chrono::time_point<Clock, Dur>& deadline,
                                   std::stop_token stop);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    const size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::atomic<uint64_t> dropped_{0};
};

// ── Template implementations ─────────────────

template <typename T>
bool BoundedMailbox<T>::try_send(T message) {
    {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push(std::move(message));
    }
    not_empty_.notify_one();
    return true;
}

template <typename T>
template <typename Clock, typename Dur>
std::optional<T> BoundedMailbox<T>::receive_until(
    const std::chrono::time_point<Clock, Dur>& deadline, std::stop_token stop) {
    std::unique_lock lock(mutex_);
    if (!not_empty_.wait_until(lock, stop, deadline, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    T message = std::move(queue_.front());
    queue_.pop();
    return message;
}

template <typename T>
size_t BoundedMailbox<T>::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

}  // namespace search_analytics
