#pragma once

/**
 * @file channel.hpp
 * @brief Unbuffered (rendezvous) channel with backpressure
 */

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace handoff {

/**
 * @brief Channel statistics for monitoring
 */
struct ChannelStats {
    std::uint64_t send_count{0};
    std::uint64_t receive_count{0};
    std::uint64_t send_blocked_count{0};
    std::uint64_t receive_blocked_count{0};
    std::uint64_t rejected_count{0};
    std::size_t waiting_receivers{0};
    bool closed{false};
};

/**
 * @brief Unbuffered MPMC channel
 *
 * A send completes only once a receiver has taken the value, so a
 * successful send is proof that the value was handed over. The
 * single slot is a handoff point, not storage: a value sitting in
 * the slot keeps its sender blocked until some receiver takes it.
 *
 * Closing the channel rejects senders that have not deposited yet.
 * A value already deposited is still delivered to a receiver;
 * receive() reports closure only when no value is pending.
 *
 * @tparam T Move-constructible value type
 */
template<typename T>
class RendezvousChannel {
public:
    RendezvousChannel() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    RendezvousChannel(const RendezvousChannel&) = delete;
    RendezvousChannel& operator=(const RendezvousChannel&) = delete;
    RendezvousChannel(RendezvousChannel&&) = delete;
    RendezvousChannel& operator=(RendezvousChannel&&) = delete;

    /**
     * @brief Hand a value to a receiver, blocking until it is taken
     * @param value Value to send
     * @return true once a receiver took the value, false if the channel was closed first
     */
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.send_count++;

        if (full_ || waiting_receivers_ == 0) {
            stats_.send_blocked_count++;
        }

        // Wait for the slot or closure
        while (full_ && !closed_) {
            slot_free_.wait(lock);
        }

        if (closed_) {
            stats_.rejected_count++;
            return false;
        }

        const std::uint64_t ticket = deposit(std::move(value));
        not_empty_.notify_one();

        // Closure does not cancel a deposited value; a receiver drains it
        while (taken_ < ticket) {
            picked_up_.wait(lock);
        }

        return true;
    }

    /**
     * @brief Hand a value over only if a receiver is already waiting
     * @param value Value to send
     * @return true if taken, false if no receiver was idle or the channel is closed
     */
    bool try_send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (closed_ || full_ || waiting_receivers_ == 0) {
            if (closed_) {
                stats_.rejected_count++;
            }
            return false;
        }

        stats_.send_count++;
        const std::uint64_t ticket = deposit(std::move(value));
        not_empty_.notify_one();

        while (taken_ < ticket) {
            picked_up_.wait(lock);
        }

        return true;
    }

    /**
     * @brief Take the next value, blocking until one is sent
     * @return Value if available, nullopt if the channel is closed and empty
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!full_ && !closed_) {
            stats_.receive_blocked_count++;
        }

        waiting_receivers_++;
        while (!full_ && !closed_) {
            not_empty_.wait(lock);
        }
        waiting_receivers_--;

        if (!full_) {
            return std::nullopt;
        }

        T value = std::move(*slot_);
        slot_.reset();
        full_ = false;
        taken_++;
        stats_.receive_count++;

        lock.unlock();
        picked_up_.notify_all();
        slot_free_.notify_one();

        return value;
    }

    /**
     * @brief Close the channel (no more sends accepted)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        slot_free_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Number of receivers currently blocked waiting for a value
     */
    [[nodiscard]] std::size_t waiting_receivers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_receivers_;
    }

    [[nodiscard]] ChannelStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.waiting_receivers = waiting_receivers_;
        s.closed = closed_;
        return s;
    }

private:
    // Caller holds mutex_ and has checked that the slot is free
    std::uint64_t deposit(T value) {
        slot_.emplace(std::move(value));
        full_ = true;
        return ++deposited_;
    }

    mutable std::mutex mutex_;
    std::condition_variable slot_free_;
    std::condition_variable not_empty_;
    std::condition_variable picked_up_;

    std::optional<T> slot_;
    bool full_{false};
    bool closed_{false};
    std::uint64_t deposited_{0};
    std::uint64_t taken_{0};
    std::size_t waiting_receivers_{0};

    ChannelStats stats_;
};

} // namespace handoff
