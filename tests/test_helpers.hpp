#pragma once

/**
 * @file test_helpers.hpp
 * @brief Synchronization helpers shared by the tests
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace handoff::test {

/**
 * @brief Poll a predicate until it holds or the timeout expires
 */
template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/**
 * @brief One-way latch that keeps tasks parked until the test opens it
 */
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
};

} // namespace handoff::test
