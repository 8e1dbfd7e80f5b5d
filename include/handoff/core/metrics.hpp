#pragma once

/**
 * @file metrics.hpp
 * @brief Pool metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace handoff {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down), remembers its peak
 */
class Gauge {
public:
    void increment(std::int64_t delta = 1) noexcept {
        auto now = value_.fetch_add(delta, std::memory_order_acq_rel) + delta;
        raise_peak(now);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_acq_rel);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

    /**
     * @brief Highest value observed since construction
     */
    [[nodiscard]] std::int64_t peak() const noexcept {
        return peak_.load(std::memory_order_acquire);
    }

private:
    void raise_peak(std::int64_t candidate) noexcept {
        auto current = peak_.load(std::memory_order_relaxed);
        while (candidate > current &&
               !peak_.compare_exchange_weak(current, candidate, std::memory_order_acq_rel)) {
        }
    }

    std::atomic<std::int64_t> value_{0};
    std::atomic<std::int64_t> peak_{0};
};

/**
 * @brief Histogram for latency measurements (seconds)
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (value > max_) {
            max_ = value;
        }

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] double sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    [[nodiscard]] double max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    /**
     * @brief Per-bucket counts, the last entry being the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    /**
     * @brief Upper bounds of the finite buckets
     */
    [[nodiscard]] const std::vector<double>& bounds() const noexcept { return buckets_; }

    static std::vector<double> default_buckets() {
        return {0.0001, 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    double max_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Pool metrics snapshot
 */
struct PoolMetricsSnapshot {
    std::uint64_t tasks_submitted{0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t submissions_rejected{0};
    std::int64_t tasks_in_flight{0};
    std::int64_t peak_in_flight{0};
    double avg_execution_ms{0.0};
    double avg_handoff_wait_ms{0.0};
    double max_handoff_wait_ms{0.0};
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Metrics collector for a worker pool
 *
 * All recording methods are safe to call concurrently from callers
 * and workers.
 */
class PoolMetrics {
public:
    PoolMetrics() : start_time_(std::chrono::steady_clock::now()) {}

    // Counters
    Counter& tasks_submitted() { return submitted_; }
    Counter& tasks_completed() { return completed_; }
    Counter& tasks_failed() { return failed_; }
    Counter& submissions_rejected() { return rejected_; }

    // Executing right now; peak() is the concurrency high-water mark
    Gauge& tasks_in_flight() { return in_flight_; }

    // Latency histograms
    Histogram& execution_latency() { return execution_; }
    Histogram& handoff_wait() { return handoff_wait_; }

    [[nodiscard]] const Counter& tasks_submitted() const { return submitted_; }
    [[nodiscard]] const Counter& tasks_completed() const { return completed_; }
    [[nodiscard]] const Counter& tasks_failed() const { return failed_; }
    [[nodiscard]] const Counter& submissions_rejected() const { return rejected_; }
    [[nodiscard]] const Gauge& tasks_in_flight() const { return in_flight_; }
    [[nodiscard]] const Histogram& execution_latency() const { return execution_; }
    [[nodiscard]] const Histogram& handoff_wait() const { return handoff_wait_; }

    /**
     * @brief Collect current metrics snapshot
     */
    [[nodiscard]] PoolMetricsSnapshot snapshot() const {
        PoolMetricsSnapshot metrics;
        metrics.timestamp = std::chrono::steady_clock::now();
        metrics.tasks_submitted = submitted_.value();
        metrics.tasks_completed = completed_.value();
        metrics.tasks_failed = failed_.value();
        metrics.submissions_rejected = rejected_.value();
        metrics.tasks_in_flight = in_flight_.value();
        metrics.peak_in_flight = in_flight_.peak();
        metrics.avg_execution_ms = execution_.mean() * 1000.0;
        metrics.avg_handoff_wait_ms = handoff_wait_.mean() * 1000.0;
        metrics.max_handoff_wait_ms = handoff_wait_.max() * 1000.0;
        return metrics;
    }

    /**
     * @brief Format metrics as string
     */
    [[nodiscard]] std::string format() const {
        auto m = snapshot();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Submitted: " << m.tasks_submitted
            << " | Completed: " << m.tasks_completed
            << " | Failed: " << m.tasks_failed
            << " | Rejected: " << m.submissions_rejected
            << " | In flight: " << m.tasks_in_flight << " (peak " << m.peak_in_flight << ")"
            << " | Exec: " << m.avg_execution_ms << " ms"
            << " | Handoff wait: " << m.avg_handoff_wait_ms << " ms"
            << " (max " << m.max_handoff_wait_ms << " ms)";
        return oss.str();
    }

    /**
     * @brief Print metrics to the given stream
     */
    void print(std::ostream& os = std::cout) const {
        os << format() << std::endl;
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter submitted_;
    Counter completed_;
    Counter failed_;
    Counter rejected_;
    Gauge in_flight_;
    Histogram execution_;
    Histogram handoff_wait_;
};

} // namespace handoff
