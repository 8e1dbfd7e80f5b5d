#pragma once

/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool with synchronous handoff
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "handoff/core/channel.hpp"
#include "handoff/core/metrics.hpp"
#include "handoff/core/status.hpp"
#include "handoff/core/task.hpp"

namespace handoff {

/**
 * @brief Pool state enumeration
 */
enum class PoolState {
    Created,
    Running,
    Draining,
    Terminated
};

[[nodiscard]] const char* to_string(PoolState state) noexcept;

/**
 * @brief A task in transit from a caller to a worker
 *
 * Each job carries its own result promise, so the outcome goes back
 * to the caller that submitted this task and to nobody else.
 */
struct Job {
    Task* task{nullptr};
    std::promise<Status> result;
    std::chrono::steady_clock::time_point submitted_at;
};

using JobChannel = RendezvousChannel<Job>;

/**
 * @brief Worker thread statistics
 */
struct WorkerStats {
    std::uint64_t tasks_executed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t idle_time_ns{0};
    std::uint64_t active_time_ns{0};
};

/**
 * @brief Individual worker thread
 */
class Worker {
public:
    Worker(std::uint32_t id, JobChannel* channel, PoolMetrics* metrics)
        : id_(id)
        , channel_(channel)
        , metrics_(metrics) {}

    // Non-copyable, non-movable (the thread runs on this)
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Start the worker thread
     */
    void start() {
        active_.store(true, std::memory_order_release);
        try {
            thread_ = std::thread(&Worker::run, this);
            thread_id_ = thread_.get_id();
        } catch (...) {
            active_.store(false, std::memory_order_release);
            throw;
        }
    }

    /**
     * @brief Wait for the worker thread to finish
     */
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

    /**
     * @brief Id of the worker's thread, fixed once start() returned
     */
    [[nodiscard]] std::thread::id thread_id() const noexcept { return thread_id_; }

    /**
     * @brief True until the worker observed a closed, drained channel
     */
    [[nodiscard]] bool is_active() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] WorkerStats stats() const noexcept;

private:
    void run();

    std::uint32_t id_;
    JobChannel* channel_;
    PoolMetrics* metrics_;
    std::thread thread_;
    std::thread::id thread_id_;
    std::atomic<bool> active_{false};

    std::atomic<std::uint64_t> tasks_executed_{0};
    std::atomic<std::uint64_t> tasks_failed_{0};
    std::atomic<std::uint64_t> idle_time_ns_{0};
    std::atomic<std::uint64_t> active_time_ns_{0};
};

/**
 * @brief Upper bound on the worker count of a single pool
 */
constexpr std::uint32_t MAX_WORKERS = 4096;

/**
 * @brief Configuration for worker pool
 */
struct WorkerPoolConfig {
    std::uint32_t num_workers{4};  // 1..MAX_WORKERS
    std::string name{"handoff"};   // Used in error messages
};

/**
 * @brief Pool of worker threads admitting at most num_workers tasks at once
 *
 * There is no queue. run() hands the task directly to an idle worker
 * and blocks until the worker has executed it; when every worker is
 * busy the caller blocks instead of the task being buffered.
 *
 * run() and try_run() may be called from any number of threads.
 * shutdown() must be the last operation; afterwards run() and
 * try_run() throw std::runtime_error. shutdown() called from inside
 * a task throws std::logic_error and leaves the pool running.
 */
class WorkerPool {
public:
    /**
     * @brief Start num_workers worker threads
     * @throws std::invalid_argument if num_workers is 0 or above MAX_WORKERS
     */
    explicit WorkerPool(WorkerPoolConfig config = {});

    /**
     * @throws std::invalid_argument if num_workers is not in 1..MAX_WORKERS
     */
    explicit WorkerPool(int num_workers);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Execute a task on the pool
     *
     * Blocks until an idle worker accepts the task, then until that
     * task has finished executing.
     *
     * @return The task's own outcome. A task that throws yields a failed Status.
     * @throws std::runtime_error if the pool is shutting down or terminated
     */
    Status run(Task& task);

    /**
     * @brief Execute a task only if a worker is idle right now
     * @return The task's outcome, or nullopt if every worker was busy
     * @throws std::runtime_error if the pool is shutting down or terminated
     */
    std::optional<Status> try_run(Task& task);

    /**
     * @brief Stop accepting tasks and wait for every worker to exit
     *
     * Tasks already handed to a worker run to completion. Calling it
     * again is a no-op.
     *
     * @throws std::logic_error if called from one of the pool's workers
     */
    void shutdown();

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return config_.num_workers;
    }

    [[nodiscard]] const WorkerPoolConfig& config() const noexcept { return config_; }

    [[nodiscard]] PoolState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /**
     * @brief Number of worker threads that have not exited yet
     */
    [[nodiscard]] std::uint32_t active_workers() const noexcept;

    /**
     * @brief Number of workers blocked waiting for a task
     */
    [[nodiscard]] std::size_t idle_workers() const {
        return channel_.waiting_receivers();
    }

    /**
     * @brief Get per-worker statistics
     */
    [[nodiscard]] std::vector<WorkerStats> worker_stats() const;

    /**
     * @brief Statistics of the handoff channel
     */
    [[nodiscard]] ChannelStats handoff_stats() const {
        return channel_.stats();
    }

    [[nodiscard]] PoolMetrics& metrics() { return metrics_; }
    [[nodiscard]] const PoolMetrics& metrics() const { return metrics_; }

private:
    Job make_job(Task& task, const char* operation);
    Status await_result(std::future<Status>& result,
                        std::chrono::steady_clock::time_point submitted_at);
    [[noreturn]] void reject(const char* operation);
    [[nodiscard]] bool on_worker_thread() const noexcept;
    void stop_workers();

    WorkerPoolConfig config_;
    PoolMetrics metrics_;
    JobChannel channel_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<PoolState> state_{PoolState::Created};
    std::mutex shutdown_mutex_;
};

} // namespace handoff
