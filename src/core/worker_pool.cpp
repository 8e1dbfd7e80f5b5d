/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "handoff/core/worker_pool.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace handoff {

namespace {

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start,
                         std::chrono::steady_clock::time_point end) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    return static_cast<std::uint64_t>(ns);
}

double elapsed_seconds(std::chrono::steady_clock::time_point start,
                       std::chrono::steady_clock::time_point end) {
    return std::chrono::duration<double>(end - start).count();
}

// A throwing task must not take its worker down with it
Status execute_task(Task& task) {
    try {
        return task.execute();
    } catch (const std::exception& e) {
        return Status::failure(std::string("task threw: ") + e.what());
    } catch (...) {
        return Status::failure("task threw a non-standard exception");
    }
}

WorkerPoolConfig config_for(int num_workers) {
    if (num_workers <= 0) {
        throw std::invalid_argument(
            "handoff: worker count must be positive, got " + std::to_string(num_workers));
    }

    WorkerPoolConfig config;
    config.num_workers = static_cast<std::uint32_t>(num_workers);
    return config;
}

} // namespace

const char* to_string(PoolState state) noexcept {
    switch (state) {
        case PoolState::Created:    return "Created";
        case PoolState::Running:    return "Running";
        case PoolState::Draining:   return "Draining";
        case PoolState::Terminated: return "Terminated";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------------

void Worker::run() {
    auto idle_since = std::chrono::steady_clock::now();

    while (auto job = channel_->receive()) {
        auto start = std::chrono::steady_clock::now();
        idle_time_ns_.fetch_add(elapsed_ns(idle_since, start), std::memory_order_relaxed);

        metrics_->tasks_in_flight().increment();
        Status status = execute_task(*job->task);
        metrics_->tasks_in_flight().decrement();

        auto end = std::chrono::steady_clock::now();
        active_time_ns_.fetch_add(elapsed_ns(start, end), std::memory_order_relaxed);
        tasks_executed_.fetch_add(1, std::memory_order_relaxed);
        metrics_->tasks_completed().increment();
        metrics_->execution_latency().observe(elapsed_seconds(start, end));
        if (status.failed()) {
            tasks_failed_.fetch_add(1, std::memory_order_relaxed);
            metrics_->tasks_failed().increment();
        }

        // Stats are recorded first so the caller observes them once run() returns
        job->result.set_value(std::move(status));
        idle_since = end;
    }

    active_.store(false, std::memory_order_release);
}

WorkerStats Worker::stats() const noexcept {
    WorkerStats s;
    s.tasks_executed = tasks_executed_.load(std::memory_order_relaxed);
    s.tasks_failed = tasks_failed_.load(std::memory_order_relaxed);
    s.idle_time_ns = idle_time_ns_.load(std::memory_order_relaxed);
    s.active_time_ns = active_time_ns_.load(std::memory_order_relaxed);
    return s;
}

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------

WorkerPool::WorkerPool(WorkerPoolConfig config)
    : config_(std::move(config)) {
    if (config_.num_workers == 0) {
        throw std::invalid_argument(config_.name + ": worker pool needs at least one worker");
    }
    if (config_.num_workers > MAX_WORKERS) {
        throw std::invalid_argument(config_.name + ": " + std::to_string(config_.num_workers)
                                    + " workers requested, at most "
                                    + std::to_string(MAX_WORKERS) + " allowed");
    }

    workers_.reserve(config_.num_workers);
    for (std::uint32_t i = 0; i < config_.num_workers; i++) {
        workers_.push_back(std::make_unique<Worker>(i, &channel_, &metrics_));
    }

    try {
        for (auto& worker : workers_) {
            worker->start();
        }
    } catch (...) {
        // Thread creation failed; release the ones already running
        stop_workers();
        throw;
    }

    state_.store(PoolState::Running, std::memory_order_release);
}

WorkerPool::WorkerPool(int num_workers)
    : WorkerPool(config_for(num_workers)) {}

WorkerPool::~WorkerPool() {
    shutdown();
}

Status WorkerPool::run(Task& task) {
    Job job = make_job(task, "run");
    auto result = job.result.get_future();
    auto submitted_at = job.submitted_at;

    if (!channel_.send(std::move(job))) {
        reject("run");
    }

    return await_result(result, submitted_at);
}

std::optional<Status> WorkerPool::try_run(Task& task) {
    Job job = make_job(task, "try_run");
    auto result = job.result.get_future();
    auto submitted_at = job.submitted_at;

    if (!channel_.try_send(std::move(job))) {
        if (channel_.is_closed()) {
            reject("try_run");
        }
        return std::nullopt;
    }

    return await_result(result, submitted_at);
}

void WorkerPool::shutdown() {
    // A worker would end up joining itself; refuse before touching any state
    if (on_worker_thread()) {
        throw std::logic_error(config_.name + ": shutdown() called from inside a task");
    }

    std::lock_guard<std::mutex> lock(shutdown_mutex_);

    if (state() != PoolState::Running) {
        return;
    }

    state_.store(PoolState::Draining, std::memory_order_release);
    stop_workers();
    state_.store(PoolState::Terminated, std::memory_order_release);
}

std::uint32_t WorkerPool::active_workers() const noexcept {
    std::uint32_t count = 0;
    for (const auto& worker : workers_) {
        if (worker->is_active()) {
            count++;
        }
    }
    return count;
}

std::vector<WorkerStats> WorkerPool::worker_stats() const {
    std::vector<WorkerStats> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->stats());
    }
    return result;
}

Job WorkerPool::make_job(Task& task, const char* operation) {
    if (state() != PoolState::Running) {
        reject(operation);
    }

    Job job;
    job.task = &task;
    job.submitted_at = std::chrono::steady_clock::now();
    return job;
}

Status WorkerPool::await_result(std::future<Status>& result,
                                std::chrono::steady_clock::time_point submitted_at) {
    // The send has returned, so a worker holds the job by now
    metrics_.tasks_submitted().increment();
    metrics_.handoff_wait().observe(
        elapsed_seconds(submitted_at, std::chrono::steady_clock::now()));
    return result.get();
}

void WorkerPool::reject(const char* operation) {
    metrics_.submissions_rejected().increment();
    throw std::runtime_error(config_.name + ": " + operation + "() called after shutdown");
}

bool WorkerPool::on_worker_thread() const noexcept {
    const auto self = std::this_thread::get_id();
    for (const auto& worker : workers_) {
        if (worker->thread_id() == self) {
            return true;
        }
    }
    return false;
}

void WorkerPool::stop_workers() {
    channel_.close();
    for (auto& worker : workers_) {
        worker->join();
    }
}

} // namespace handoff
