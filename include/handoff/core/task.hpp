#pragma once

/**
 * @file task.hpp
 * @brief Task contract consumed by the worker pool
 */

#include <memory>
#include <type_traits>
#include <utility>

#include "handoff/core/status.hpp"

namespace handoff {

/**
 * @brief Base class for all units of work
 *
 * A task is owned by the caller that submits it. The pool only
 * borrows it for the duration of one execution, on whichever
 * worker thread accepted it, so execute() must be safe to call
 * from an arbitrary thread.
 */
class Task {
public:
    Task() = default;
    virtual ~Task() = default;

    // Non-copyable
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Movable
    Task(Task&&) = default;
    Task& operator=(Task&&) = default;

    /**
     * @brief Execute the task synchronously
     * @return Success, or a failure describing what went wrong
     */
    virtual Status execute() = 0;
};

/**
 * @brief Function-based task for simple closures
 *
 * Callables returning Status are reported as-is; callables
 * returning void report success.
 */
template<typename Func>
class FunctionTask : public Task {
public:
    explicit FunctionTask(Func func)
        : func_(std::move(func)) {}

    Status execute() override {
        if constexpr (std::is_invocable_r_v<Status, Func&>) {
            return func_();
        } else {
            static_assert(std::is_invocable_v<Func&>, "Task callable must take no arguments");
            func_();
            return Status::ok();
        }
    }

private:
    Func func_;
};

/**
 * @brief Factory function for creating function-based tasks
 */
template<typename Func>
auto make_task(Func&& func) {
    return std::make_unique<FunctionTask<std::decay_t<Func>>>(std::forward<Func>(func));
}

} // namespace handoff
