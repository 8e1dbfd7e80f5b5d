/**
 * @file integration_test.cpp
 * @brief End-to-end scenarios for the worker pool
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "handoff/handoff.hpp"

using namespace handoff;

namespace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Sleeps briefly and fails for one designated name
 */
class NamedTask : public Task {
public:
    NamedTask(std::string name, std::string rejected, std::chrono::milliseconds delay)
        : name_(std::move(name))
        , rejected_(std::move(rejected))
        , delay_(delay) {}

    Status execute() override {
        std::this_thread::sleep_for(delay_);
        if (name_ == rejected_) {
            return Status::failure("Invalid name");
        }
        return Status::ok();
    }

private:
    std::string name_;
    std::string rejected_;
    std::chrono::milliseconds delay_;
};

struct Interval {
    Clock::time_point start;
    Clock::time_point end;
};

} // namespace

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(IntegrationTest, SevenNamesOneFailure) {
    const std::vector<std::string> names{"steve", "bob", "mary", "jason", "Bob", "Lee", "Jane"};

    WorkerPool pool(2);

    std::vector<std::unique_ptr<NamedTask>> tasks;
    for (const auto& name : names) {
        tasks.push_back(std::make_unique<NamedTask>(name, "jason", std::chrono::milliseconds(20)));
    }

    std::vector<Status> outcomes(names.size());
    std::vector<std::thread> callers;
    for (std::size_t i = 0; i < names.size(); i++) {
        callers.emplace_back([&, i]() { outcomes[i] = pool.run(*tasks[i]); });
    }
    for (auto& t : callers) {
        t.join();
    }

    int failures = 0;
    for (std::size_t i = 0; i < names.size(); i++) {
        if (outcomes[i].failed()) {
            failures++;
            EXPECT_EQ(names[i], "jason");
            EXPECT_EQ(outcomes[i], Status::failure("Invalid name"));
        }
    }
    EXPECT_EQ(failures, 1);

    // Shutdown must finish promptly once every run() has returned
    auto shutdown = std::async(std::launch::async, [&pool]() { pool.shutdown(); });
    ASSERT_EQ(shutdown.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    shutdown.get();

    EXPECT_EQ(pool.state(), PoolState::Terminated);
    EXPECT_EQ(pool.active_workers(), 0u);
    EXPECT_EQ(pool.metrics().tasks_completed().value(), 7u);
    EXPECT_EQ(pool.metrics().tasks_failed().value(), 1u);
    EXPECT_LE(pool.metrics().tasks_in_flight().peak(), 2);
}

TEST_F(IntegrationTest, SingleWorkerRunsTasksSerially) {
    WorkerPool pool(1);

    std::mutex mutex;
    std::vector<Interval> intervals;

    auto make_recording_task = [&]() {
        return make_task([&]() {
            Interval interval;
            interval.start = Clock::now();
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            interval.end = Clock::now();

            std::lock_guard<std::mutex> lock(mutex);
            intervals.push_back(interval);
        });
    };

    std::vector<std::unique_ptr<Task>> tasks;
    for (int i = 0; i < 3; i++) {
        tasks.push_back(make_recording_task());
    }

    std::vector<std::thread> callers;
    for (int i = 0; i < 3; i++) {
        callers.emplace_back([&, i]() { EXPECT_TRUE(pool.run(*tasks[i]).is_ok()); });
    }
    for (auto& t : callers) {
        t.join();
    }

    ASSERT_EQ(intervals.size(), 3u);
    std::sort(intervals.begin(), intervals.end(),
              [](const Interval& a, const Interval& b) { return a.start < b.start; });
    for (std::size_t i = 1; i < intervals.size(); i++) {
        EXPECT_LE(intervals[i - 1].end, intervals[i].start) << "tasks " << i - 1 << " and " << i << " overlap";
    }
}

TEST_F(IntegrationTest, ManyCallersNoTaskLost) {
    constexpr std::uint32_t num_workers = 4;
    constexpr int num_callers = 8;
    constexpr int tasks_per_caller = 200;

    WorkerPool pool(num_workers);
    std::atomic<int> executed{0};
    std::atomic<int> current{0};
    std::atomic<int> peak{0};

    auto body = [&]() {
        auto now = current.fetch_add(1) + 1;
        auto seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        executed.fetch_add(1);
        current.fetch_sub(1);
    };

    std::vector<std::thread> callers;
    for (int c = 0; c < num_callers; c++) {
        callers.emplace_back([&]() {
            auto task = make_task(body);
            for (int i = 0; i < tasks_per_caller; i++) {
                EXPECT_TRUE(pool.run(*task).is_ok());
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    pool.shutdown();

    constexpr int total = num_callers * tasks_per_caller;
    EXPECT_EQ(executed.load(), total);
    EXPECT_LE(peak.load(), static_cast<int>(num_workers));
    EXPECT_EQ(pool.metrics().tasks_submitted().value(), static_cast<std::uint64_t>(total));
    EXPECT_EQ(pool.metrics().tasks_completed().value(), static_cast<std::uint64_t>(total));
}

TEST_F(IntegrationTest, ShutdownWhileCallersWaitRejectsOrCompletesEach) {
    WorkerPool pool(1);
    std::atomic<int> executed{0};
    std::atomic<int> rejected{0};
    std::atomic<int> completed{0};

    auto task = make_task([&executed]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        executed.fetch_add(1);
    });

    std::vector<std::thread> callers;
    for (int i = 0; i < 6; i++) {
        callers.emplace_back([&]() {
            try {
                if (pool.run(*task).is_ok()) {
                    completed.fetch_add(1);
                }
            } catch (const std::runtime_error&) {
                rejected.fetch_add(1);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    pool.shutdown();
    for (auto& t : callers) {
        t.join();
    }

    // Every caller either ran its task to completion or was told no
    EXPECT_EQ(completed.load() + rejected.load(), 6);
    EXPECT_EQ(executed.load(), completed.load());
    EXPECT_EQ(pool.active_workers(), 0u);
}
