/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for handoff
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <thread>

#include "handoff/handoff.hpp"

using namespace handoff;

static void BM_RunRoundTrip(benchmark::State& state) {
    WorkerPool pool(static_cast<int>(state.range(0)));
    auto task = make_task([]() {});

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto status = pool.run(*task);
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(status);

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e9);
    }

    state.counters["handoff_wait_us"] = pool.metrics().handoff_wait().mean() * 1e6;
}
BENCHMARK(BM_RunRoundTrip)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

static void BM_TryRunIdlePool(benchmark::State& state) {
    WorkerPool pool(2);
    auto task = make_task([]() {});
    std::int64_t refused = 0;

    for (auto _ : state) {
        auto status = pool.try_run(*task);
        if (!status) {
            refused++;
        }
        benchmark::DoNotOptimize(status);
    }

    state.counters["refused"] = static_cast<double>(refused);
}
BENCHMARK(BM_TryRunIdlePool);

static void BM_PoolStartupShutdown(benchmark::State& state) {
    const auto num_workers = static_cast<int>(state.range(0));

    for (auto _ : state) {
        WorkerPool pool(num_workers);
        pool.shutdown();
    }
}
BENCHMARK(BM_PoolStartupShutdown)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_MAIN();
