/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for handoff
 */

#include <benchmark/benchmark.h>
#include <thread>
#include <vector>

#include "handoff/handoff.hpp"

using namespace handoff;

static void BM_ChannelHandoff(benchmark::State& state) {
    RendezvousChannel<int> channel;

    std::thread receiver([&channel]() {
        while (auto value = channel.receive()) {
            benchmark::DoNotOptimize(*value);
        }
    });

    for (auto _ : state) {
        bool sent = channel.send(42);
        benchmark::DoNotOptimize(sent);
    }

    channel.close();
    receiver.join();

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelHandoff);

static void BM_PoolRunSingleCaller(benchmark::State& state) {
    WorkerPool pool(static_cast<int>(state.range(0)));
    auto task = make_task([]() {});

    for (auto _ : state) {
        auto status = pool.run(*task);
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PoolRunSingleCaller)->Arg(1)->Arg(2)->Arg(4);

static void BM_PoolRunContended(benchmark::State& state) {
    const auto num_workers = static_cast<int>(state.range(0));
    const int num_callers = static_cast<int>(state.range(1));
    constexpr int tasks_per_caller = 1000;

    WorkerPool pool(num_workers);

    for (auto _ : state) {
        std::vector<std::thread> callers;
        callers.reserve(static_cast<std::size_t>(num_callers));
        for (int c = 0; c < num_callers; c++) {
            callers.emplace_back([&pool]() {
                auto task = make_task([]() {});
                for (int i = 0; i < tasks_per_caller; i++) {
                    auto status = pool.run(*task);
                    benchmark::DoNotOptimize(status);
                }
            });
        }
        for (auto& t : callers) {
            t.join();
        }
    }

    state.SetItemsProcessed(state.iterations() * num_callers * tasks_per_caller);
}
BENCHMARK(BM_PoolRunContended)
    ->Args({2, 2})
    ->Args({2, 8})
    ->Args({4, 8})
    ->Args({4, 32})
    ->UseRealTime();

static void BM_PoolRunWithWork(benchmark::State& state) {
    const auto num_workers = static_cast<int>(state.range(0));
    constexpr int num_callers = 8;
    constexpr int tasks_per_caller = 100;

    WorkerPool pool(num_workers);

    for (auto _ : state) {
        std::vector<std::thread> callers;
        for (int c = 0; c < num_callers; c++) {
            callers.emplace_back([&pool]() {
                auto task = make_task([]() {
                    std::uint64_t acc = 0;
                    for (std::uint64_t i = 0; i < 10000; i++) {
                        acc += i * i;
                    }
                    benchmark::DoNotOptimize(acc);
                });
                for (int i = 0; i < tasks_per_caller; i++) {
                    auto status = pool.run(*task);
                    benchmark::DoNotOptimize(status);
                }
            });
        }
        for (auto& t : callers) {
            t.join();
        }
    }

    state.SetItemsProcessed(state.iterations() * num_callers * tasks_per_caller);
}
BENCHMARK(BM_PoolRunWithWork)->Arg(1)->Arg(2)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
