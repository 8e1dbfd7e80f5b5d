/**
 * @file name_printer.cpp
 * @brief Example: submit named tasks to a two-worker pool
 *
 * Every name is submitted from its own thread. Only as many tasks as
 * there are workers run at once; the remaining callers block inside
 * run() until a worker frees up. One name is rigged to fail.
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "handoff/handoff.hpp"

namespace {

struct NamePrinterConfig {
    std::vector<std::string> names{"steve", "bob", "mary", "jason", "Bob", "Lee", "Jane"};
    std::string rejected_name{"jason"};
    std::chrono::milliseconds delay{1000};
    std::uint32_t num_workers{2};
};

/**
 * @brief Writes its name after a short sleep, fails for the rejected name
 */
class NamePrinter : public handoff::Task {
public:
    NamePrinter(std::string name, const NamePrinterConfig& config,
                std::ostream& out, std::mutex& out_mutex)
        : name_(std::move(name))
        , config_(config)
        , out_(out)
        , out_mutex_(out_mutex) {}

    handoff::Status execute() override {
        std::this_thread::sleep_for(config_.delay);
        if (name_ == config_.rejected_name) {
            return handoff::Status::failure("Invalid name");
        }

        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << name_ << std::endl;
        return handoff::Status::ok();
    }

private:
    std::string name_;
    const NamePrinterConfig& config_;
    std::ostream& out_;
    std::mutex& out_mutex_;
};

void print_latency_buckets(const handoff::Histogram& histogram, std::ostream& out) {
    const auto& bounds = histogram.bounds();
    auto counts = histogram.bucket_counts();

    out << "Exec latency:";
    for (std::size_t i = 0; i < counts.size(); i++) {
        if (counts[i] == 0) {
            continue;
        }
        if (i < bounds.size()) {
            out << " <=" << bounds[i] * 1000.0 << "ms: " << counts[i];
        } else {
            out << " >" << bounds.back() * 1000.0 << "ms: " << counts[i];
        }
    }
    out << std::endl;
}

/**
 * @brief Submit every configured name concurrently
 * @return Number of tasks that reported a failure
 */
std::uint64_t run_name_printer(const NamePrinterConfig& config, std::ostream& out, std::ostream& err) {
    handoff::WorkerPoolConfig pool_config;
    pool_config.num_workers = config.num_workers;
    pool_config.name = "name_printer";

    handoff::WorkerPool pool(pool_config);
    std::mutex out_mutex;

    std::vector<std::unique_ptr<NamePrinter>> printers;
    printers.reserve(config.names.size());
    for (const auto& name : config.names) {
        printers.push_back(std::make_unique<NamePrinter>(name, config, out, out_mutex));
    }

    std::vector<std::thread> callers;
    callers.reserve(printers.size());
    for (std::size_t i = 0; i < printers.size(); i++) {
        callers.emplace_back([&, i]() {
            auto status = pool.run(*printers[i]);
            if (status.failed()) {
                std::lock_guard<std::mutex> lock(out_mutex);
                err << config.names[i] << ": " << status << std::endl;
            }
        });
    }

    for (auto& t : callers) {
        t.join();
    }

    pool.shutdown();

    out << "\n=== Final Statistics ===" << std::endl;
    pool.metrics().print(out);
    print_latency_buckets(pool.metrics().execution_latency(), out);
    out << "Uptime: " << pool.metrics().uptime().count() << " ms" << std::endl;

    return pool.metrics().tasks_failed().value();
}

} // namespace

int main(int argc, char** argv) {
    NamePrinterConfig config;

    if (argc > 1) {
        try {
            auto workers = std::stol(argv[1]);
            if (workers < 1 || workers > static_cast<long>(handoff::MAX_WORKERS)) {
                throw std::out_of_range("expected 1.." + std::to_string(handoff::MAX_WORKERS));
            }
            config.num_workers = static_cast<std::uint32_t>(workers);
        } catch (const std::exception& e) {
            std::cerr << "usage: " << argv[0] << " [workers]" << std::endl;
            std::cerr << "invalid worker count '" << argv[1] << "': " << e.what() << std::endl;
            return 2;
        }
    }

    std::cout << "=== handoff name printer ===" << std::endl;
    std::cout << "Version: " << handoff::VERSION << std::endl;
    std::cout << "Workers: " << config.num_workers << std::endl;
    std::cout << std::endl;

    try {
        auto failed = run_name_printer(config, std::cout, std::cerr);
        std::cout << failed << " task(s) reported a failure" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
