/*
 * CommitLog C++ Benchmark Suite - Main Program
 *
 * Build with -DCOMMITLOG_BUILD_BENCHMARKS=ON, then:
 *   ./commitlog_benchmark --benchmark all
 *   ./commitlog_benchmark --benchmark append
 *   ./commitlog_benchmark --benchmark store
 *   ./commitlog_benchmark --benchmark read
 */

#include "commitlog_benchmark.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <thread>

using namespace commitlog::benchmark;

void print_current_time() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::cout << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << std::endl;
}

int main(int argc, char** argv) {
    BenchmarkSuite::print_header();
    commitlog::core::set_log_level(spdlog::level::warn);

    std::string benchmark_type = "all";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--benchmark") == 0 && i + 1 < argc) {
            benchmark_type = argv[i + 1];
            break;
        }
    }

    std::cout << "\nRunning benchmark: " << benchmark_type << std::endl;
    std::cout << "Start time: ";
    print_current_time();
    std::cout << std::endl;

    // Let the page cache settle after the previous run's cleanup.
    for (int i = 0; i < BenchConfig::WARMUP_ITERATIONS; ++i) { std::this_thread::sleep_for(std::chrono::milliseconds(100)); }

    try {
        if (benchmark_type == "all") { BenchmarkSuite::run_all(); }
        else if (benchmark_type == "append") { BenchmarkSuite::run_append_benchmark(); }
        else if (benchmark_type == "store") { BenchmarkSuite::run_store_benchmark(); }
        else if (benchmark_type == "read") { BenchmarkSuite::run_read_benchmark(); }
        else {
            std::cerr << "Unknown benchmark type: " << benchmark_type << std::endl;
            std::cerr << "Available: all, append, store, read" << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "\nBenchmark failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nBenchmark completed successfully!" << std::endl;
    std::cout << "End time: ";
    print_current_time();
    std::cout << std::endl;

    return 0;
}
