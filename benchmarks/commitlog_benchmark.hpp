/*
 * CommitLog C++ Benchmark Suite
 *
 * Latency measurement tools and segment/store benchmarks
 */

#pragma once

#include "engine/log/Config.hpp"
#include "engine/log/Segment.hpp"
#include "engine/log/Store.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace commitlog::benchmark {
    // ==================== Configuration ====================

    struct BenchConfig {
        static constexpr size_t DEFAULT_RECORD_COUNT = 200'000;
        static constexpr size_t DEFAULT_VALUE_SIZE = 64;
        static constexpr uint64_t SEGMENT_STORE_BYTES = 64ULL * 1024 * 1024;
        static constexpr uint64_t SEGMENT_INDEX_BYTES = 12ULL * 1024 * 1024;
        static constexpr int WARMUP_ITERATIONS = 3;
    };

    // ==================== Latency Statistics ====================

    struct StatsReport {
        std::string name;
        size_t count;
        double ops_per_sec;
        double p50; // microseconds
        double p90;
        double p99;
        double p999;
        double max;

        std::string to_string() const {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1);
            oss << "=== " << name << " ===" << std::endl;
            oss << "  Total ops:    " << std::setw(12) << count << std::endl;
            oss << "  ops/sec:      " << std::setw(12) << static_cast<size_t>(ops_per_sec) << std::endl;
            oss << "  p50:          " << std::setw(8) << p50 << " us" << std::endl;
            oss << "  p90:          " << std::setw(8) << p90 << " us" << std::endl;
            oss << "  p99:          " << std::setw(8) << p99 << " us" << std::endl;
            oss << "  p99.9:        " << std::setw(8) << p999 << " us" << std::endl;
            oss << "  max:          " << std::setw(8) << max << " us" << std::endl;
            return oss.str();
        }
    };

    class LatencyStats {
        public:
            explicit LatencyStats(std::string name) : name_{std::move(name)} { latencies_.reserve(BenchConfig::DEFAULT_RECORD_COUNT); }

            void record(int64_t nanos) { latencies_.push_back(nanos); }

            [[nodiscard]] StatsReport report() const {
                if (latencies_.empty()) { return StatsReport{name_, 0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}; }

                auto sorted = latencies_;
                std::sort(sorted.begin(), sorted.end());

                const size_t count = sorted.size();
                const int64_t sum = std::accumulate(sorted.begin(), sorted.end(), int64_t{0});
                const double total_sec = static_cast<double>(sum) / 1'000'000'000.0;
                const double ops_per_sec = total_sec > 0.0 ? static_cast<double>(count) / total_sec : 0.0;

                // nanos -> micros
                auto percentile = [&](double p) -> double {
                    const size_t idx = std::min(static_cast<size_t>((p / 100.0) * static_cast<double>(count - 1)), count - 1);
                    return static_cast<double>(sorted[idx]) / 1000.0;
                };

                return StatsReport{
                    .name = name_,
                    .count = count,
                    .ops_per_sec = ops_per_sec,
                    .p50 = percentile(50.0),
                    .p90 = percentile(90.0),
                    .p99 = percentile(99.0),
                    .p999 = percentile(99.9),
                    .max = static_cast<double>(sorted.back()) / 1000.0
                };
            }

        private:
            std::string name_;
            std::vector<int64_t> latencies_;
    };

    // ==================== Utility Functions ====================

    inline std::filesystem::path create_temp_dir(const std::string& prefix) {
        auto temp_dir = std::filesystem::temp_directory_path() /
            (prefix + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(temp_dir);
        return temp_dir;
    }

    inline std::vector<uint8_t> generate_value(size_t size) {
        std::vector<uint8_t> value(size);
        for (size_t i = 0; i < size; ++i) { value[i] = static_cast<uint8_t>(i % 256); }
        return value;
    }

    inline void print_separator(size_t length = 70) { std::cout << std::string(length, '=') << std::endl; }

    inline void print_dash(size_t length = 70) { std::cout << std::string(length, '-') << std::endl; }

    template <typename Fn>
    int64_t time_nanos(Fn&& fn) {
        const auto start = std::chrono::steady_clock::now();
        fn();
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }

    /**
     * Minimal rotating segment chain: opens a new segment at next_offset()
     * once the active one reports maxed.
     */
    class SegmentChain {
        public:
            SegmentChain(std::filesystem::path dir, engine::log::Config config) : dir_{std::move(dir)}, config_{config} {
                segments_.push_back(engine::log::Segment::open(dir_, config_.segment.initial_offset, config_));
            }

            uint64_t append(core::Record& record) {
                if (segments_.back()->is_maxed()) {
                    const uint64_t base = segments_.back()->next_offset();
                    segments_.push_back(engine::log::Segment::open(dir_, base, config_));
                }
                return segments_.back()->append(record);
            }

            [[nodiscard]] core::Record read(uint64_t offset) const {
                auto it = std::upper_bound(
                    segments_.begin(),
                    segments_.end(),
                    offset,
                    [](uint64_t off, const auto& seg) { return off < seg->base_offset(); }
                );
                return (*std::prev(it))->read(offset);
            }

            void close() { for (auto& seg : segments_) { seg->close(); } }

            [[nodiscard]] size_t segment_count() const noexcept { return segments_.size(); }

        private:
            std::filesystem::path dir_;
            engine::log::Config config_;
            std::vector<std::unique_ptr<engine::log::Segment>> segments_;
    };

    inline engine::log::Config bench_config(size_t write_buffer_bytes = 4096) {
        engine::log::Config config;
        config.segment.max_store_bytes = BenchConfig::SEGMENT_STORE_BYTES;
        config.segment.max_index_bytes = BenchConfig::SEGMENT_INDEX_BYTES;
        config.segment.write_buffer_bytes = write_buffer_bytes;
        return config;
    }

    // ==================== Benchmark Implementations ====================

    // 1. Append - by value size
    class AppendBenchmark {
        public:
            void run(size_t record_count = BenchConfig::DEFAULT_RECORD_COUNT) {
                std::cout << "\n";
                print_separator();
                std::cout << "Append Benchmark - by value size" << std::endl;
                print_separator();

                const std::vector<size_t> value_sizes = {16, 64, 256, 1024, 4096};
                std::vector<std::tuple<size_t, size_t, StatsReport>> results;

                for (size_t value_size : value_sizes) {
                    auto dir = create_temp_dir("commitlog-append-bench-");
                    LatencyStats stats(std::to_string(value_size) + " B");

                    try {
                        SegmentChain chain{dir, bench_config()};
                        auto record = core::Record::of(generate_value(value_size));

                        for (size_t i = 0; i < record_count; ++i) {
                            stats.record(time_nanos([&] { (void)chain.append(record); }));
                        }
                        const size_t segments = chain.segment_count();
                        chain.close();

                        auto report = stats.report();
                        results.emplace_back(value_size, segments, report);
                        std::cout << "+ " << std::setw(6) << value_size << " B: "
                            << std::setw(10) << static_cast<size_t>(report.ops_per_sec) << " ops/sec, "
                            << "p99: " << std::fixed << std::setprecision(1) << report.p99 << " us" << std::endl;
                    }
                    catch (const std::exception& e) { std::cout << "x " << value_size << " B - Error: " << e.what() << std::endl; }

                    std::filesystem::remove_all(dir);
                }

                std::cout << "\nSummary:" << std::endl;
                print_dash(80);
                std::cout << std::left << std::setw(14) << "| Value"
                    << std::right << std::setw(10) << "Segments"
                    << std::setw(14) << "ops/sec"
                    << std::setw(12) << "p50(us)"
                    << std::setw(12) << "p99(us)"
                    << std::setw(12) << "max(us) |" << std::endl;
                print_dash(80);
                for (const auto& [size, segments, report] : results) {
                    std::cout << std::left << "| " << std::setw(12) << (std::to_string(size) + " B")
                        << std::right << std::setw(10) << segments
                        << std::setw(14) << static_cast<size_t>(report.ops_per_sec)
                        << std::fixed << std::setprecision(1)
                        << std::setw(12) << report.p50
                        << std::setw(12) << report.p99
                        << std::setw(10) << report.max << " |" << std::endl;
                }
                print_dash(80);
            }
    };

    // 2. Store append - write buffer tuning
    class StoreBufferBenchmark {
        public:
            void run(size_t record_count = BenchConfig::DEFAULT_RECORD_COUNT, size_t value_size = BenchConfig::DEFAULT_VALUE_SIZE) {
                std::cout << "\n";
                print_separator();
                std::cout << "Store Append - write buffer size" << std::endl;
                print_separator();

                const std::vector<size_t> buffer_sizes = {256, 4096, 64 * 1024, 1024 * 1024};
                const auto payload = generate_value(value_size);

                for (size_t buffer_size : buffer_sizes) {
                    auto dir = create_temp_dir("commitlog-store-bench-");
                    LatencyStats stats("buffer " + std::to_string(buffer_size) + " B");

                    try {
                        auto store = engine::log::Store::open(dir / "bench.store", buffer_size);
                        for (size_t i = 0; i < record_count; ++i) {
                            stats.record(time_nanos([&] { (void)store->append(payload); }));
                        }
                        stats.record(time_nanos([&] { store->sync(); }));
                        store->close();
                        std::cout << stats.report().to_string();
                    }
                    catch (const std::exception& e) { std::cout << "x buffer " << buffer_size << " B - Error: " << e.what() << std::endl; }

                    std::filesystem::remove_all(dir);
                }
            }
    };

    // 3. Read - sequential vs random
    class ReadBenchmark {
        public:
            void run(size_t record_count = BenchConfig::DEFAULT_RECORD_COUNT, size_t value_size = BenchConfig::DEFAULT_VALUE_SIZE) {
                std::cout << "\n";
                print_separator();
                std::cout << "Read Benchmark - sequential / random" << std::endl;
                print_separator();

                auto dir = create_temp_dir("commitlog-read-bench-");
                try {
                    SegmentChain chain{dir, bench_config()};
                    auto record = core::Record::of(generate_value(value_size));
                    for (size_t i = 0; i < record_count; ++i) { (void)chain.append(record); }

                    LatencyStats sequential("sequential");
                    for (uint64_t off = 0; off < record_count; ++off) {
                        stats_read(chain, off, sequential);
                    }
                    std::cout << sequential.report().to_string();

                    std::mt19937_64 rng{42};
                    std::uniform_int_distribution<uint64_t> dist{0, record_count - 1};
                    LatencyStats random("random");
                    for (size_t i = 0; i < record_count; ++i) { stats_read(chain, dist(rng), random); }
                    std::cout << random.report().to_string();

                    chain.close();
                }
                catch (const std::exception& e) { std::cout << "x read - Error: " << e.what() << std::endl; }

                std::filesystem::remove_all(dir);
            }

        private:
            static void stats_read(const SegmentChain& chain, uint64_t offset, LatencyStats& stats) {
                core::Record out;
                stats.record(time_nanos([&] { out = chain.read(offset); }));
                if (out.offset != offset) { throw std::runtime_error("read returned offset " + std::to_string(out.offset)); }
            }
    };

    // ==================== Suite ====================

    class BenchmarkSuite {
        public:
            static void print_header() {
                print_separator();
                std::cout << "CommitLog C++ Benchmark Suite" << std::endl;
                print_separator();
            }

            static void run_append_benchmark() { AppendBenchmark{}.run(); }

            static void run_store_benchmark() { StoreBufferBenchmark{}.run(); }

            static void run_read_benchmark() { ReadBenchmark{}.run(); }

            static void run_all() {
                run_append_benchmark();
                run_store_benchmark();
                run_read_benchmark();
            }
    };
} // namespace commitlog::benchmark
