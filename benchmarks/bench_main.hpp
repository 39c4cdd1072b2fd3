#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace structbuf::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    // 单轮处理的字节数（pack 输出 / unpack 输入的总长度）。
    std::size_t data_size;
    // 单轮内的操作次数（pack/unpack 调用次数）。
    std::size_t ops;
    double best_ms;
    double avg_ms;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

/**
 * @brief 执行 rounds 轮 func，记录最好与平均耗时。
 *
 * 最好耗时受调度抖动影响最小，用于计算吞吐与单次操作耗时。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          std::size_t ops,
                          int rounds,
                          Func &&func) {
    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(rounds));

    for (int i = 0; i < rounds; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }

    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    const double best_ms = timings.empty() ? 0.0 : *std::min_element(timings.begin(), timings.end());
    const double avg_ms = rounds > 0 ? total_ms / rounds : 0.0;

    results().push_back({name, data_size, ops, best_ms, avg_ms});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(46) << "Benchmark" << std::setw(12) << "Size"
              << std::setw(14) << "Best (ms)" << std::setw(14) << "Avg (ms)"
              << std::setw(12) << "ns/op" << "MB/s\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(46) << result.name;

        if (result.data_size >= 1024 * 1024) {
            std::cout << std::setw(12) << (std::to_string(result.data_size / (1024 * 1024)) + " MB");
        } else if (result.data_size >= 1024) {
            std::cout << std::setw(12) << (std::to_string(result.data_size / 1024) + " KB");
        } else {
            std::cout << std::setw(12) << (std::to_string(result.data_size) + " B");
        }

        std::cout << std::fixed << std::setprecision(3) << std::setw(14) << result.best_ms
                  << std::setw(14) << result.avg_ms;

        if (result.best_ms > 0.0 && result.ops > 0) {
            const double ns_per_op = result.best_ms * 1'000'000.0 / static_cast<double>(result.ops);
            const double mbps = (static_cast<double>(result.data_size) / (1024.0 * 1024.0)) / (result.best_ms / 1000.0);
            std::cout << std::setprecision(1) << std::setw(12) << ns_per_op << mbps;
        } else {
            std::cout << std::setw(12) << "N/A" << "N/A";
        }

        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace structbuf::benchmarks

#define BENCH_RUN(name, size, ops, rounds, code) \
    ::structbuf::benchmarks::run_benchmark(name, size, ops, rounds, [&]() { code; })
