#ifndef WITS_TELEMETRY_BENCH_UTIL_HPP
#define WITS_TELEMETRY_BENCH_UTIL_HPP

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class LatencyBenchmarkReporter : public benchmark::ConsoleReporter {
 public:
  bool ReportContext(const Context& context) override {
    bool result = ConsoleReporter::ReportContext(context);

    fmt::print("{}\n", std::string(60, '='));
    fmt::print("WITS Decoder Benchmark Results\n");
    fmt::print("{}\n", std::string(60, '='));

    return result;
  }

  void ReportRuns(const std::vector<Run>& reports) override {
    for (const auto& run : reports) {
      if (run.skipped) continue;

      fmt::print("{}\n", run.benchmark_name());
      fmt::print("{}\n", std::string(60, '-'));

      auto print_metric = [&](const char* name, const char* desc) {
        auto it = run.counters.find(name);
        if (it != run.counters.end()) {
          fmt::print("{:<10} {:>10.2f}ns    {}\n", name,
                     static_cast<double>(it->second), desc);
        }
      };

      print_metric("mean", "Average latency");
      print_metric("p50", "50% of frames faster than this");
      print_metric("p99", "99% of frames faster than this");
      print_metric("max", "Worst-case spike");

      fmt::print("{:-^60}\n", "");

      // 1 sec / latency_ns * 10^9 / 10^3 = 10^6 / latency_ns
      double k_frames = 1'000'000.0 / run.GetAdjustedRealTime();
      fmt::print("Throughput: {:.2f} K frames/s\n", k_frames);
    }
  }
};

/// @brief 以 steady_clock 取樣單次操作延遲
class LatencyRecorder {
 private:
  std::vector<int64_t> samples_;

 public:
  explicit LatencyRecorder(size_t reserve_size = 1 << 20) {
    samples_.reserve(reserve_size);
  }

  template <typename Fn>
  void measure(Fn&& fn) {
    auto start = std::chrono::steady_clock::now();
    fn();
    auto elapsed = std::chrono::steady_clock::now() - start;
    samples_.push_back(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
  }

  struct Stats {
    double p50_ns;
    double p99_ns;
    double max_ns;
    double mean_ns;
  };

  Stats compute_stats() {
    if (samples_.empty()) {
      return {0, 0, 0, 0};
    }

    std::sort(samples_.begin(), samples_.end());

    auto percentile = [this](double p) -> double {
      size_t idx = static_cast<size_t>(samples_.size() * p);
      idx = std::min(idx, samples_.size() - 1);
      return static_cast<double>(samples_[idx]);
    };

    double sum = 0;
    for (int64_t ns : samples_) {
      sum += static_cast<double>(ns);
    }

    return Stats{.p50_ns = percentile(0.50),
                 .p99_ns = percentile(0.99),
                 .max_ns = static_cast<double>(samples_.back()),
                 .mean_ns = sum / static_cast<double>(samples_.size())};
  }
};

inline void report_latency_stats(benchmark::State& state,
                                 const LatencyRecorder::Stats& stats) {
  state.counters["p50"] = stats.p50_ns;
  state.counters["p99"] = stats.p99_ns;
  state.counters["max"] = stats.max_ns;
  state.counters["mean"] = stats.mean_ns;
}

#endif
