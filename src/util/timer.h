// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relnmr {
/**
 * @brief Process-wide accumulating timer
 *
 * Tracks call count, total, min and max duration per named section. Safe to
 * use from the per-nucleus worker threads.
 */
class Timer {
 public:
  using clock = std::chrono::steady_clock;
  using duration = std::chrono::duration<double, std::milli>;

  /**
   * @brief Timer record containing timing statistics
   */
  struct record_t {
    duration total{0};  ///< Accumulated duration across all calls
    duration min = duration::max();  ///< Shortest call
    duration max{0};                 ///< Longest call
    size_t count = 0;                ///< Number of recorded calls

    double avg() const { return count ? total.count() / count : 0.0; }
  };

  /// Add one timed call of a section
  static void record(const std::string& key, duration d) {
    auto& t = instance_();
    std::lock_guard<std::mutex> lock(t.mutex_);
    auto& r = t.d_[key];
    r.count++;
    r.total += d;
    r.min = std::min(r.min, d);
    r.max = std::max(r.max, d);
  }

  /**
   * @brief Get timing record for a specific key
   *
   * @throws std::runtime_error if key not found
   */
  static record_t get_record(const std::string& key) {
    auto& t = instance_();
    std::lock_guard<std::mutex> lock(t.mutex_);
    auto it = t.d_.find(key);
    if (it != t.d_.end()) return it->second;
    throw std::runtime_error("timer key: " + key + " not found");
  }

  /// Log all sections sorted by total time
  static void print_summary() {
    auto& t = instance_();
    std::lock_guard<std::mutex> lock(t.mutex_);
    std::vector<std::pair<std::string, record_t>> rows(t.d_.begin(),
                                                       t.d_.end());
    std::sort(rows.begin(), rows.end(), [](const auto& x, const auto& y) {
      return y.second.total < x.second.total;
    });
    spdlog::info("{:-^90}", "Performance Profile");
    spdlog::info("{:>12}{:>8}{:>12}{:>12}{:>12}  {}", "total(ms)", "calls",
                 "avg(ms)", "max(ms)", "min(ms)", "name");
    for (const auto& [k, r] : rows) {
      spdlog::info("{:>12.3f}{:>8}{:>12.3f}{:>12.3f}{:>12.3f}  {}",
                   r.total.count(), r.count, r.avg(), r.max.count(),
                   r.min.count(), k);
    }
    spdlog::info("{:-^90}", "");
  }

  /// Forget all records
  static void reset() {
    auto& t = instance_();
    std::lock_guard<std::mutex> lock(t.mutex_);
    t.d_.clear();
  }

 private:
  Timer() = default;

  static Timer& instance_() {
    static Timer t;
    return t;
  }

  std::mutex mutex_;
  std::unordered_map<std::string, record_t> d_;
};

/**
 * @brief RAII-style automatic timer
 *
 * @code
 * {
 *   AutoTimer timer("nmr::dia");
 *   // Code to time
 * }
 * @endcode
 */
class AutoTimer {
 public:
  explicit AutoTimer(std::string key)
      : key_(std::move(key)), start_(Timer::clock::now()) {}

  ~AutoTimer() { Timer::record(key_, Timer::clock::now() - start_); }

  AutoTimer(const AutoTimer&) = delete;
  AutoTimer& operator=(const AutoTimer&) = delete;

 private:
  std::string key_;
  Timer::clock::time_point start_;
};
}  // namespace relnmr
