/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "hls_variants/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace hls_variants {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  long total_us = 0;
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== BUILD TIMINGS ==================\n");
  fmt::print("{:<30} {:>20}\n", "Variant", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
    total_us += e.microseconds;
  }
  fmt::print("{:-<30} {:-<20}\n", "", "");
  fmt::print("{:<30} {:>10} [{:.2f}s]\n", "total", total_us,
             total_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "===================================================\n");
  std::fflush(stdout);
}

} // namespace hls_variants
