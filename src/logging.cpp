/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and verbosity flag
 *
 *          - TimingCollector static members and methods
 */

#include "snapmerge/logging.hpp"

#include <map>

extern "C" {
#include <libavutil/log.h>
}

namespace snapmerge {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;
std::atomic<bool> log_verbose{false};

void set_verbose(bool enabled) {
  log_verbose.store(enabled);
  /// Probing every entry makes FFmpeg chatty about files it rejects
  av_log_set_level(enabled ? AV_LOG_WARNING : AV_LOG_QUIET);
}

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

  struct Totals {
    int count = 0;
    long total_us = 0;
  };
  std::map<std::string, Totals> phases;
  for (const auto &e : entries) {
    auto &t = phases[e.name];
    t.count++;
    t.total_us += e.microseconds;
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<22} {:>6} {:>10} {:>10}\n", "Phase", "Count", "Total",
             "Mean");
  fmt::print("{:-<22} {:-<6} {:-<10} {:-<10}\n", "", "", "", "");

  for (const auto &p : phases) {
    double total_sec = p.second.total_us / 1000000.0;
    double mean_sec = total_sec / p.second.count;
    fmt::print("{:<22} {:>6} {:>9.2f}s {:>9.2f}s\n", p.first, p.second.count,
               total_sec, mean_sec);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace snapmerge
