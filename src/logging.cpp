/**
 * @file logging.cpp
 * @brief Console mutex and timing table
 */

#include "keycrop/logging.hpp"

#include <algorithm>

namespace keycrop {

std::mutex log_mutex;

std::mutex TimingCollector::mutex_;
std::map<std::string, PhaseStats> TimingCollector::phases_;

void TimingCollector::record(const std::string &phase, long us) {
  std::lock_guard<std::mutex> lock(mutex_);
  PhaseStats &s = phases_[phase];
  ++s.count;
  s.total_us += us;
  s.max_us = std::max(s.max_us, us);
}

void TimingCollector::print_summary() {
  std::map<std::string, PhaseStats> phases = snapshot();
  if (phases.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(fg(fmt::color::cyan),
             "\n=================== PHASE TIMINGS ===================\n");
  fmt::print("{:<20} {:>6} {:>10} {:>10} {:>10}\n", "Phase", "Runs",
             "Total (s)", "Mean (s)", "Max (s)");
  fmt::print("{:-<20} {:->6} {:->10} {:->10} {:->10}\n", "", "", "", "", "");
  for (const auto &entry : phases) {
    const PhaseStats &s = entry.second;
    double total = s.total_us / 1e6;
    fmt::print("{:<20} {:>6} {:>10.3f} {:>10.3f} {:>10.3f}\n", entry.first,
               s.count, total, total / s.count, s.max_us / 1e6);
  }
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");
  std::fflush(stdout);
}

std::map<std::string, PhaseStats> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  return phases_;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  phases_.clear();
}

} // namespace keycrop
