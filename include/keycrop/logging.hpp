/**
 * @file logging.hpp
 * @brief Logging macros and per-phase timing
 *
 * @details LOG_* print through fmt under one process-wide mutex so that
 *          lines from concurrent jobs never interleave. INFO, PHASE and
 *          SUCCESS go to stdout; WARN and ERROR go to stderr. Each line is
 *          flushed as soon as it is written.
 *
 *          JOB_LOG_* prefix a line with "[Job N]".
 *
 *          TIMER_START / TIMER_END measure a scope and add the duration to
 *          the TimingCollector under the timer's name.
 *
 * @note ENABLE_LOGGING=0 and ENABLE_TIMING=0 compile the macros out.
 */

#ifndef KEYCROP_LOGGING_HPP
#define KEYCROP_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

namespace keycrop {

/// Serializes all console output (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define KEYCROP_LOG_TO(stream, style, format_str, ...)                         \
  do {                                                                         \
    std::lock_guard<std::mutex> keycrop_log_lock(keycrop::log_mutex);          \
    fmt::print(stream, style, format_str "\n", ##__VA_ARGS__);                 \
    std::fflush(stream);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  KEYCROP_LOG_TO(stdout, fmt::text_style(), "[INFO] " format_str,              \
                 ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  KEYCROP_LOG_TO(stderr, fg(fmt::color::yellow), "[WARN] " format_str,         \
                 ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  KEYCROP_LOG_TO(stderr, fg(fmt::color::red), "[ERROR] " format_str,           \
                 ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  KEYCROP_LOG_TO(stdout, fg(fmt::color::cyan), format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  KEYCROP_LOG_TO(stdout, fg(fmt::color::green), format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

#define JOB_LOG_INFO(job_id, format_str, ...)                                  \
  LOG_INFO("[Job {}] " format_str, job_id, ##__VA_ARGS__)
#define JOB_LOG_WARN(job_id, format_str, ...)                                  \
  LOG_WARN("[Job {}] " format_str, job_id, ##__VA_ARGS__)
#define JOB_LOG_ERROR(job_id, format_str, ...)                                 \
  LOG_ERROR("[Job {}] " format_str, job_id, ##__VA_ARGS__)
#define JOB_LOG_PHASE(job_id, format_str, ...)                                 \
  LOG_PHASE("[Job {}] " format_str, job_id, ##__VA_ARGS__)

// **----- TIMING -----**

/**
 * @struct PhaseStats
 * @brief Aggregate of every measurement recorded under one phase name.
 */
struct PhaseStats {
  int count = 0;
  long total_us = 0;
  long max_us = 0;
};

/**
 * @class TimingCollector
 * @brief Process-wide, thread-safe phase timing table.
 * @note A batch records the same phases once per job, so measurements are
 *       folded into per-phase totals instead of being kept individually.
 */
class TimingCollector {
  static std::mutex mutex_;
  static std::map<std::string, PhaseStats> phases_;

public:
  static void record(const std::string &phase, long us);

  /// Phase table: runs, total, mean and worst case
  static void print_summary();

  static std::map<std::string, PhaseStats> snapshot();
  static void clear();
};

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  keycrop::TimingCollector::record(                                            \
      #name, static_cast<long>(                                                \
                 std::chrono::duration_cast<std::chrono::microseconds>(        \
                     std::chrono::steady_clock::now() - timer_start_##name)    \
                     .count()))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace keycrop

#endif // KEYCROP_LOGGING_HPP
