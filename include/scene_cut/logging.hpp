/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase timings
 *
 * @note All logs go to stderr through fmt::print so that stdout stays free for
 *       the JSON documents the CLI prints. Every line is flushed immediately.
 *
 */

#ifndef SCENE_CUT_LOGGING_HPP
#define SCENE_CUT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace scene_cut {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by SCENE_CUT_ENABLE_LOGGING at compile time.
 */
#ifndef SCENE_CUT_ENABLE_LOGGING
#define SCENE_CUT_ENABLE_LOGGING 1
#endif

#ifndef SCENE_CUT_ENABLE_TIMING
#define SCENE_CUT_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if SCENE_CUT_ENABLE_LOGGING
/// One locked, flushed line on stderr; every LOG_* macro expands to this
#define SCENE_CUT_LOG(style, prefix, format_str, ...)                          \
  do {                                                                         \
    std::lock_guard<std::mutex> scene_cut_log_lock(scene_cut::log_mutex);      \
    fmt::print(stderr, style, prefix format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  SCENE_CUT_LOG(fmt::text_style(), "[INFO] ", format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  SCENE_CUT_LOG(fg(fmt::color::yellow), "[WARN] ", format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  SCENE_CUT_LOG(fg(fmt::color::red), "[ERROR] ", format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  SCENE_CUT_LOG(fg(fmt::color::cyan), "", format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  SCENE_CUT_LOG(fg(fmt::color::green), "", format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Function or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 * @note Batch workers record here concurrently.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table on stderr.
   */
  static void print_summary();

  /**
   * @brief Snapshot of the collected entries.
   */
  static std::vector<TimingEntry> snapshot();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if SCENE_CUT_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    scene_cut::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace scene_cut

#endif // SCENE_CUT_LOGGING_HPP
