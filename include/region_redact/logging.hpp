/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Optional mirroring of every log line into a log file
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector for aggregating per-job phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately. File lines carry a timestamp and no colour codes.
 *
 */

#ifndef REGION_REDACT_LOGGING_HPP
#define REGION_REDACT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace region_redact {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Open (append) a file that receives a copy of every log line.
 * @param path Log file path
 * @return true on success
 */
bool open_log_file(const std::string &path);

/// Close the log file if one is open.
void close_log_file();

/**
 * @brief Append one timestamped line to the log file.
 * @attention Caller must hold log_mutex. No-op when no file is open.
 */
void write_log_file(const char *level, const std::string &message);

/// Runtime switch for LOG_DEBUG output.
void set_debug_logging(bool enabled);
bool debug_logging_enabled();

// **----- LOGGING MACROS -----**

/**
 * @enum LogLevel
 * @brief Console style and file tag of a log line.
 *
 * @note Phase and Success lines are tagged INFO in the log file.
 */
enum class LogLevel { Debug, Info, Warn, Error, Phase, Success };

/**
 * @brief Print one formatted line to stdout and mirror it to the log file.
 * @attention Takes log_mutex; do not call while holding it.
 */
void emit_log(LogLevel level, const std::string &message);

#if ENABLE_LOGGING
#define REGION_REDACT_LOG_(level, format_str, ...)                             \
  region_redact::emit_log(region_redact::LogLevel::level,                      \
                          fmt::format(format_str, ##__VA_ARGS__))

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (region_redact::debug_logging_enabled())                                \
      REGION_REDACT_LOG_(Debug, format_str, ##__VA_ARGS__);                    \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  REGION_REDACT_LOG_(Info, format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  REGION_REDACT_LOG_(Warn, format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  REGION_REDACT_LOG_(Error, format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  REGION_REDACT_LOG_(Phase, format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  REGION_REDACT_LOG_(Success, format_str, ##__VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Singleton for collecting per-job phase timings.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   * @note Only printed when debug logging is enabled.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called between files in batch mode.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    region_redact::TimingCollector::record(#name, timer_duration_##name);      \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace region_redact

#endif // REGION_REDACT_LOGGING_HPP
