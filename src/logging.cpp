/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and the optional log file sink
 *
 *          - The single console/file emitter behind the LOG_* macros
 *
 *          - TimingCollector static members and methods
 */

#include "region_redact/logging.hpp"

#include <atomic>
#include <ctime>

#include <fmt/color.h>
#include <fmt/core.h>

namespace region_redact {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {

std::FILE *log_file = nullptr;
std::atomic<bool> debug_enabled{false};

} // anonymous namespace

bool open_log_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
  log_file = std::fopen(path.c_str(), "a");
  return log_file != nullptr;
}

void close_log_file() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
}

void write_log_file(const char *level, const std::string &message) {
  if (!log_file)
    return;

  std::time_t now = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  fmt::print(log_file, "{} [{}] {}\n", stamp, level, message);
  std::fflush(log_file);
}

void emit_log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  switch (level) {
  case LogLevel::Debug:
    fmt::print(fg(fmt::color::gray), "[DEBUG] {}\n", message);
    write_log_file("DEBUG", message);
    break;
  case LogLevel::Info:
    fmt::print("[INFO] {}\n", message);
    write_log_file("INFO", message);
    break;
  case LogLevel::Warn:
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", message);
    write_log_file("WARN", message);
    break;
  case LogLevel::Error:
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", message);
    write_log_file("ERROR", message);
    break;
  case LogLevel::Phase:
    fmt::print(fg(fmt::color::cyan), "{}\n", message);
    write_log_file("INFO", message);
    break;
  case LogLevel::Success:
    fmt::print(fg(fmt::color::green), "{}\n", message);
    write_log_file("INFO", message);
    break;
  }
  std::fflush(stdout);
}

void set_debug_logging(bool enabled) { debug_enabled.store(enabled); }

bool debug_logging_enabled() { return debug_enabled.load(); }

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty() || !debug_logging_enabled())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace region_redact
