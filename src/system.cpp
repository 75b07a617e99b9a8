/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - ffmpeg discovery (environment, bundled copy, system paths)
 *
 *          - Execute permission fix-up for bundled binaries
 *
 *          - Signal driven cancellation flag
 *
 *          - Desktop notification and time formatting
 */

#include "region_redact/system.hpp"

#include <csignal>
#include <cstdlib>
#include <system_error>

#include <fmt/core.h>

#include "region_redact/config.hpp"
#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/process_runner.hpp"

namespace region_redact {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::atomic<bool> g_cancel{false};

void handle_signal(int) { g_cancel.store(true); }

/// Split a PATH-style string on ':'
std::vector<fs::path> split_path_list(const std::string &list) {
  std::vector<fs::path> dirs;
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t end = list.find(':', pos);
    if (end == std::string::npos)
      end = list.size();
    if (end > pos)
      dirs.emplace_back(list.substr(pos, end - pos));
    pos = end + 1;
  }
  return dirs;
}

} // anonymous namespace

// **---- Paths ----**

fs::path executable_dir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec || exe.empty()) {
    return fs::current_path();
  }
  return exe.parent_path();
}

// **---- Tool Discovery ----**

std::vector<fs::path> ffmpeg_candidates(const fs::path &exe_dir) {
  std::vector<fs::path> candidates;

  std::string explicit_bin = Config::ffmpeg_bin();
  if (!explicit_bin.empty())
    candidates.emplace_back(explicit_bin);

  candidates.push_back(exe_dir / "ffmpeg" / "linux" / "ffmpeg");
  candidates.emplace_back("/usr/local/bin/ffmpeg");

  const char *path_env = std::getenv("PATH");
  if (path_env) {
    for (const auto &dir : split_path_list(path_env))
      candidates.push_back(dir / "ffmpeg");
  }
  return candidates;
}

bool ensure_executable(const fs::path &path) {
  std::error_code ec;
  fs::perms p = fs::status(path, ec).permissions();
  if (ec)
    return false;
  if ((p & fs::perms::owner_exec) != fs::perms::none)
    return true;

  fs::permissions(path,
                  fs::perms::owner_exec | fs::perms::group_exec |
                      fs::perms::others_exec,
                  fs::perm_options::add, ec);
  if (ec) {
    LOG_WARN("Cannot set execute permission on {}: {}", path.string(),
             ec.message());
    return false;
  }
  LOG_INFO("Granted execute permission to {}", path.string());
  return true;
}

fs::path locate_ffmpeg(const fs::path &exe_dir) {
  for (const auto &candidate : ffmpeg_candidates(exe_dir)) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec))
      continue;

    LOG_DEBUG("ffmpeg candidate found: {}", candidate.string());
    if (!ensure_executable(candidate))
      continue;
    return candidate;
  }

  throw RedactError(
      ErrorCode::ToolNotFound,
      fmt::format("ffmpeg binary not found (set FFMPEG_BIN or place it in {})",
                  (exe_dir / "ffmpeg" / "linux").string()));
}

// **---- Cancellation ----**

std::atomic<bool> &cancel_flag() { return g_cancel; }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = handle_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// **---- Notification ----**

void notify_completion(const std::string &title, const std::string &message) {
  ProcessOptions options;
  options.timeout = std::chrono::seconds(10);
  options.search_path = true;

  ProcessResult r = run_process({"notify-send", title, message}, options);
  if (!r.ok()) {
    LOG_WARN("Desktop notification failed: {}",
             r.spawn_failed ? r.output : fmt::format("exit {}", r.exit_code));
  }
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace region_redact
