/**
 * @file system.hpp
 * @brief System utilities: tool discovery, signals, notifications
 *
 * @details Provides:
 *
 *          - Executable directory lookup (base for relative settings paths)
 *
 *          - ffmpeg binary discovery and execute permission fix-up
 *
 *          - Run-level cancellation flag wired to SIGINT/SIGTERM
 *
 *          - Desktop completion notification
 *
 *          - Time formatting utilities
 *
 * @note Linux-specific (/proc/self/exe, notify-send).
 */

#ifndef REGION_REDACT_SYSTEM_HPP
#define REGION_REDACT_SYSTEM_HPP

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace region_redact {

// **---- Paths ----**

/**
 * @brief Directory containing the running executable.
 * @note Falls back to the current working directory if /proc is unavailable.
 */
std::filesystem::path executable_dir();

// **---- Tool Discovery ----**

/**
 * @brief Candidate ffmpeg locations in search order.
 *
 * @note Order:
 *
 *        - FFMPEG_BIN environment variable
 *
 *        - `<exe_dir>/ffmpeg/linux/ffmpeg` (bundled binary)
 *
 *        - `/usr/local/bin/ffmpeg`
 *
 *        - every directory of PATH
 */
std::vector<std::filesystem::path>
ffmpeg_candidates(const std::filesystem::path &exe_dir);

/**
 * @brief Locate the ffmpeg binary and make sure it is executable.
 * @throws RedactError ToolNotFound if no candidate exists
 */
std::filesystem::path locate_ffmpeg(const std::filesystem::path &exe_dir);

/**
 * @brief Add the owner/group/other execute bits when the owner bit is
 *        missing.
 * @return false if permissions could not be changed
 */
bool ensure_executable(const std::filesystem::path &path);

// **---- Cancellation ----**

/// Process-wide cancellation flag, polled by external tool calls
std::atomic<bool> &cancel_flag();

/// Install SIGINT/SIGTERM handlers that set cancel_flag()
void install_signal_handlers();

// **---- Notification ----**

/**
 * @brief Send a desktop notification through notify-send.
 * @note Best effort: failures are logged as warnings only.
 */
void notify_completion(const std::string &title, const std::string &message);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string like "01:23:45"
 */
std::string format_time(double seconds);

} // namespace region_redact

#endif // REGION_REDACT_SYSTEM_HPP
