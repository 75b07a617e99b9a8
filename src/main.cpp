/**
 * @file main.cpp
 * @brief Entry point for the Region Redact batch tool
 *
 * @details Main entry point that handles:
 *
 *          - Settings file loading (first argument or
 *            <exe_dir>/config/settings.ini)
 *
 *          - Log file and debug switch from the environment
 *
 *          - ffmpeg discovery when audio is preserved
 *
 *          - Workspace root lifetime and the sequential batch run
 *
 * @note Exit codes: 0 normal completion (per-file failures included),
 *       1 startup failure, 130 cancelled by SIGINT/SIGTERM.
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "region_redact/batch_processor.hpp"
#include "region_redact/config.hpp"
#include "region_redact/errors.hpp"
#include "region_redact/ffmpeg_executor.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/system.hpp"
#include "region_redact/workspace.hpp"

using namespace region_redact;

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_STARTUP_FAILURE = 1;
constexpr int EXIT_CANCELLED = 130;

/// Relative log paths live next to the executable
void setup_log_file(const fs::path &exe_dir) {
  std::string configured = Config::log_file();
  if (configured.empty())
    return;

  fs::path log_path(configured);
  if (log_path.is_relative())
    log_path = exe_dir / log_path;

  if (!open_log_file(log_path.string())) {
    LOG_WARN("Cannot open log file {}, logging to stdout only",
             log_path.string());
  }
}

int run(int argc, char *argv[]) {
  fs::path exe_dir = executable_dir();
  setup_log_file(exe_dir);
  set_debug_logging(Config::debug_logging());

  fs::path settings_path = (argc > 1)
                               ? fs::path(argv[1])
                               : exe_dir / "config" / "settings.ini";

  LOG_INFO("Region Redact - Batch Mode");
  LOG_INFO("Settings: {}", settings_path.string());

  Settings settings = load_settings(settings_path, exe_dir);

  LOG_INFO("Input directory: {}", settings.input_dir.string());
  LOG_INFO("Output directory: {}", settings.output_dir.string());

  // **---- TOOLING ----**

  std::unique_ptr<FfmpegRunner> runner;
  if (!settings.remove_audio) {
    fs::path ffmpeg = locate_ffmpeg(exe_dir);
    LOG_INFO("ffmpeg: {}", ffmpeg.string());

    ProcessOptions options;
    options.timeout = std::chrono::seconds(Config::tool_timeout_sec());
    options.cancel = &cancel_flag();
    runner = std::make_unique<FfmpegRunner>(ffmpeg, options);
  } else {
    LOG_INFO("Audio removal enabled, ffmpeg not required");
  }

  // **---- DISCOVERY ----**

  std::vector<VideoFile> files =
      discover_video_files(settings.input_dir, settings.formats);
  LOG_INFO("Found {} video files", files.size());

  std::error_code ec;
  fs::create_directories(settings.output_dir, ec);
  if (ec) {
    throw RedactError(ErrorCode::Filesystem,
                      fmt::format("Cannot create output directory {}: {}",
                                  settings.output_dir.string(),
                                  ec.message()));
  }

  // **---- BATCH ----**

  BatchResult batch;
  bool cancelled = false;
  {
    WorkspaceRoot root(settings.output_dir);
    BatchProcessor processor(settings, root, runner.get(), &cancel_flag());
    batch = processor.process(files);
    cancelled = processor.cancelled() || cancel_flag().load();
  }

  if (Config::desktop_notify()) {
    notify_completion("Region Redact",
                      fmt::format("Processing complete: {}/{} succeeded",
                                  batch.succeeded, batch.total));
  }

  if (cancelled) {
    LOG_WARN("Run cancelled by signal");
    return EXIT_CANCELLED;
  }
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  install_signal_handlers();

  int status = EXIT_STARTUP_FAILURE;
  try {
    status = run(argc, argv);
  } catch (const RedactError &e) {
    LOG_ERROR("{}: {}", to_string(e.code()), e.what());
    status = (e.code() == ErrorCode::Cancelled) ? EXIT_CANCELLED
                                                : EXIT_STARTUP_FAILURE;
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected error: {}", e.what());
    status = EXIT_STARTUP_FAILURE;
  }

  close_log_file();
  return status;
}
