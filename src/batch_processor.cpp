/**
 * @file batch_processor.cpp
 * @brief Sequential batch processing implementation
 *
 * @details Implements discovery and the BatchProcessor loop:
 *
 *          - Case-insensitive extension filter over regular files
 *
 *          - Job-prefixed progress logging
 *
 *          - Summary table and completion line
 */

#include "region_redact/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/pipeline.hpp"
#include "region_redact/system.hpp"

namespace region_redact {

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

} // anonymous namespace

// **---- Discovery ----**

std::vector<VideoFile>
discover_video_files(const fs::path &dir,
                     const std::vector<std::string> &extensions) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw RedactError(ErrorCode::DirectoryNotFound,
                      fmt::format("Input directory not found: {}",
                                  dir.string()));
  }

  std::vector<VideoFile> files;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw RedactError(ErrorCode::DirectoryNotFound,
                      fmt::format("Cannot read {}: {}", dir.string(),
                                  ec.message()));
  }

  for (const auto &entry : it) {
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec))
      continue;

    std::string ext = lower_extension(entry.path());
    if (std::find(extensions.begin(), extensions.end(), ext) ==
        extensions.end()) {
      LOG_DEBUG("Skipping {}", entry.path().filename().string());
      continue;
    }
    LOG_DEBUG("Accepted {}", entry.path().filename().string());
    files.push_back({entry.path(), ext});
  }

  std::sort(files.begin(), files.end(),
            [](const VideoFile &a, const VideoFile &b) {
              return a.path < b.path;
            });

  LOG_DEBUG("Discovered {} candidate files in {}", files.size(),
            dir.string());
  return files;
}

// **---- BatchProcessor ----**

BatchProcessor::BatchProcessor(Settings settings, const WorkspaceRoot &root,
                               ToolRunner *runner,
                               const std::atomic<bool> *cancel,
                               const CodecTable &codecs)
    : settings_(std::move(settings)), root_(root), runner_(runner),
      cancel_(cancel), codecs_(codecs) {}

BatchResult BatchProcessor::process(const std::vector<VideoFile> &files) {
  BatchResult batch;
  batch.total = static_cast<int>(files.size());
  cancelled_ = false;

  if (files.empty()) {
    LOG_WARN("No video files to process");
    LOG_INFO("Processing complete: 0/0 succeeded");
    return batch;
  }

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Files to process: {}", batch.total);
  LOG_INFO("Output directory: {}", settings_.output_dir.string());
  LOG_INFO("Region: x={} y={} {}x{}", settings_.region.x, settings_.region.y,
           settings_.region.width, settings_.region.height);
  LOG_INFO("Blur kernel: {} sigma: {}", settings_.blur.kernel_size,
           settings_.blur.sigma);
  LOG_INFO("Audio: {}", settings_.remove_audio ? "removed" : "preserved");
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  int ordinal = 0;
  for (const auto &file : files) {
    if (cancel_ && cancel_->load()) {
      LOG_WARN("Cancelled, {} files not started", batch.total - ordinal);
      cancelled_ = true;
      break;
    }
    ++ordinal;

    LOG_PHASE("[Job {}] ----------------------------------------", ordinal);
    LOG_INFO("[Job {}] Processing: {}", ordinal, file.filename());
    LOG_INFO("[Job {}] Progress: {}/{}", ordinal, ordinal, batch.total);

    RedactionJob job(file, settings_.output_dir / file.path.filename(),
                     settings_, root_, ordinal, runner_, cancel_, codecs_);
    JobResult result = job.run();

    if (result.success()) {
      ++batch.succeeded;
      LOG_SUCCESS("[Job {}] Done: {} ({} frames, {})", ordinal,
                  result.filename, result.frames_written,
                  format_time(result.processing_time_us / 1000000.0));
    }
    batch.results.push_back(std::move(result));

    TimingCollector::print_summary();
    TimingCollector::clear();

    if (cancel_ && cancel_->load()) {
      cancelled_ = true;
      break;
    }
  }

  auto batch_end = std::chrono::high_resolution_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  print_batch_summary(batch, elapsed_sec);
  return batch;
}

void BatchProcessor::print_batch_summary(const BatchResult &batch,
                                         double wall_clock_sec) {
  int processed = static_cast<int>(batch.results.size());
  int failed = processed - batch.succeeded;
  long total_time_us = 0;
  for (const auto &result : batch.results) {
    total_time_us += result.processing_time_us;
  }

  {
    std::lock_guard<std::mutex> lock(log_mutex);
    fmt::print("\n");
    fmt::print(fg(fmt::color::cyan),
               "============== BATCH PROCESSING SUMMARY ==============\n");
    fmt::print("{:<25} {:>25}\n", "Total files:", batch.total);
    fmt::print("{:<25} {:>25}\n", "Processed:", processed);
    fmt::print("{:<25} {:>25}\n", "Successful:", batch.succeeded);
    fmt::print("{:<25} {:>25}\n", "Failed:", failed);
    fmt::print("{:<25} {:>25}\n", "Wall-clock time:",
               format_time(wall_clock_sec));
    if (processed > 0) {
      fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:",
                 total_time_us / 1000000.0 / processed);
    }
    fmt::print(fg(fmt::color::cyan),
               "======================================================\n");

    if (failed > 0) {
      fmt::print(fg(fmt::color::red), "\nFailed files:\n");
      for (const auto &result : batch.results) {
        if (!result.success()) {
          fmt::print(fg(fmt::color::red), "  - {} [{}] {}\n", result.filename,
                     to_string(result.failed_stage), result.error);
        }
      }
    }
    std::fflush(stdout);
  }

  if (failed == 0 && !cancelled_) {
    LOG_SUCCESS("Processing complete: {}/{} succeeded", batch.succeeded,
                batch.total);
  } else {
    LOG_INFO("Processing complete: {}/{} succeeded", batch.succeeded,
             batch.total);
  }
}

} // namespace region_redact
