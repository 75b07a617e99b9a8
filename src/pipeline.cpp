/**
 * @file pipeline.cpp
 * @brief Per-file redaction job implementation
 *
 * @details Orchestrates one file:
 *
 *          1. Check output placement
 *
 *          2. Open the decoder, read the first frame, check the region
 *
 *          3. Open the writer in the job workspace, transform and encode
 *             every frame until end of stream
 *
 *          4. Hand the silent video to the AudioReattacher
 *
 * @note All log lines carry a [Job N] prefix.
 */

#include "region_redact/pipeline.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "region_redact/ffmpeg_executor.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/region_transform.hpp"

namespace region_redact {

namespace fs = std::filesystem;

// **---- Constructor ----**

RedactionJob::RedactionJob(VideoFile input, fs::path output_path,
                           Settings settings, const WorkspaceRoot &root,
                           int ordinal, ToolRunner *runner,
                           const std::atomic<bool> *cancel,
                           const CodecTable &codecs)
    : input_(std::move(input)), output_path_(std::move(output_path)),
      settings_(std::move(settings)), root_(root), ordinal_(ordinal),
      runner_(runner), cancel_(cancel), codecs_(codecs) {}

// **---- State Handling ----**

void RedactionJob::set_state(JobState next) {
  if (next == state_)
    return;
  LOG_DEBUG("[Job {}] {} -> {}", ordinal_, to_string(state_),
            to_string(next));
  state_ = next;
  if (next != JobState::Failed)
    last_active_ = next;
}

void RedactionJob::remove_partial_output() {
  if (!output_claimed_)
    return;
  std::error_code ec;
  if (fs::exists(output_path_, ec)) {
    fs::remove(output_path_, ec);
    if (ec) {
      LOG_ERROR("[Job {}] Cannot remove partial output {}: {}", ordinal_,
                output_path_.string(), ec.message());
    } else {
      LOG_INFO("[Job {}] Removed partial output {}", ordinal_,
               output_path_.filename().string());
    }
  }
}

void RedactionJob::fail(JobResult &result, ErrorCode code,
                        const std::string &message) {
  set_state(JobState::Failed);
  result.state = JobState::Failed;
  result.failed_stage = last_active_;
  result.error = message;
  result.error_code = code;
  remove_partial_output();
  LOG_ERROR("[Job {}] Failed {} during {} ({}): {}", ordinal_,
            input_.filename(), to_string(last_active_), to_string(code),
            message);
}

// **---- Main Processing ----**

JobResult RedactionJob::run() {
  auto start_time = std::chrono::high_resolution_clock::now();
  TIMER_START(job_total);

  JobResult result;
  result.filename = input_.filename();

  try {
    prepare_output();

    JobWorkspace workspace(root_, ordinal_, input_.path.stem().string());
    SilentVideoArtifact silent = workspace.silent_video(input_.filename());

    TIMER_START(encode_video);
    result.frames_written = encode_silent_video(silent);
    TIMER_END(encode_video);

    AudioReattacher reattacher(settings_.remove_audio, runner_);
    reattacher.finalize(silent, workspace.audio(),
                        workspace.muxed_video(input_.filename()), input_.path,
                        output_path_, [this](JobState s) { set_state(s); });

    workspace.purge();
    set_state(JobState::Done);
    result.state = JobState::Done;
  } catch (const RedactError &e) {
    fail(result, e.code(), e.what());
  } catch (const std::exception &e) {
    /// filesystem_error, cv::Exception and the like are isolated the same way
    fail(result, ErrorCode::Unexpected, e.what());
  }

  TIMER_END(job_total);
  auto end_time = std::chrono::high_resolution_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                            start_time)
          .count();
  return result;
}

void RedactionJob::prepare_output() {
  std::error_code ec;
  if (fs::exists(output_path_, ec)) {
    if (!settings_.overwrite) {
      throw RedactError(ErrorCode::OutputExists,
                        fmt::format("Output already exists: {}",
                                    output_path_.string()));
    }
    fs::remove(output_path_, ec);
    if (ec) {
      throw RedactError(ErrorCode::Filesystem,
                        fmt::format("Cannot replace {}: {}",
                                    output_path_.string(), ec.message()));
    }
    LOG_INFO("[Job {}] Overwriting existing output", ordinal_);
  }
  output_claimed_ = true;
}

long RedactionJob::encode_silent_video(const SilentVideoArtifact &artifact) {
  // **----- DECODING -----**

  set_state(JobState::Decoding);
  VideoReader reader;
  if (!reader.open(input_.path.string())) {
    throw RedactError(ErrorCode::CannotOpenSource,
                      fmt::format("Cannot open source: {}",
                                  reader.last_error()));
  }

  cv::Mat frame;
  ReadStatus status = reader.read(frame);
  if (status != ReadStatus::Frame) {
    throw RedactError(
        ErrorCode::CannotOpenSource,
        fmt::format("No decodable video frame: {}",
                    status == ReadStatus::Error ? reader.last_error()
                                                : "empty stream"));
  }

  /// Geometry is constant within a file, the first frame decides
  check_region_bounds(settings_.region, frame.cols, frame.rows);

  LOG_INFO("[Job {}] {}x{} @ {:.2f}fps, {} frames declared", ordinal_,
           frame.cols, frame.rows, reader.fps(), reader.frame_count());

  // **----- ENCODING SETUP -----**

  VideoWriter writer(codecs_);
  int64_t bitrate = compute_target_bitrate(artifact.path, reader.bitrate());
  writer.open(artifact.path.string(), frame.cols, frame.rows, reader.fps(),
              bitrate);

  // **----- FRAME LOOP -----**

  /// Never read past a count the container declares
  const int64_t limit =
      reader.frame_count_declared() ? reader.frame_count() : 0;

  long written = 0;
  while (true) {
    if (cancel_ && cancel_->load()) {
      throw RedactError(ErrorCode::Cancelled,
                        fmt::format("Cancelled after {} frames", written));
    }

    set_state(JobState::Transforming);
    apply_redaction(frame, settings_.region, settings_.blur);

    set_state(JobState::Encoding);
    writer.write(frame);
    ++written;
    if (limit > 0 && written >= limit)
      break;

    status = reader.read(frame);
    if (status == ReadStatus::EndOfStream)
      break;
    if (status == ReadStatus::Error) {
      LOG_WARN("[Job {}] Decode stopped after {} frames: {}", ordinal_,
               written, reader.last_error());
      break;
    }
  }

  if (limit > 0 && written < limit) {
    LOG_DEBUG("[Job {}] Stream ended at {} of {} declared frames", ordinal_,
              written, limit);
  }

  writer.close();
  reader.close();

  LOG_INFO("[Job {}] Encoded {} frames with {}", ordinal_, written,
           writer.encoder_name());
  return written;
}

} // namespace region_redact
