/**
 * @file ffmpeg_executor.cpp
 * @brief Audio extraction and mux implementation
 */

#include "region_redact/ffmpeg_executor.hpp"

#include <system_error>

#include <fmt/core.h>

#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"

namespace region_redact {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Removes the extracted audio when the mux stage is left, on every path
class AudioCleanup {
public:
  explicit AudioCleanup(const AudioArtifact &audio) : audio_(audio) {}
  ~AudioCleanup() {
    std::error_code ec;
    fs::remove(audio_.path, ec);
    if (ec) {
      LOG_WARN("Cannot remove {}: {}", audio_.path.string(), ec.message());
    }
  }

  AudioCleanup(const AudioCleanup &) = delete;
  AudioCleanup &operator=(const AudioCleanup &) = delete;

private:
  const AudioArtifact &audio_;
};

/// Last non-empty line of tool output, ffmpeg puts the cause there
std::string last_line(const std::string &output) {
  size_t end = output.find_last_not_of("\r\n ");
  if (end == std::string::npos)
    return "";
  size_t begin = output.rfind('\n', end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return output.substr(begin, end - begin + 1);
}

std::string describe_failure(const ProcessResult &r) {
  if (r.spawn_failed)
    return r.output;
  if (r.timed_out)
    return "timed out";
  if (r.cancelled)
    return "cancelled";
  std::string cause = last_line(r.output);
  return cause.empty() ? fmt::format("exit code {}", r.exit_code)
                       : fmt::format("exit code {}: {}", r.exit_code, cause);
}

} // anonymous namespace

// **---- FfmpegRunner ----**

ProcessResult FfmpegRunner::run(const std::vector<std::string> &args) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(ffmpeg_.string());
  argv.insert(argv.end(), args.begin(), args.end());

  LOG_DEBUG("Running: {}", format_command(argv));
  return run_process(argv, options_);
}

// **---- Command Builders ----**

std::vector<std::string> extract_audio_args(const fs::path &input,
                                            const AudioArtifact &audio) {
  return {"-y",      "-hide_banner", "-loglevel",   "error",
          "-i",      input.string(), "-vn",         "-acodec",
          "aac",     "-b:a",         AUDIO_BITRATE, audio.path.string()};
}

std::vector<std::string> mux_audio_args(const SilentVideoArtifact &video,
                                        const AudioArtifact &audio,
                                        const MuxedVideoArtifact &muxed) {
  return {"-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-i",
          video.path.string(),
          "-i",
          audio.path.string(),
          "-c:v",
          "libx264",
          "-crf",
          "23",
          "-preset",
          "medium",
          "-c:a",
          "aac",
          "-b:a",
          AUDIO_BITRATE,
          "-map",
          "0:v:0",
          "-map",
          "1:a:0",
          muxed.path.string()};
}

// **---- File Move ----**

void move_file(const fs::path &from, const fs::path &to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec)
    return;

  /// EXDEV: workspace and output on different file systems
  LOG_DEBUG("rename {} -> {} failed ({}), copying", from.string(),
            to.string(), ec.message());
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(to, rm_ec);
    throw RedactError(ErrorCode::Filesystem,
                      fmt::format("Cannot move {} to {}: {}", from.string(),
                                  to.string(), ec.message()));
  }
  fs::remove(from, ec);
  if (ec) {
    LOG_WARN("Copied {} but cannot remove it: {}", from.string(),
             ec.message());
  }
}

// **---- AudioReattacher ----**

void AudioReattacher::finalize(const SilentVideoArtifact &video,
                               const AudioArtifact &audio,
                               const MuxedVideoArtifact &muxed,
                               const fs::path &input, const fs::path &output,
                               const StageCallback &on_stage) {
  if (remove_audio_) {
    if (on_stage)
      on_stage(JobState::DirectMove);
    move_file(video.path, output);
    return;
  }

  if (!runner_) {
    throw RedactError(ErrorCode::ToolNotFound,
                      "Audio reattachment requires ffmpeg");
  }

  AudioCleanup cleanup(audio);

  // **--- EXTRACT ---**

  if (on_stage)
    on_stage(JobState::AudioExtract);
  TIMER_START(audio_extract);
  ProcessResult extract = runner_->run(extract_audio_args(input, audio));
  TIMER_END(audio_extract);
  if (!extract.ok()) {
    throw RedactError(ErrorCode::AudioExtractFailed,
                      fmt::format("Audio extraction failed: {}",
                                  describe_failure(extract)));
  }

  // **--- MUX ---**

  if (on_stage)
    on_stage(JobState::AudioMux);
  TIMER_START(audio_mux);
  ProcessResult mux = runner_->run(mux_audio_args(video, audio, muxed));
  TIMER_END(audio_mux);
  if (!mux.ok()) {
    std::error_code ec;
    fs::remove(muxed.path, ec);
    throw RedactError(ErrorCode::AudioMuxFailed,
                      fmt::format("Audio mux failed: {}",
                                  describe_failure(mux)));
  }

  /// Workspace sits under the output directory, so this is a rename
  move_file(muxed.path, output);
}

} // namespace region_redact
