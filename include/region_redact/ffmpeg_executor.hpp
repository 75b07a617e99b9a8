/**
 * @file ffmpeg_executor.hpp
 * @brief Audio reattachment through the external ffmpeg tool
 *
 * @details Second stage of a job. Consumes the SilentVideoArtifact written
 *          by the encode stage and produces the final output file:
 *
 *          - audio removed: the artifact is moved to the output path
 *
 *          - audio preserved: ffmpeg extracts the original audio track into
 *            an AudioArtifact, then muxes it with the silent video
 *
 * @note The tool is reached through the ToolRunner interface so that the
 *       command sequence can be observed without spawning ffmpeg.
 */

#ifndef REGION_REDACT_FFMPEG_EXECUTOR_HPP
#define REGION_REDACT_FFMPEG_EXECUTOR_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "process_runner.hpp"
#include "types.hpp"
#include "workspace.hpp"

namespace region_redact {

/**
 * @class ToolRunner
 * @brief Executes one transcoder invocation.
 */
class ToolRunner {
public:
  virtual ~ToolRunner() = default;

  /**
   * @brief Run the tool with the given arguments (tool path excluded).
   */
  virtual ProcessResult run(const std::vector<std::string> &args) = 0;
};

/**
 * @class FfmpegRunner
 * @brief ToolRunner that spawns a located ffmpeg binary.
 */
class FfmpegRunner : public ToolRunner {
public:
  FfmpegRunner(std::filesystem::path ffmpeg, ProcessOptions options)
      : ffmpeg_(std::move(ffmpeg)), options_(options) {}

  ProcessResult run(const std::vector<std::string> &args) override;

  const std::filesystem::path &binary() const { return ffmpeg_; }

private:
  std::filesystem::path ffmpeg_;
  ProcessOptions options_;
};

/**
 * @brief Arguments for extracting the audio track to AAC @ AUDIO_BITRATE.
 */
std::vector<std::string> extract_audio_args(const std::filesystem::path &input,
                                            const AudioArtifact &audio);

/**
 * @brief Arguments for muxing silent video and extracted audio.
 * @note Re-encodes video (libx264, crf 23, preset medium) and maps exactly
 *       stream 0:v:0 and 1:a:0.
 */
std::vector<std::string> mux_audio_args(const SilentVideoArtifact &video,
                                        const AudioArtifact &audio,
                                        const MuxedVideoArtifact &muxed);

/**
 * @brief Move a file, falling back to copy + remove across file systems.
 * @throws RedactError Filesystem
 */
void move_file(const std::filesystem::path &from,
               const std::filesystem::path &to);

/**
 * @class AudioReattacher
 * @brief Turns a silent video artifact into the final output file.
 */
class AudioReattacher {
public:
  using StageCallback = std::function<void(JobState)>;

  /**
   * @param remove_audio true selects the direct-move policy
   * @param runner Tool runner, may be nullptr only when remove_audio is true
   */
  AudioReattacher(bool remove_audio, ToolRunner *runner)
      : remove_audio_(remove_audio), runner_(runner) {}

  /**
   * @brief Produce the output file.
   *
   * @param video Silent video from the encode stage
   * @param audio Workspace slot for the extracted audio
   * @param muxed Workspace slot ffmpeg writes the muxed file into
   * @param input Original input (audio source)
   * @param output Final output path
   * @param on_stage Notified on DIRECT_MOVE / AUDIO_EXTRACT / AUDIO_MUX
   *
   * @throws RedactError AudioExtractFailed, AudioMuxFailed, Filesystem,
   *         ToolNotFound
   * @attention The audio artifact is removed before returning on every
   *            path. Output only appears by a move of a finished file, so
   *            an interrupted mux never leaves anything at output.
   */
  void finalize(const SilentVideoArtifact &video, const AudioArtifact &audio,
                const MuxedVideoArtifact &muxed,
                const std::filesystem::path &input,
                const std::filesystem::path &output,
                const StageCallback &on_stage = {});

private:
  bool remove_audio_;
  ToolRunner *runner_;
};

} // namespace region_redact

#endif // REGION_REDACT_FFMPEG_EXECUTOR_HPP
