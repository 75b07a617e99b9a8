/**
 * @file pipeline.hpp
 * @brief Per-file redaction job
 *
 * @details The RedactionJob class runs one input file through:
 *
 *          1. Output placement check (overwrite policy)
 *
 *          2. Decode, region check on the first frame, transform, encode
 *             into a SilentVideoArtifact in the job workspace
 *
 *          3. Audio reattachment into the output directory
 *
 *          4. Workspace purge
 *
 * @note Every failure ends in JobState::Failed with the partial output
 *       removed. run() never throws.
 */

#ifndef REGION_REDACT_PIPELINE_HPP
#define REGION_REDACT_PIPELINE_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "video_codec.hpp"
#include "workspace.hpp"

namespace region_redact {

class ToolRunner;

/**
 * @class RedactionJob
 * @brief State machine for one input file.
 *
 * @attention STATES:
 *
 * PENDING -> DECODING -> TRANSFORMING -> ENCODING ->
 * (DIRECT_MOVE | AUDIO_EXTRACT -> AUDIO_MUX) -> DONE
 *
 * FAILED is reachable from every state.
 */
class RedactionJob {
public:
  /**
   * @brief Construct a job.
   * @param input Input file
   * @param output_path Final output path
   * @param settings Settings snapshot (copied)
   * @param root Run-level workspace root, must outlive the job
   * @param ordinal 1-based job number (log prefix, workspace name)
   * @param runner ffmpeg runner, may be nullptr when audio is removed
   * @param cancel Cancellation flag polled between frames (may be nullptr)
   * @param codecs Encoder table for the silent video
   */
  RedactionJob(VideoFile input, std::filesystem::path output_path,
               Settings settings, const WorkspaceRoot &root, int ordinal,
               ToolRunner *runner, const std::atomic<bool> *cancel = nullptr,
               const CodecTable &codecs = default_codec_table());

  /**
   * @brief Run the job to Done or Failed.
   * @return Result with final state, failing stage and cause
   */
  JobResult run();

  JobState state() const { return state_; }

private:
  /// Apply the overwrite policy; throws OutputExists
  void prepare_output();

  /// Decode + transform + encode; returns frames written
  long encode_silent_video(const SilentVideoArtifact &artifact);

  void set_state(JobState next);
  void remove_partial_output();
  void fail(JobResult &result, ErrorCode code, const std::string &message);

  VideoFile input_;
  std::filesystem::path output_path_;
  Settings settings_;
  const WorkspaceRoot &root_;
  int ordinal_;
  ToolRunner *runner_;
  const std::atomic<bool> *cancel_;
  const CodecTable &codecs_;

  JobState state_ = JobState::Pending;
  JobState last_active_ = JobState::Pending; //< Stage before Failed
  bool output_claimed_ = false; //< Output path is ours to delete on failure
};

} // namespace region_redact

#endif // REGION_REDACT_PIPELINE_HPP
