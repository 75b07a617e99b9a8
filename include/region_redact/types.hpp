/**
 * @file types.hpp
 * @brief Core data types and constants for Region Redact
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Encoder and audio constants
 *
 *          - Region and BlurParameters for the per-frame transform
 *
 *          - VideoFile for discovered inputs
 *
 *          - JobState, JobResult and BatchResult for the orchestrator
 */

#ifndef REGION_REDACT_TYPES_HPP
#define REGION_REDACT_TYPES_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "region_redact/errors.hpp"

namespace region_redact {

// **----- CONSTANTS -----**

/// Lower bound for the .mp4 target bitrate (bits/s)
constexpr int64_t MIN_MP4_BITRATE = 500000;

/// .mp4 target bitrate when the source does not declare one (bits/s)
constexpr int64_t DEFAULT_MP4_BITRATE = 1000000;

/// Audio bitrate used for both extraction and mux (ffmpeg notation)
constexpr const char *AUDIO_BITRATE = "128k";

/// Pixelation factor: the blurred region is down-sampled by this on each axis
constexpr int PIXELATE_FACTOR = 4;

/// Name of the run-level workspace directory under the output directory
constexpr const char *WORKSPACE_DIR_NAME = "_video_temp";

// **----- DATA STRUCTURES -----**

/**
 * @struct Region
 * @brief Redaction rectangle in frame coordinates.
 */
struct Region {
  int x = 0;      //< Left edge
  int y = 0;      //< Top edge
  int width = 0;  //< Width in pixels
  int height = 0; //< Height in pixels
};

/**
 * @struct BlurParameters
 * @brief Gaussian blur parameters.
 * @note kernel_size is validated (positive, odd) when settings are loaded.
 */
struct BlurParameters {
  int kernel_size = 55; //< Square kernel size
  int sigma = 0;        //< 0 = derive from kernel size
};

/**
 * @struct VideoFile
 * @brief A discovered input file. Identity is the path.
 */
struct VideoFile {
  std::filesystem::path path; //< Absolute path
  std::string extension;      //< Lower-cased, dot-prefixed

  std::string filename() const { return path.filename().string(); }
};

/**
 * @enum JobState
 * @brief States of a single redaction job.
 */
enum class JobState {
  Pending,
  Decoding,
  Transforming,
  Encoding,
  DirectMove,
  AudioExtract,
  AudioMux,
  Done,
  Failed
};

const char *to_string(JobState state);

/**
 * @struct JobResult
 * @brief Outcome of one job, collected by the batch processor.
 */
struct JobResult {
  std::string filename;               //< Input filename
  JobState state = JobState::Pending; //< Final state (Done or Failed)
  JobState failed_stage = JobState::Pending; //< Stage that failed
  std::string error;                  //< Failure cause (empty on success)
  ErrorCode error_code = ErrorCode::Unexpected; //< Meaningful when failed
  long frames_written = 0;            //< Frames encoded into the artifact
  long processing_time_us = 0;        //< Wall time for the job

  bool success() const { return state == JobState::Done; }
};

/**
 * @struct BatchResult
 * @brief Aggregate result of a run.
 */
struct BatchResult {
  int total = 0;                  //< Candidate files discovered
  int succeeded = 0;              //< Jobs that reached Done
  std::vector<JobResult> results; //< Per-file results in processing order
};

} // namespace region_redact

#endif // REGION_REDACT_TYPES_HPP
