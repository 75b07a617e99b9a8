/**
 * @file batch_processor.hpp
 * @brief Directory discovery and sequential batch driver
 *
 * @details The BatchProcessor runs one RedactionJob per discovered file:
 *
 *          - Files are processed one at a time in sorted path order
 *
 *          - A failed job is recorded and the batch continues
 *
 *          - A raised cancellation flag stops the batch before the next file
 *
 * @note Output for each file is <output_dir>/<input filename>.
 */

#ifndef REGION_REDACT_BATCH_PROCESSOR_HPP
#define REGION_REDACT_BATCH_PROCESSOR_HPP

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"
#include "video_codec.hpp"
#include "workspace.hpp"

namespace region_redact {

class ToolRunner;

/**
 * @brief List candidate videos in a directory (non-recursive).
 *
 * @param dir Directory to scan
 * @param extensions Accepted extensions, lower-case and dot-prefixed
 * @return Regular files whose extension matches case-insensitively,
 *         sorted by path
 * @throws RedactError DirectoryNotFound
 */
std::vector<VideoFile>
discover_video_files(const std::filesystem::path &dir,
                     const std::vector<std::string> &extensions);

/**
 * @class BatchProcessor
 * @brief Sequential driver over a list of input files.
 */
class BatchProcessor {
public:
  /**
   * @param settings Validated settings
   * @param root Workspace root under the output directory
   * @param runner ffmpeg runner (nullptr when audio is removed)
   * @param cancel Cancellation flag (may be nullptr)
   * @param codecs Encoder table
   */
  BatchProcessor(Settings settings, const WorkspaceRoot &root,
                 ToolRunner *runner, const std::atomic<bool> *cancel = nullptr,
                 const CodecTable &codecs = default_codec_table());

  /**
   * @brief Process every file in order.
   * @return Totals and per-file results
   */
  BatchResult process(const std::vector<VideoFile> &files);

  /// True if the last process() call stopped on cancellation
  bool cancelled() const { return cancelled_; }

private:
  void print_batch_summary(const BatchResult &batch, double wall_clock_sec);

  Settings settings_;
  const WorkspaceRoot &root_;
  ToolRunner *runner_;
  const std::atomic<bool> *cancel_;
  const CodecTable &codecs_;
  bool cancelled_ = false;
};

} // namespace region_redact

#endif // REGION_REDACT_BATCH_PROCESSOR_HPP
