/**
 * @file workspace.hpp
 * @brief On-disk scratch space for intermediate artifacts
 *
 * @details Two RAII levels:
 *
 *          - WorkspaceRoot: `<output_dir>/_video_temp`, lives for the run
 *
 *          - JobWorkspace: `<root>/job-<ordinal>-<stem>`, lives for one job
 *
 *          Artifacts are typed path wrappers so that the encode stage and
 *          the audio stage exchange named values, not ad-hoc paths.
 */

#ifndef REGION_REDACT_WORKSPACE_HPP
#define REGION_REDACT_WORKSPACE_HPP

#include <filesystem>
#include <string>

namespace region_redact {

/**
 * @struct SilentVideoArtifact
 * @brief Video-only file produced by the encode stage.
 */
struct SilentVideoArtifact {
  std::filesystem::path path;
};

/**
 * @struct AudioArtifact
 * @brief Audio track extracted from the original input.
 */
struct AudioArtifact {
  std::filesystem::path path;
};

/**
 * @struct MuxedVideoArtifact
 * @brief Video with reattached audio, moved onto the output path when done.
 */
struct MuxedVideoArtifact {
  std::filesystem::path path;
};

/**
 * @brief Remove a directory tree, logging (not throwing) on failure.
 * @return true if nothing remains at path
 */
bool remove_tree_quietly(const std::filesystem::path &path);

/**
 * @class WorkspaceRoot
 * @brief Run-level scratch directory, removed on destruction.
 */
class WorkspaceRoot {
public:
  /**
   * @param output_dir Directory that will contain the workspace root
   * @throws RedactError Filesystem if the directory cannot be created
   * @note Leftovers of an interrupted earlier run are removed first.
   */
  explicit WorkspaceRoot(const std::filesystem::path &output_dir);
  ~WorkspaceRoot();

  WorkspaceRoot(const WorkspaceRoot &) = delete;
  WorkspaceRoot &operator=(const WorkspaceRoot &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * @class JobWorkspace
 * @brief Uniquely named per-job directory, removed on destruction.
 */
class JobWorkspace {
public:
  /**
   * @param root Run-level workspace root
   * @param ordinal 1-based job number, makes the name unique within a run
   * @param stem Input file stem, for readability
   * @throws RedactError Filesystem if the directory cannot be created
   */
  JobWorkspace(const WorkspaceRoot &root, int ordinal, const std::string &stem);
  ~JobWorkspace();

  JobWorkspace(const JobWorkspace &) = delete;
  JobWorkspace &operator=(const JobWorkspace &) = delete;

  const std::filesystem::path &path() const { return path_; }

  /// Location of the silent video; keeps the output file name so the
  /// container is guessed from the same extension
  SilentVideoArtifact silent_video(const std::string &filename) const;

  /// Location of the extracted audio track
  AudioArtifact audio() const;

  /// Mux target, same extension as the output file
  MuxedVideoArtifact muxed_video(const std::string &filename) const;

  /// Remove the directory now (also done by the destructor)
  void purge();

private:
  std::filesystem::path path_;
  bool purged_ = false;
};

} // namespace region_redact

#endif // REGION_REDACT_WORKSPACE_HPP
