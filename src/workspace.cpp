/**
 * @file workspace.cpp
 * @brief Workspace directory lifecycle
 */

#include "region_redact/workspace.hpp"

#include <system_error>

#include <fmt/core.h>

#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/types.hpp"

namespace region_redact {

namespace fs = std::filesystem;

namespace {

void create_directory_or_throw(const fs::path &path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw RedactError(ErrorCode::Filesystem,
                      fmt::format("Cannot create workspace {}: {}",
                                  path.string(), ec.message()));
  }
}

} // anonymous namespace

bool remove_tree_quietly(const fs::path &path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG_WARN("Cannot remove {}: {}", path.string(), ec.message());
    return false;
  }
  return true;
}

// **---- WorkspaceRoot ----**

WorkspaceRoot::WorkspaceRoot(const fs::path &output_dir)
    : path_(output_dir / WORKSPACE_DIR_NAME) {
  std::error_code ec;
  if (fs::exists(path_, ec)) {
    LOG_WARN("Removing stale workspace {}", path_.string());
    remove_tree_quietly(path_);
  }
  create_directory_or_throw(path_);
  LOG_DEBUG("Workspace root: {}", path_.string());
}

WorkspaceRoot::~WorkspaceRoot() {
  if (remove_tree_quietly(path_)) {
    LOG_INFO("Temporary files cleaned up");
  }
}

// **---- JobWorkspace ----**

JobWorkspace::JobWorkspace(const WorkspaceRoot &root, int ordinal,
                           const std::string &stem)
    : path_(root.path() / fmt::format("job-{}-{}", ordinal, stem)) {
  create_directory_or_throw(path_);
}

JobWorkspace::~JobWorkspace() { purge(); }

SilentVideoArtifact JobWorkspace::silent_video(const std::string &filename) const {
  return {path_ / filename};
}

AudioArtifact JobWorkspace::audio() const { return {path_ / "audio_temp.m4a"}; }

MuxedVideoArtifact JobWorkspace::muxed_video(const std::string &filename) const {
  return {path_ / ("muxed-" + filename)};
}

void JobWorkspace::purge() {
  if (purged_)
    return;
  purged_ = remove_tree_quietly(path_);
}

} // namespace region_redact
