/**
 * @file errors.cpp
 * @brief ErrorCode names for log output
 */

#include "region_redact/errors.hpp"

namespace region_redact {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::ConfigInvalid:
    return "config invalid";
  case ErrorCode::ConfigUnreadable:
    return "config unreadable";
  case ErrorCode::DirectoryNotFound:
    return "directory not found";
  case ErrorCode::ToolNotFound:
    return "tool not found";
  case ErrorCode::CannotOpenSource:
    return "cannot open source";
  case ErrorCode::RegionOutOfBounds:
    return "region out of bounds";
  case ErrorCode::OutputExists:
    return "output already exists";
  case ErrorCode::EncodeFailed:
    return "encode failed";
  case ErrorCode::AudioExtractFailed:
    return "audio extraction failed";
  case ErrorCode::AudioMuxFailed:
    return "audio mux failed";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::Filesystem:
    return "filesystem error";
  case ErrorCode::Unexpected:
    return "unexpected error";
  }
  return "unknown error";
}

} // namespace region_redact
