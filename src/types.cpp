/**
 * @file types.cpp
 * @brief String conversions for core types
 */

#include "region_redact/types.hpp"

namespace region_redact {

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Pending:
    return "PENDING";
  case JobState::Decoding:
    return "DECODING";
  case JobState::Transforming:
    return "TRANSFORMING";
  case JobState::Encoding:
    return "ENCODING";
  case JobState::DirectMove:
    return "DIRECT_MOVE";
  case JobState::AudioExtract:
    return "AUDIO_EXTRACT";
  case JobState::AudioMux:
    return "AUDIO_MUX";
  case JobState::Done:
    return "DONE";
  case JobState::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

} // namespace region_redact
