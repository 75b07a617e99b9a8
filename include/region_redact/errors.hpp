/**
 * @file errors.hpp
 * @brief Error codes and the exception type carried across module borders
 */

#ifndef REGION_REDACT_ERRORS_HPP
#define REGION_REDACT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace region_redact {

enum class ErrorCode {
  ConfigInvalid,      //< A value violates its own invariant (fatal)
  ConfigUnreadable,   //< Settings file cannot be read or written
  DirectoryNotFound,  //< Input directory missing
  ToolNotFound,       //< ffmpeg binary not located
  CannotOpenSource,   //< Decoder refused the input
  RegionOutOfBounds,  //< Region does not fit the frame
  OutputExists,       //< Output present and overwrite disabled
  EncodeFailed,       //< Writer could not be opened or rejected a frame
  AudioExtractFailed, //< First ffmpeg call failed
  AudioMuxFailed,     //< Second ffmpeg call failed
  Cancelled,          //< Run-level cancellation observed
  Filesystem,         //< Move/remove/create failed
  Unexpected          //< Library or runtime exception outside the above
};

const char *to_string(ErrorCode code);

/**
 * @class RedactError
 * @brief Exception with an ErrorCode. Thrown by lower layers, caught at the
 *        job boundary (per-file failure) or in main (fatal).
 */
class RedactError : public std::runtime_error {
public:
  RedactError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace region_redact

#endif // REGION_REDACT_ERRORS_HPP
