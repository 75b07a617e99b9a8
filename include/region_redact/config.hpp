/**
 * @file config.hpp
 * @brief Configuration: environment tunables and the settings file
 *
 * @details Two layers:
 *
 *          - Config namespace: lazy-initialized, memoized process tunables
 *            read from environment variables (ffmpeg path, tool timeout,
 *            log file, debug logging, desktop notification).
 *
 *          - Settings: the typed value produced from the INI settings file
 *            (paths, region, blur, audio policy, accepted formats).
 *
 * @attention VALIDATION POLICY (settings file):
 *
 *   - Processing.blur_kernel even or <= 0: fatal (RedactError ConfigInvalid)
 *
 *   - Unreadable file: fatal (RedactError ConfigUnreadable)
 *
 *   - Missing or malformed optional values: warning + documented default
 */

#ifndef REGION_REDACT_CONFIG_HPP
#define REGION_REDACT_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "types.hpp"

namespace region_redact {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Variable content or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

/// Explicit ffmpeg binary path (empty = search)
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "");
  return val;
}

/**
 * @brief Timeout for a single external tool call in seconds
 * @note 0 disables the timeout
 */
inline int tool_timeout_sec() {
  static int val = get_env_int("TOOL_TIMEOUT_SEC", 3600);
  return val;
}

/// Log file name, relative paths resolve next to the executable
inline std::string log_file() {
  static std::string val = get_env_string("LOG_FILE", "video_tool.log");
  return val;
}

/// Enable LOG_DEBUG output and timing tables
inline bool debug_logging() {
  static bool val = (get_env_int("LOG_DEBUG", 0) != 0);
  return val;
}

/// Send a desktop notification (notify-send) when the run completes
inline bool desktop_notify() {
  static bool val = (get_env_int("DESKTOP_NOTIFY", 0) != 0);
  return val;
}

} // namespace Config

// **----- SETTINGS FILE -----**

/// Section name -> (lower-cased key -> raw value)
using IniSection = std::map<std::string, std::string>;
using IniDocument = std::map<std::string, IniSection>;

/**
 * @struct Settings
 * @brief Typed, validated run configuration.
 */
struct Settings {
  std::filesystem::path input_dir;  //< Source directory
  std::filesystem::path output_dir; //< Destination directory
  bool overwrite = false;           //< Replace existing outputs

  Region region{100, 200, 300, 250}; //< Redaction rectangle
  BlurParameters blur{55, 0};        //< Gaussian parameters
  bool remove_audio = false;         //< Skip audio reattachment

  std::vector<std::string> formats; //< Accepted extensions (".mp4", ...)
};

/// Extensions accepted when Formats.supported is absent
std::vector<std::string> default_formats();

/**
 * @brief Parse INI text into sections.
 * @note Supports `[Section]`, `key = value`, `key: value`, full-line and
 *       inline `#` / `;` comments. Keys are lower-cased, values trimmed.
 */
IniDocument parse_ini(std::istream &in);

/**
 * @brief Build validated Settings from a parsed document.
 * @param doc Parsed settings file
 * @param base_dir Directory that relative paths resolve against
 * @throws RedactError ConfigInvalid when blur_kernel is even or <= 0
 */
Settings settings_from_ini(const IniDocument &doc,
                           const std::filesystem::path &base_dir);

/**
 * @brief Write the default settings file (creating parent directories).
 * @throws RedactError ConfigUnreadable on I/O failure
 */
void write_default_settings(const std::filesystem::path &path);

/**
 * @brief Load settings from a file, creating a default file when missing.
 * @param path Settings file path
 * @param base_dir Directory that relative paths resolve against
 * @throws RedactError ConfigUnreadable / ConfigInvalid
 */
Settings load_settings(const std::filesystem::path &path,
                       const std::filesystem::path &base_dir);

/**
 * @brief Strict integer parse: optional sign, then digits only.
 * @return false when text is empty or has any other character
 */
bool parse_int(const std::string &text, int &out);

/**
 * @brief Boolean parse: true/yes/1/on, false/no/0/off (case-insensitive).
 * @return false when text is none of those
 */
bool parse_bool(const std::string &text, bool &out);

} // namespace region_redact

#endif // REGION_REDACT_CONFIG_HPP
