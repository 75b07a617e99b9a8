/**
 * @file config.cpp
 * @brief Settings file parsing and validation
 *
 * @details Every optional value falls back to its documented default with a
 *          warning that names section, key and default. The blur kernel is
 *          the only value whose invariant violation stops the run.
 */

#include "region_redact/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"

namespace region_redact {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Drop an inline comment introduced by '#' or ';'
std::string strip_inline_comment(const std::string &value) {
  size_t pos = value.find_first_of("#;");
  return trim(pos == std::string::npos ? value : value.substr(0, pos));
}

/// Look up a raw value; nullptr when section or key is absent
const std::string *find_value(const IniDocument &doc,
                              const std::string &section,
                              const std::string &key) {
  auto sec = doc.find(section);
  if (sec == doc.end())
    return nullptr;
  auto it = sec->second.find(key);
  if (it == sec->second.end())
    return nullptr;
  return &it->second;
}

int get_int(const IniDocument &doc, const std::string &section,
            const std::string &key, int default_val) {
  const std::string *raw = find_value(doc, section, key);
  if (!raw) {
    LOG_WARN("Setting {}.{} missing, using default {}", section, key,
             default_val);
    return default_val;
  }
  int val = 0;
  if (!parse_int(*raw, val)) {
    LOG_WARN("Setting {}.{} = '{}' is not an integer, using default {}",
             section, key, *raw, default_val);
    return default_val;
  }
  return val;
}

bool get_bool(const IniDocument &doc, const std::string &section,
              const std::string &key, bool default_val) {
  const std::string *raw = find_value(doc, section, key);
  if (!raw) {
    LOG_WARN("Setting {}.{} missing, using default {}", section, key,
             default_val);
    return default_val;
  }
  bool val = false;
  if (!parse_bool(*raw, val)) {
    LOG_WARN("Setting {}.{} = '{}' is not a boolean, using default {}",
             section, key, *raw, default_val);
    return default_val;
  }
  return val;
}

fs::path get_path(const IniDocument &doc, const std::string &section,
                  const std::string &key, const fs::path &base_dir) {
  const std::string *raw = find_value(doc, section, key);
  std::string value = raw ? *raw : "";

  if (value.empty()) {
    fs::path fallback = base_dir / key;
    LOG_WARN("Setting {}.{} is empty, using default path {}", section, key,
             fallback.string());
    return fallback;
  }

  fs::path path(value);
  if (path.is_relative())
    path = base_dir / path;

  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec)
    resolved = path.lexically_normal();

  LOG_DEBUG("Setting {}.{}: '{}' -> {}", section, key, value,
            resolved.string());
  return resolved;
}

std::vector<std::string> get_formats(const IniDocument &doc) {
  const std::string *raw = find_value(doc, "Formats", "supported");
  if (!raw) {
    LOG_WARN("Setting Formats.supported missing, using default list");
    return default_formats();
  }

  std::vector<std::string> formats;
  size_t pos = 0;
  while (pos <= raw->size()) {
    size_t end = raw->find(',', pos);
    if (end == std::string::npos)
      end = raw->size();
    std::string ext = to_lower(trim(raw->substr(pos, end - pos)));
    if (!ext.empty()) {
      if (ext[0] != '.')
        ext.insert(ext.begin(), '.');
      formats.push_back(ext);
    }
    pos = end + 1;
  }

  if (formats.empty()) {
    LOG_WARN("Setting Formats.supported is empty, using default list");
    return default_formats();
  }
  return formats;
}

constexpr const char *DEFAULT_SETTINGS =
    "[Paths]\n"
    "input_dir = ./input\n"
    "output_dir = ./output\n"
    "overwrite = false\n"
    "\n"
    "[Region]\n"
    "x = 100\n"
    "y = 200\n"
    "width = 300\n"
    "height = 250\n"
    "\n"
    "[Processing]\n"
    "blur_kernel = 55\n"
    "blur_sigma = 0\n"
    "remove_audio = false\n"
    "\n"
    "[Formats]\n"
    "supported = .mp4, .avi, .mov, .mkv, .flv, .webm, .ts\n";

} // anonymous namespace

// **---- Value Parsing ----**

bool parse_int(const std::string &text, int &out) {
  std::string s = trim(text);
  if (s.empty())
    return false;

  size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
  if (i == s.size())
    return false;
  for (size_t j = i; j < s.size(); ++j) {
    if (!std::isdigit(static_cast<unsigned char>(s[j])))
      return false;
  }

  try {
    out = std::stoi(s);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

bool parse_bool(const std::string &text, bool &out) {
  std::string s = to_lower(trim(text));
  if (s == "true" || s == "yes" || s == "1" || s == "on") {
    out = true;
    return true;
  }
  if (s == "false" || s == "no" || s == "0" || s == "off") {
    out = false;
    return true;
  }
  return false;
}

std::vector<std::string> default_formats() {
  return {".mp4", ".avi", ".mov", ".mkv", ".flv", ".webm", ".ts"};
}

// **---- INI Parsing ----**

IniDocument parse_ini(std::istream &in) {
  IniDocument doc;
  std::string section;
  std::string line;

  while (std::getline(in, line)) {
    std::string t = trim(line);
    if (t.empty() || t[0] == '#' || t[0] == ';')
      continue;

    if (t.front() == '[' && t.back() == ']') {
      section = trim(t.substr(1, t.size() - 2));
      doc[section];
      continue;
    }

    size_t sep = t.find_first_of("=:");
    if (sep == std::string::npos) {
      LOG_WARN("Ignoring malformed settings line: '{}'", t);
      continue;
    }

    std::string key = to_lower(trim(t.substr(0, sep)));
    std::string value = strip_inline_comment(t.substr(sep + 1));
    doc[section][key] = value;
  }

  return doc;
}

// **---- Validation ----**

Settings settings_from_ini(const IniDocument &doc, const fs::path &base_dir) {
  Settings s;

  s.input_dir = get_path(doc, "Paths", "input_dir", base_dir);
  s.output_dir = get_path(doc, "Paths", "output_dir", base_dir);
  s.overwrite = get_bool(doc, "Paths", "overwrite", false);

  s.region.x = get_int(doc, "Region", "x", 100);
  s.region.y = get_int(doc, "Region", "y", 200);
  s.region.width = get_int(doc, "Region", "width", 300);
  s.region.height = get_int(doc, "Region", "height", 250);

  s.blur.kernel_size = get_int(doc, "Processing", "blur_kernel", 55);
  if (s.blur.kernel_size <= 0 || s.blur.kernel_size % 2 == 0) {
    throw RedactError(
        ErrorCode::ConfigInvalid,
        fmt::format("Processing.blur_kernel must be a positive odd integer, "
                    "got {}",
                    s.blur.kernel_size));
  }

  s.blur.sigma = get_int(doc, "Processing", "blur_sigma", 0);
  if (s.blur.sigma < 0) {
    LOG_WARN("Setting Processing.blur_sigma = {} is negative, using default 0",
             s.blur.sigma);
    s.blur.sigma = 0;
  }

  s.remove_audio = get_bool(doc, "Processing", "remove_audio", false);
  s.formats = get_formats(doc);

  return s;
}

// **---- File Handling ----**

void write_default_settings(const fs::path &path) {
  std::error_code ec;
  if (path.has_parent_path())
    fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw RedactError(ErrorCode::ConfigUnreadable,
                      fmt::format("Cannot create config directory {}: {}",
                                  path.parent_path().string(), ec.message()));
  }

  std::ofstream out(path);
  if (!out) {
    throw RedactError(
        ErrorCode::ConfigUnreadable,
        fmt::format("Cannot write default settings: {}", path.string()));
  }
  out << DEFAULT_SETTINGS;
  if (!out) {
    throw RedactError(
        ErrorCode::ConfigUnreadable,
        fmt::format("Cannot write default settings: {}", path.string()));
  }
}

Settings load_settings(const fs::path &path, const fs::path &base_dir) {
  if (!fs::exists(path)) {
    LOG_INFO("Settings file not found, writing defaults to {}", path.string());
    write_default_settings(path);
  }

  std::ifstream in(path);
  if (!in) {
    throw RedactError(ErrorCode::ConfigUnreadable,
                      fmt::format("Cannot read settings: {}", path.string()));
  }

  IniDocument doc = parse_ini(in);
  if (in.bad()) {
    throw RedactError(ErrorCode::ConfigUnreadable,
                      fmt::format("Error reading settings: {}", path.string()));
  }

  LOG_DEBUG("Loaded settings from {}", path.string());
  return settings_from_ini(doc, base_dir);
}

} // namespace region_redact
