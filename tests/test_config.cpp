#include <gtest/gtest.h>

#include <sstream>

#include "region_redact/config.hpp"
#include "region_redact/errors.hpp"
#include "test_helpers.hpp"

using namespace region_redact;
namespace fs = std::filesystem;

namespace {

Settings from_text(const std::string &text, const fs::path &base) {
  std::istringstream in(text);
  return settings_from_ini(parse_ini(in), base);
}

ErrorCode code_of(const std::string &text) {
  try {
    from_text(text, "/tmp");
  } catch (const RedactError &e) {
    return e.code();
  }
  ADD_FAILURE() << "no RedactError thrown";
  return ErrorCode::Filesystem;
}

} // namespace

// **---- INI syntax ----**

TEST(ParseIni, SectionsKeysAndComments) {
  std::istringstream in("# leading comment\n"
                        "; another\n"
                        "[Region]\n"
                        "X = 5   # inline\n"
                        "width: 40 ; inline\n"
                        "\n"
                        "[Formats]\n"
                        "supported = .mp4\n");
  IniDocument doc = parse_ini(in);

  ASSERT_EQ(doc.count("Region"), 1u);
  EXPECT_EQ(doc["Region"]["x"], "5");
  EXPECT_EQ(doc["Region"]["width"], "40");
  EXPECT_EQ(doc["Formats"]["supported"], ".mp4");
}

TEST(ParseIni, MalformedLineIsIgnored) {
  std::istringstream in("[Paths]\nthis line has no separator\noverwrite=yes\n");
  IniDocument doc = parse_ini(in);
  EXPECT_EQ(doc["Paths"].size(), 1u);
  EXPECT_EQ(doc["Paths"]["overwrite"], "yes");
}

// **---- Value parsing ----**

TEST(ParseValues, StrictIntegers) {
  int v = 0;
  EXPECT_TRUE(parse_int("42", v));
  EXPECT_EQ(v, 42);
  EXPECT_TRUE(parse_int("-7", v));
  EXPECT_EQ(v, -7);
  EXPECT_TRUE(parse_int(" +3 ", v));
  EXPECT_EQ(v, 3);

  EXPECT_FALSE(parse_int("", v));
  EXPECT_FALSE(parse_int("-", v));
  EXPECT_FALSE(parse_int("12px", v));
  EXPECT_FALSE(parse_int("1.5", v));
  EXPECT_FALSE(parse_int("99999999999", v));
}

TEST(ParseValues, Booleans) {
  bool b = false;
  for (const char *t : {"true", "YES", "1", "On"}) {
    EXPECT_TRUE(parse_bool(t, b)) << t;
    EXPECT_TRUE(b) << t;
  }
  for (const char *f : {"false", "No", "0", "OFF"}) {
    EXPECT_TRUE(parse_bool(f, b)) << f;
    EXPECT_FALSE(b) << f;
  }
  EXPECT_FALSE(parse_bool("maybe", b));
  EXPECT_FALSE(parse_bool("", b));
}

// **---- Settings ----**

TEST(SettingsFromIni, EmptyDocumentYieldsDefaults) {
  test_support::TempDir dir;
  Settings s = from_text("", dir.path());

  EXPECT_EQ(s.input_dir, dir.path() / "input_dir");
  EXPECT_EQ(s.output_dir, dir.path() / "output_dir");
  EXPECT_FALSE(s.overwrite);
  EXPECT_EQ(s.region.x, 100);
  EXPECT_EQ(s.region.y, 200);
  EXPECT_EQ(s.region.width, 300);
  EXPECT_EQ(s.region.height, 250);
  EXPECT_EQ(s.blur.kernel_size, 55);
  EXPECT_EQ(s.blur.sigma, 0);
  EXPECT_FALSE(s.remove_audio);
  EXPECT_EQ(s.formats, default_formats());
}

TEST(SettingsFromIni, RelativePathsResolveAgainstBase) {
  test_support::TempDir dir;
  Settings s = from_text("[Paths]\ninput_dir = ./in\noutput_dir = out\n",
                         dir.path());

  EXPECT_EQ(s.input_dir, fs::weakly_canonical(dir.path() / "in"));
  EXPECT_EQ(s.output_dir, fs::weakly_canonical(dir.path() / "out"));
}

TEST(SettingsFromIni, AbsolutePathKept) {
  Settings s = from_text("[Paths]\ninput_dir = /srv/videos\n", "/tmp");
  EXPECT_EQ(s.input_dir, fs::path("/srv/videos"));
}

TEST(SettingsFromIni, FullDocument) {
  Settings s = from_text("[Paths]\n"
                         "overwrite = yes\n"
                         "[Region]\n"
                         "x = 1\ny = 2\nwidth = 3\nheight = 4\n"
                         "[Processing]\n"
                         "blur_kernel = 7\n"
                         "blur_sigma = 2\n"
                         "remove_audio = on\n"
                         "[Formats]\n"
                         "supported = MP4, .Avi ,mkv\n",
                         "/tmp");
  EXPECT_TRUE(s.overwrite);
  EXPECT_EQ(s.region.x, 1);
  EXPECT_EQ(s.region.y, 2);
  EXPECT_EQ(s.region.width, 3);
  EXPECT_EQ(s.region.height, 4);
  EXPECT_EQ(s.blur.kernel_size, 7);
  EXPECT_EQ(s.blur.sigma, 2);
  EXPECT_TRUE(s.remove_audio);
  EXPECT_EQ(s.formats, (std::vector<std::string>{".mp4", ".avi", ".mkv"}));
}

TEST(SettingsFromIni, MalformedValuesFallBackToDefaults) {
  Settings s = from_text("[Paths]\n"
                         "overwrite = perhaps\n"
                         "[Region]\n"
                         "x = ten\n"
                         "width = 12.5\n"
                         "[Processing]\n"
                         "blur_sigma = -3\n"
                         "remove_audio = 2\n"
                         "[Formats]\n"
                         "supported = , ,\n",
                         "/tmp");
  EXPECT_FALSE(s.overwrite);
  EXPECT_EQ(s.region.x, 100);
  EXPECT_EQ(s.region.width, 300);
  EXPECT_EQ(s.blur.sigma, 0);
  EXPECT_FALSE(s.remove_audio);
  EXPECT_EQ(s.formats, default_formats());
}

TEST(SettingsFromIni, EvenKernelIsFatal) {
  EXPECT_EQ(code_of("[Processing]\nblur_kernel = 54\n"),
            ErrorCode::ConfigInvalid);
}

TEST(SettingsFromIni, NonPositiveKernelIsFatal) {
  EXPECT_EQ(code_of("[Processing]\nblur_kernel = 0\n"),
            ErrorCode::ConfigInvalid);
  EXPECT_EQ(code_of("[Processing]\nblur_kernel = -5\n"),
            ErrorCode::ConfigInvalid);
}

TEST(SettingsFromIni, MalformedKernelFallsBackToDefault) {
  Settings s = from_text("[Processing]\nblur_kernel = big\n", "/tmp");
  EXPECT_EQ(s.blur.kernel_size, 55);
}

// **---- File handling ----**

TEST(LoadSettings, MissingFileIsCreatedWithDefaults) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "config" / "settings.ini";

  Settings s = load_settings(path, dir.path());

  EXPECT_TRUE(fs::exists(path));
  EXPECT_EQ(s.input_dir, fs::weakly_canonical(dir.path() / "input"));
  EXPECT_EQ(s.output_dir, fs::weakly_canonical(dir.path() / "output"));
  EXPECT_EQ(s.blur.kernel_size, 55);
  EXPECT_EQ(s.formats, default_formats());
}

TEST(LoadSettings, ReadsExistingFile) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "settings.ini";
  test_support::write_text_file(path, "[Processing]\nblur_kernel = 9\n");

  Settings s = load_settings(path, dir.path());
  EXPECT_EQ(s.blur.kernel_size, 9);
}

TEST(LoadSettings, InvalidKernelInFileThrows) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "settings.ini";
  test_support::write_text_file(path, "[Processing]\nblur_kernel = 4\n");

  EXPECT_THROW(load_settings(path, dir.path()), RedactError);
}
