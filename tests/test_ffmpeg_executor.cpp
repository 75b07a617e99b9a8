#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "region_redact/errors.hpp"
#include "region_redact/ffmpeg_executor.hpp"
#include "test_helpers.hpp"

using namespace region_redact;
namespace fs = std::filesystem;

namespace {

/// Records invocations; the step-th call (1-based) can be made to fail.
/// A successful call creates its last argument, the way ffmpeg creates
/// its output file.
class FakeRunner : public ToolRunner {
public:
  explicit FakeRunner(int fail_on_call = 0) : fail_on_call_(fail_on_call) {}

  ProcessResult run(const std::vector<std::string> &args) override {
    calls.push_back(args);
    ProcessResult r;
    if (static_cast<int>(calls.size()) == fail_on_call_) {
      /// ffmpeg may leave a truncated output behind
      test_support::write_text_file(args.back(), "partial");
      r.exit_code = 1;
      r.output = "Conversion failed!";
      return r;
    }
    test_support::write_text_file(args.back(), "media");
    r.exit_code = 0;
    return r;
  }

  std::vector<std::vector<std::string>> calls;

private:
  int fail_on_call_;
};

bool contains_sequence(const std::vector<std::string> &args,
                       const std::vector<std::string> &seq) {
  return std::search(args.begin(), args.end(), seq.begin(), seq.end()) !=
         args.end();
}

class AudioReattacherTest : public ::testing::Test {
protected:
  void SetUp() override {
    work = dir.path() / "work";
    fs::create_directories(work);
    video = SilentVideoArtifact{work / "clip.mp4"};
    audio = AudioArtifact{work / "audio_temp.m4a"};
    muxed = MuxedVideoArtifact{work / "muxed-clip.mp4"};
    input = dir.path() / "clip.mp4";
    output = dir.path() / "out" / "clip.mp4";
    fs::create_directories(output.parent_path());
    test_support::write_text_file(video.path, "silent");
    test_support::write_text_file(input, "original");
  }

  test_support::TempDir dir;
  fs::path work;
  SilentVideoArtifact video;
  AudioArtifact audio;
  MuxedVideoArtifact muxed;
  fs::path input;
  fs::path output;
  std::vector<JobState> stages;

  AudioReattacher::StageCallback record() {
    return [this](JobState s) { stages.push_back(s); };
  }
};

} // namespace

// **---- Argument builders ----**

TEST(FfmpegArgs, ExtractAudio) {
  auto args = extract_audio_args("/in/a.mp4", AudioArtifact{"/w/audio.m4a"});
  EXPECT_TRUE(contains_sequence(args, {"-i", "/in/a.mp4"}));
  EXPECT_TRUE(contains_sequence(args, {"-vn"}));
  EXPECT_TRUE(contains_sequence(args, {"-acodec", "aac"}));
  EXPECT_TRUE(contains_sequence(args, {"-b:a", "128k"}));
  EXPECT_EQ(args.front(), "-y");
  EXPECT_EQ(args.back(), "/w/audio.m4a");
}

TEST(FfmpegArgs, MuxMapsExactlyOneVideoAndOneAudioStream) {
  auto args = mux_audio_args(SilentVideoArtifact{"/w/v.mp4"},
                             AudioArtifact{"/w/a.m4a"},
                             MuxedVideoArtifact{"/w/muxed-v.mp4"});
  EXPECT_TRUE(contains_sequence(args, {"-i", "/w/v.mp4", "-i", "/w/a.m4a"}));
  EXPECT_TRUE(contains_sequence(args, {"-c:v", "libx264"}));
  EXPECT_TRUE(contains_sequence(args, {"-crf", "23"}));
  EXPECT_TRUE(contains_sequence(args, {"-preset", "medium"}));
  EXPECT_TRUE(contains_sequence(args, {"-c:a", "aac"}));
  EXPECT_TRUE(contains_sequence(args, {"-map", "0:v:0"}));
  EXPECT_TRUE(contains_sequence(args, {"-map", "1:a:0"}));
  EXPECT_EQ(std::count(args.begin(), args.end(), "-map"), 2);
  EXPECT_EQ(args.back(), "/w/muxed-v.mp4");
}

// **---- move_file ----**

TEST(MoveFile, MovesContent) {
  test_support::TempDir dir;
  fs::path from = dir.path() / "a.avi";
  fs::path to = dir.path() / "b.avi";
  test_support::write_text_file(from, "payload");

  move_file(from, to);
  EXPECT_FALSE(fs::exists(from));
  EXPECT_EQ(test_support::read_file(to), "payload");
}

TEST(MoveFile, MissingSourceThrows) {
  test_support::TempDir dir;
  EXPECT_THROW(move_file(dir.path() / "none.avi", dir.path() / "b.avi"),
               RedactError);
}

// **---- AudioReattacher ----**

TEST_F(AudioReattacherTest, RemoveAudioMovesWithoutToolCalls) {
  FakeRunner runner;
  AudioReattacher reattacher(true, &runner);

  reattacher.finalize(video, audio, muxed, input, output, record());

  EXPECT_TRUE(runner.calls.empty());
  EXPECT_EQ(test_support::read_file(output), "silent");
  EXPECT_FALSE(fs::exists(video.path));
  EXPECT_EQ(stages, std::vector<JobState>{JobState::DirectMove});
}

TEST_F(AudioReattacherTest, RemoveAudioNeedsNoRunner) {
  AudioReattacher reattacher(true, nullptr);
  EXPECT_NO_THROW(reattacher.finalize(video, audio, muxed, input, output));
  EXPECT_TRUE(fs::exists(output));
}

TEST_F(AudioReattacherTest, PreserveAudioWithoutRunnerThrows) {
  AudioReattacher reattacher(false, nullptr);
  try {
    reattacher.finalize(video, audio, muxed, input, output);
    FAIL() << "expected ToolNotFound";
  } catch (const RedactError &e) {
    EXPECT_EQ(e.code(), ErrorCode::ToolNotFound);
  }
}

TEST_F(AudioReattacherTest, PreserveAudioExtractsThenMuxes) {
  FakeRunner runner;
  AudioReattacher reattacher(false, &runner);

  reattacher.finalize(video, audio, muxed, input, output, record());

  ASSERT_EQ(runner.calls.size(), 2u);
  EXPECT_EQ(runner.calls[0], extract_audio_args(input, audio));
  EXPECT_EQ(runner.calls[1], mux_audio_args(video, audio, muxed));
  EXPECT_EQ(stages, (std::vector<JobState>{JobState::AudioExtract,
                                           JobState::AudioMux}));
  EXPECT_EQ(test_support::read_file(output), "media");
  EXPECT_FALSE(fs::exists(muxed.path));
  EXPECT_FALSE(fs::exists(audio.path));
}

TEST_F(AudioReattacherTest, OutputAppearsOnlyAfterMuxCompletes) {
  /// Checks the output path while the mux is still running
  class WatchingRunner : public ToolRunner {
  public:
    explicit WatchingRunner(fs::path output) : output_(std::move(output)) {}

    ProcessResult run(const std::vector<std::string> &args) override {
      ++calls;
      if (calls == 2) {
        mux_target = args.back();
        output_seen_during_mux = fs::exists(output_);
      }
      test_support::write_text_file(args.back(), "media");
      ProcessResult r;
      r.exit_code = 0;
      return r;
    }

    int calls = 0;
    std::string mux_target;
    bool output_seen_during_mux = true;

  private:
    fs::path output_;
  };

  WatchingRunner runner(output);
  AudioReattacher reattacher(false, &runner);
  reattacher.finalize(video, audio, muxed, input, output);

  ASSERT_EQ(runner.calls, 2);
  EXPECT_NE(fs::path(runner.mux_target), output);
  EXPECT_EQ(fs::path(runner.mux_target).parent_path(), work);
  EXPECT_FALSE(runner.output_seen_during_mux);
  EXPECT_EQ(test_support::read_file(output), "media");
}

TEST_F(AudioReattacherTest, ExtractFailureStopsBeforeMux) {
  FakeRunner runner(1);
  AudioReattacher reattacher(false, &runner);

  try {
    reattacher.finalize(video, audio, muxed, input, output);
    FAIL() << "expected AudioExtractFailed";
  } catch (const RedactError &e) {
    EXPECT_EQ(e.code(), ErrorCode::AudioExtractFailed);
    EXPECT_NE(std::string(e.what()).find("Conversion failed!"),
              std::string::npos);
  }
  EXPECT_EQ(runner.calls.size(), 1u);
  EXPECT_FALSE(fs::exists(audio.path));
  EXPECT_FALSE(fs::exists(output));
}

TEST_F(AudioReattacherTest, MuxFailureLeavesNoOutputAndNoAudio) {
  FakeRunner runner(2);
  AudioReattacher reattacher(false, &runner);

  try {
    reattacher.finalize(video, audio, muxed, input, output);
    FAIL() << "expected AudioMuxFailed";
  } catch (const RedactError &e) {
    EXPECT_EQ(e.code(), ErrorCode::AudioMuxFailed);
  }
  EXPECT_EQ(runner.calls.size(), 2u);
  EXPECT_FALSE(fs::exists(output));
  EXPECT_FALSE(fs::exists(muxed.path));
  EXPECT_FALSE(fs::exists(audio.path));
}
