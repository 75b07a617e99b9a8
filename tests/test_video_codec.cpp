#include <gtest/gtest.h>

#include <map>
#include <string>

#include "region_redact/errors.hpp"
#include "region_redact/video_codec.hpp"
#include "test_helpers.hpp"

using namespace region_redact;
namespace fs = std::filesystem;

// **---- Codec table ----**

TEST(CodecTable, DefaultMapping) {
  const CodecTable &table = default_codec_table();

  EXPECT_EQ(table.select("a.mp4").encoder, "libx264");
  EXPECT_EQ(table.select("a.mkv").encoder, "libx264");
  EXPECT_EQ(table.select("a.ts").encoder, "libx264");
  EXPECT_EQ(table.select("a.avi").encoder, "mpeg4");
  EXPECT_EQ(table.select("a.avi").fourcc, "XVID");
  EXPECT_EQ(table.select("a.mov").encoder, "mpeg4");
  EXPECT_EQ(table.select("a.flv").encoder, "flv");
  EXPECT_EQ(table.select("a.webm").encoder, "libvpx");
}

TEST(CodecTable, ExtensionMatchIsCaseInsensitive) {
  EXPECT_EQ(default_codec_table().select("/x/CLIP.MP4").encoder, "libx264");
  EXPECT_EQ(default_codec_table().select("/x/clip.Avi").fourcc, "XVID");
}

TEST(CodecTable, UnknownExtensionUsesFallback) {
  const CodecTable &table = default_codec_table();
  EXPECT_EQ(table.select("a.xyz").encoder, "mpeg4");
  EXPECT_EQ(table.select("noext").encoder, table.fallback().encoder);
}

// **---- Bitrate rule ----**

TEST(TargetBitrate, Mp4HalvesSourceWithFloor) {
  EXPECT_EQ(compute_target_bitrate("out.mp4", 4000000), 2000000);
  EXPECT_EQ(compute_target_bitrate("out.mp4", 600000), 500000);
  EXPECT_EQ(compute_target_bitrate("out.MP4", 1000000), 500000);
}

TEST(TargetBitrate, Mp4UnknownSourceUsesDefault) {
  EXPECT_EQ(compute_target_bitrate("out.mp4", 0), 1000000);
  EXPECT_EQ(compute_target_bitrate("out.mp4", -1), 1000000);
}

TEST(TargetBitrate, OtherContainersLeaveEncoderDefault) {
  EXPECT_EQ(compute_target_bitrate("out.avi", 4000000), 0);
  EXPECT_EQ(compute_target_bitrate("out.mkv", 4000000), 0);
}

// **---- Reader / writer ----**

TEST(VideoReader, MissingFileFailsToOpen) {
  VideoReader reader;
  EXPECT_FALSE(reader.open("/nonexistent/clip.mp4"));
  EXPECT_FALSE(reader.last_error().empty());
}

TEST(VideoReader, GarbageFileYieldsNoFrame) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "broken.mp4";
  test_support::write_text_file(path, std::string(4096, 'x'));

  VideoReader reader;
  if (reader.open(path.string())) {
    cv::Mat frame;
    EXPECT_NE(reader.read(frame), ReadStatus::Frame);
  } else {
    EXPECT_FALSE(reader.last_error().empty());
  }
}

TEST(VideoReader, ReadBeforeOpenIsAnError) {
  VideoReader reader;
  cv::Mat frame;
  EXPECT_EQ(reader.read(frame), ReadStatus::Error);
}

TEST(VideoCodec, WrittenClipReadsBackWithSameGeometry) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "clip.avi";
  test_support::write_test_clip(path, 64, 48, 10);

  VideoReader reader;
  ASSERT_TRUE(reader.open(path.string())) << reader.last_error();
  EXPECT_EQ(reader.width(), 64);
  EXPECT_EQ(reader.height(), 48);
  EXPECT_NEAR(reader.fps(), 25.0, 0.01);

  int frames = 0;
  cv::Mat frame;
  ReadStatus status;
  while ((status = reader.read(frame)) == ReadStatus::Frame) {
    EXPECT_EQ(frame.cols, 64);
    EXPECT_EQ(frame.rows, 48);
    EXPECT_EQ(frame.type(), CV_8UC3);
    ++frames;
  }
  EXPECT_EQ(status, ReadStatus::EndOfStream);
  EXPECT_EQ(frames, 10);

  /// End of stream is sticky
  EXPECT_EQ(reader.read(frame), ReadStatus::EndOfStream);
}

TEST(VideoWriter, CountsWrittenFrames) {
  test_support::TempDir dir;
  VideoWriter writer;
  writer.open((dir.path() / "count.avi").string(), 32, 32, 25.0, 0);
  cv::Mat frame(32, 32, CV_8UC3, cv::Scalar(10, 20, 30));
  for (int i = 0; i < 5; ++i)
    writer.write(frame);
  writer.close();

  EXPECT_EQ(writer.frames_written(), 5);
  EXPECT_EQ(writer.encoder_name(), "mpeg4");
}

TEST(VideoWriter, FrameSizeMismatchThrows) {
  test_support::TempDir dir;
  VideoWriter writer;
  writer.open((dir.path() / "size.avi").string(), 32, 32, 25.0, 0);

  cv::Mat wrong(16, 32, CV_8UC3, cv::Scalar::all(0));
  try {
    writer.write(wrong);
    FAIL() << "expected EncodeFailed";
  } catch (const RedactError &e) {
    EXPECT_EQ(e.code(), ErrorCode::EncodeFailed);
  }
}

TEST(VideoWriter, WriteBeforeOpenThrows) {
  VideoWriter writer;
  cv::Mat frame(32, 32, CV_8UC3, cv::Scalar::all(0));
  EXPECT_THROW(writer.write(frame), RedactError);
}

TEST(VideoWriter, UnavailableEncoderFallsBack) {
  std::map<std::string, CodecEntry> entries{
      {".avi", CodecEntry{"no_such_encoder", ""}}};
  CodecTable table(entries, CodecEntry{"mpeg4", ""});
  test_support::TempDir dir;

  VideoWriter writer(table);
  writer.open((dir.path() / "fallback.avi").string(), 32, 32, 25.0, 0);
  EXPECT_EQ(writer.encoder_name(), "mpeg4");
  writer.close();
}

TEST(VideoWriter, UnknownFrameRateDefaultsTo25) {
  test_support::TempDir dir;
  fs::path path = dir.path() / "norate.avi";
  {
    VideoWriter writer;
    writer.open(path.string(), 32, 32, 0.0, 0);
    cv::Mat frame(32, 32, CV_8UC3, cv::Scalar::all(90));
    writer.write(frame);
    writer.close();
  }

  VideoReader reader;
  ASSERT_TRUE(reader.open(path.string()));
  EXPECT_NEAR(reader.fps(), 25.0, 0.01);
}
