/**
 * @file video_codec.hpp
 * @brief Frame-level video decode and encode on top of libav
 *
 * @details Bridges libavformat/libavcodec streams and OpenCV BGR frames:
 *
 *          - VideoReader: demux + decode the best video stream of a file,
 *            converted to BGR24 through libswscale
 *
 *          - VideoWriter: encode BGR frames into a container chosen by the
 *            output extension, encoder chosen by CodecTable
 *
 *          - CodecTable: output extension -> encoder, with default entry
 *
 * @note Both classes own every libav handle they allocate and release them
 *       in their destructors, so early returns and exceptions never leak.
 */

#ifndef REGION_REDACT_VIDEO_CODEC_HPP
#define REGION_REDACT_VIDEO_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>

#include <opencv2/core.hpp>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

namespace region_redact {

/// Render a libav error code as text
std::string av_error_string(int errnum);

// **----- CODEC SELECTION -----**

/**
 * @struct CodecEntry
 * @brief One row of the codec table.
 */
struct CodecEntry {
  std::string encoder; //< libavcodec encoder name
  std::string fourcc;  //< Container tag override (empty = muxer default)
};

/**
 * @class CodecTable
 * @brief Maps a lower-cased output extension to an encoder.
 */
class CodecTable {
public:
  CodecTable(std::map<std::string, CodecEntry> entries, CodecEntry fallback)
      : entries_(std::move(entries)), fallback_(std::move(fallback)) {}

  /**
   * @brief Select the entry for an output path.
   * @note Extension match is case-insensitive. Unmapped -> fallback.
   */
  const CodecEntry &select(const std::filesystem::path &output_path) const;

  const CodecEntry &fallback() const { return fallback_; }

private:
  std::map<std::string, CodecEntry> entries_;
  CodecEntry fallback_;
};

/**
 * @brief The per-extension encoder table used for redacted outputs.
 *
 * @attention MAPPING:
 *
 *   .mp4 .mkv .ts -> libx264, .avi -> mpeg4 (XVID), .mov -> mpeg4,
 *
 *   .flv -> flv, .webm -> libvpx, anything else -> mpeg4
 */
const CodecTable &default_codec_table();

/**
 * @brief Bitrate hint for the writer.
 * @return For .mp4: max(source / 2, MIN_MP4_BITRATE), or
 *         DEFAULT_MP4_BITRATE when the source bitrate is unknown (<= 0).
 *         For every other extension: 0 (no hint).
 */
int64_t compute_target_bitrate(const std::filesystem::path &output_path,
                               int64_t source_bitrate);

// **----- DECODING -----**

/**
 * @enum ReadStatus
 * @brief Result of VideoReader::read. Clean end of stream and decode errors
 *        are reported separately.
 */
enum class ReadStatus { Frame, EndOfStream, Error };

/**
 * @class VideoReader
 * @brief Sequential frame decoder for one file.
 */
class VideoReader {
public:
  VideoReader() = default;
  ~VideoReader();

  VideoReader(const VideoReader &) = delete;
  VideoReader &operator=(const VideoReader &) = delete;

  /**
   * @brief Open a file and its best video stream.
   * @return false (with a logged reason) if demuxer or decoder refuse it
   */
  bool open(const std::string &path);

  /**
   * @brief Decode the next frame as BGR24.
   * @param frame Output: resized to the decoded frame size
   * @return Frame, EndOfStream, or Error (see last_error())
   */
  ReadStatus read(cv::Mat &frame);

  /// Release all handles (also done by the destructor)
  void close();

  int width() const { return width_; }
  int height() const { return height_; }
  double fps() const { return fps_; }
  int64_t frame_count() const { return frame_count_; } //< 0 = unknown
  /// true when frame_count() comes from the container, not a duration estimate
  bool frame_count_declared() const { return frame_count_declared_; }
  int64_t bitrate() const { return bitrate_; }         //< 0 = unknown
  const std::string &last_error() const { return last_error_; }

private:
  bool convert_frame(cv::Mat &out);

  AVFormatContext *fmt_ctx_ = nullptr;
  AVCodecContext *dec_ctx_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;
  SwsContext *sws_ctx_ = nullptr;
  int video_stream_idx_ = -1;
  bool draining_ = false;

  int width_ = 0;
  int height_ = 0;
  double fps_ = 0;
  int64_t frame_count_ = 0;
  bool frame_count_declared_ = false;
  int64_t bitrate_ = 0;
  std::string last_error_;
};

// **----- ENCODING -----**

/**
 * @class VideoWriter
 * @brief Encodes BGR frames into a new file.
 */
class VideoWriter {
public:
  /**
   * @param table Codec table used to pick the encoder
   */
  explicit VideoWriter(const CodecTable &table = default_codec_table())
      : table_(table) {}
  ~VideoWriter();

  VideoWriter(const VideoWriter &) = delete;
  VideoWriter &operator=(const VideoWriter &) = delete;

  /**
   * @brief Create the output file and open the encoder.
   * @param path Output path; its extension selects container and encoder
   * @param width Frame width
   * @param height Frame height
   * @param fps Frame rate (<= 0 falls back to 25)
   * @param bitrate_hint Target bitrate, 0 = encoder default. Best effort.
   * @throws RedactError EncodeFailed
   */
  void open(const std::string &path, int width, int height, double fps,
            int64_t bitrate_hint);

  /**
   * @brief Encode one frame.
   * @throws RedactError EncodeFailed on size/type mismatch or encoder error
   */
  void write(const cv::Mat &frame);

  /**
   * @brief Flush the encoder and finish the container.
   * @throws RedactError EncodeFailed
   */
  void close();

  const std::string &encoder_name() const { return encoder_name_; }
  int64_t frames_written() const { return next_pts_; }

private:
  void encode(AVFrame *frame);
  void release();

  const CodecTable &table_;
  AVFormatContext *ofmt_ctx_ = nullptr;
  AVCodecContext *enc_ctx_ = nullptr;
  AVStream *stream_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;
  SwsContext *sws_ctx_ = nullptr;
  bool header_written_ = false;
  bool finished_ = false;

  int width_ = 0;
  int height_ = 0;
  int64_t next_pts_ = 0;
  std::string encoder_name_;
  std::string path_;
};

} // namespace region_redact

#endif // REGION_REDACT_VIDEO_CODEC_HPP
