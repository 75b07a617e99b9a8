/**
 * @file video_codec.cpp
 * @brief libav decode/encode bridge implementation
 *
 * @details Decoding follows the send_packet/receive_frame loop with an
 *          explicit drain at end of file. Encoding rescales packet
 *          timestamps from the encoder time base to the stream time base
 *          and interleaves them into the container.
 *
 * @note Frames cross the bridge as BGR24 cv::Mat. Pixel format conversion
 *       on both sides goes through cached libswscale contexts.
 */

#include "region_redact/video_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

extern "C" {
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
}

#include <fmt/core.h>

#include "region_redact/errors.hpp"
#include "region_redact/logging.hpp"
#include "region_redact/types.hpp"

namespace region_redact {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::string lower_extension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

/// Prefer yuv420p when the encoder lists it, else its first format
AVPixelFormat pick_pixel_format(const AVCodec *codec) {
  if (!codec->pix_fmts)
    return AV_PIX_FMT_YUV420P;
  for (const AVPixelFormat *p = codec->pix_fmts; *p != AV_PIX_FMT_NONE; ++p) {
    if (*p == AV_PIX_FMT_YUV420P)
      return *p;
  }
  return codec->pix_fmts[0];
}

} // anonymous namespace

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE]{};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

// **---- Codec Selection ----**

const CodecEntry &CodecTable::select(const fs::path &output_path) const {
  auto it = entries_.find(lower_extension(output_path));
  return it == entries_.end() ? fallback_ : it->second;
}

const CodecTable &default_codec_table() {
  static const CodecTable table(
      {
          {".mp4", {"libx264", ""}},
          {".avi", {"mpeg4", "XVID"}},
          {".mov", {"mpeg4", ""}},
          {".mkv", {"libx264", ""}},
          {".flv", {"flv", ""}},
          {".webm", {"libvpx", ""}},
          {".ts", {"libx264", ""}},
      },
      {"mpeg4", ""});
  return table;
}

int64_t compute_target_bitrate(const fs::path &output_path,
                               int64_t source_bitrate) {
  if (lower_extension(output_path) != ".mp4")
    return 0;
  if (source_bitrate <= 0)
    return DEFAULT_MP4_BITRATE;
  return std::max<int64_t>(source_bitrate / 2, MIN_MP4_BITRATE);
}

// **---- VideoReader ----**

VideoReader::~VideoReader() { close(); }

void VideoReader::close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (dec_ctx_)
    avcodec_free_context(&dec_ctx_);
  if (fmt_ctx_)
    avformat_close_input(&fmt_ctx_);
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
  video_stream_idx_ = -1;
  draining_ = false;
  frame_count_declared_ = false;
}

bool VideoReader::open(const std::string &path) {
  close();

  int ret = avformat_open_input(&fmt_ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    last_error_ = fmt::format("avformat_open_input failed: {}",
                              av_error_string(ret));
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx_, nullptr);
  if (ret < 0) {
    last_error_ = fmt::format("avformat_find_stream_info failed: {}",
                              av_error_string(ret));
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  /// Find the best video stream
  video_stream_idx_ =
      av_find_best_stream(fmt_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx_ < 0) {
    last_error_ = "no video stream found";
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  /// Audio is reattached from the original file later, skip it here
  for (unsigned int i = 0; i < fmt_ctx_->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx_)) {
      fmt_ctx_->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVStream *stream = fmt_ctx_->streams[video_stream_idx_];
  AVCodecParameters *param = stream->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    last_error_ = fmt::format("no decoder for codec id {}",
                              static_cast<int>(param->codec_id));
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  dec_ctx_ = avcodec_alloc_context3(codec);
  if (!dec_ctx_) {
    last_error_ = "failed to allocate decoder context";
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  ret = avcodec_parameters_to_context(dec_ctx_, param);
  if (ret < 0) {
    last_error_ = fmt::format("avcodec_parameters_to_context failed: {}",
                              av_error_string(ret));
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  ret = avcodec_open2(dec_ctx_, codec, nullptr);
  if (ret < 0) {
    last_error_ =
        fmt::format("avcodec_open2 failed: {}", av_error_string(ret));
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
  if (!frame_ || !pkt_) {
    last_error_ = "failed to allocate frame/packet";
    LOG_ERROR("{}: {}", path, last_error_);
    return false;
  }

  // **--- STREAM PROPERTIES ---**

  width_ = dec_ctx_->width;
  height_ = dec_ctx_->height;

  AVRational rate = av_guess_frame_rate(fmt_ctx_, stream, nullptr);
  fps_ = (rate.num > 0 && rate.den > 0) ? av_q2d(rate) : 0.0;

  /// Declared count; estimated from duration when the container omits it
  frame_count_ = stream->nb_frames;
  frame_count_declared_ = frame_count_ > 0;
  if (frame_count_ <= 0 && fps_ > 0) {
    double duration_sec = 0;
    if (stream->duration != AV_NOPTS_VALUE) {
      duration_sec = stream->duration * av_q2d(stream->time_base);
    } else if (fmt_ctx_->duration != AV_NOPTS_VALUE) {
      duration_sec = fmt_ctx_->duration / static_cast<double>(AV_TIME_BASE);
    }
    frame_count_ = static_cast<int64_t>(std::llround(duration_sec * fps_));
  }

  bitrate_ = param->bit_rate > 0 ? param->bit_rate : fmt_ctx_->bit_rate;
  if (bitrate_ < 0)
    bitrate_ = 0;

  LOG_DEBUG("Opened {}: {}x{} @ {:.2f}fps, {} frames, {} bit/s, codec {}",
            path, width_, height_, fps_, frame_count_, bitrate_,
            codec->name);
  return true;
}

bool VideoReader::convert_frame(cv::Mat &out) {
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_, frame_->width, frame_->height,
      static_cast<AVPixelFormat>(frame_->format), frame_->width,
      frame_->height, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr,
      nullptr);
  if (!sws_ctx_) {
    last_error_ = "cannot create BGR conversion context";
    return false;
  }

  out.create(frame_->height, frame_->width, CV_8UC3);
  uint8_t *dst_data[1] = {out.data};
  int dst_linesize[1] = {static_cast<int>(out.step[0])};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height,
            dst_data, dst_linesize);
  return true;
}

ReadStatus VideoReader::read(cv::Mat &frame) {
  if (!dec_ctx_) {
    last_error_ = "reader is not open";
    return ReadStatus::Error;
  }

  while (true) {
    int ret = avcodec_receive_frame(dec_ctx_, frame_);
    if (ret == 0) {
      bool ok = convert_frame(frame);
      av_frame_unref(frame_);
      return ok ? ReadStatus::Frame : ReadStatus::Error;
    }
    if (ret == AVERROR_EOF)
      return ReadStatus::EndOfStream;
    if (ret != AVERROR(EAGAIN)) {
      last_error_ = fmt::format("decode error: {}", av_error_string(ret));
      return ReadStatus::Error;
    }

    /// Decoder wants input
    if (draining_)
      return ReadStatus::EndOfStream;

    ret = av_read_frame(fmt_ctx_, pkt_);
    if (ret == AVERROR_EOF) {
      /// Enter drain mode to collect buffered frames
      draining_ = true;
      ret = avcodec_send_packet(dec_ctx_, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        last_error_ = fmt::format("flush error: {}", av_error_string(ret));
        return ReadStatus::Error;
      }
      continue;
    }
    if (ret < 0) {
      last_error_ = fmt::format("read error: {}", av_error_string(ret));
      return ReadStatus::Error;
    }

    if (pkt_->stream_index != video_stream_idx_) {
      av_packet_unref(pkt_);
      continue;
    }

    ret = avcodec_send_packet(dec_ctx_, pkt_);
    av_packet_unref(pkt_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      last_error_ = fmt::format("decode error: {}", av_error_string(ret));
      return ReadStatus::Error;
    }
  }
}

// **---- VideoWriter ----**

VideoWriter::~VideoWriter() { release(); }

void VideoWriter::release() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
  if (enc_ctx_)
    avcodec_free_context(&enc_ctx_);
  if (ofmt_ctx_) {
    if (!(ofmt_ctx_->oformat->flags & AVFMT_NOFILE))
      avio_closep(&ofmt_ctx_->pb);
    avformat_free_context(ofmt_ctx_);
    ofmt_ctx_ = nullptr;
  }
  stream_ = nullptr;
  header_written_ = false;
}

void VideoWriter::open(const std::string &path, int width, int height,
                       double fps, int64_t bitrate_hint) {
  release();
  finished_ = false;
  next_pts_ = 0;
  path_ = path;
  width_ = width;
  height_ = height;

  int ret =
      avformat_alloc_output_context2(&ofmt_ctx_, nullptr, nullptr, path.c_str());
  if (ret < 0 || !ofmt_ctx_) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("No container format for {}: {}", path,
                                  av_error_string(ret)));
  }

  // **--- ENCODER SELECTION ---**

  const CodecEntry *entry = &table_.select(path);
  const AVCodec *encoder = avcodec_find_encoder_by_name(entry->encoder.c_str());
  if (!encoder && entry != &table_.fallback()) {
    LOG_WARN("Encoder {} unavailable, falling back to {}", entry->encoder,
             table_.fallback().encoder);
    entry = &table_.fallback();
    encoder = avcodec_find_encoder_by_name(entry->encoder.c_str());
  }
  if (!encoder) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Encoder {} not available", entry->encoder));
  }
  encoder_name_ = encoder->name;

  enc_ctx_ = avcodec_alloc_context3(encoder);
  if (!enc_ctx_) {
    throw RedactError(ErrorCode::EncodeFailed,
                      "Failed to allocate encoder context");
  }

  if (fps <= 0) {
    LOG_WARN("Source frame rate unknown, writing at 25fps");
    fps = 25.0;
  }
  AVRational frame_rate = av_d2q(fps, 100000);

  enc_ctx_->width = width;
  enc_ctx_->height = height;
  enc_ctx_->pix_fmt = pick_pixel_format(encoder);
  enc_ctx_->time_base = av_inv_q(frame_rate);
  enc_ctx_->framerate = frame_rate;
  enc_ctx_->gop_size = 12;

  /// Best-effort hint, some encoders ignore it (e.g. libx264 in crf mode)
  if (bitrate_hint > 0)
    enc_ctx_->bit_rate = bitrate_hint;

  if (ofmt_ctx_->oformat->flags & AVFMT_GLOBALHEADER)
    enc_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

  ret = avcodec_open2(enc_ctx_, encoder, nullptr);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Cannot open encoder {}: {}", encoder->name,
                                  av_error_string(ret)));
  }

  stream_ = avformat_new_stream(ofmt_ctx_, nullptr);
  if (!stream_) {
    throw RedactError(ErrorCode::EncodeFailed, "Failed allocating stream");
  }
  ret = avcodec_parameters_from_context(stream_->codecpar, enc_ctx_);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Failed to copy encoder parameters: {}",
                                  av_error_string(ret)));
  }
  stream_->time_base = enc_ctx_->time_base;
  stream_->avg_frame_rate = frame_rate;

  if (entry->fourcc.size() == 4) {
    stream_->codecpar->codec_tag =
        MKTAG(entry->fourcc[0], entry->fourcc[1], entry->fourcc[2],
              entry->fourcc[3]);
  }

  // **--- OUTPUT FILE ---**

  if (!(ofmt_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&ofmt_ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      throw RedactError(ErrorCode::EncodeFailed,
                        fmt::format("Could not open output file {}: {}", path,
                                    av_error_string(ret)));
    }
  }

  ret = avformat_write_header(ofmt_ctx_, nullptr);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Error writing header for {}: {}", path,
                                  av_error_string(ret)));
  }
  header_written_ = true;

  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
  if (!frame_ || !pkt_) {
    throw RedactError(ErrorCode::EncodeFailed,
                      "Failed to allocate frame/packet");
  }
  frame_->format = enc_ctx_->pix_fmt;
  frame_->width = width;
  frame_->height = height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Failed to allocate frame buffer: {}",
                                  av_error_string(ret)));
  }

  sws_ctx_ = sws_getContext(width, height, AV_PIX_FMT_BGR24, width, height,
                            enc_ctx_->pix_fmt, SWS_BILINEAR, nullptr, nullptr,
                            nullptr);
  if (!sws_ctx_) {
    throw RedactError(ErrorCode::EncodeFailed,
                      "Cannot create encoder conversion context");
  }

  LOG_DEBUG("Writer {}: encoder {}, {}x{} @ {:.2f}fps, bitrate hint {}", path,
            encoder_name_, width, height, fps, bitrate_hint);
}

void VideoWriter::write(const cv::Mat &frame) {
  if (!header_written_ || finished_) {
    throw RedactError(ErrorCode::EncodeFailed, "Writer is not open");
  }
  if (frame.cols != width_ || frame.rows != height_ ||
      frame.type() != CV_8UC3) {
    throw RedactError(
        ErrorCode::EncodeFailed,
        fmt::format("Frame {}x{} does not match writer size {}x{}", frame.cols,
                    frame.rows, width_, height_));
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Frame not writable: {}",
                                  av_error_string(ret)));
  }

  const uint8_t *src_data[1] = {frame.data};
  int src_linesize[1] = {static_cast<int>(frame.step[0])};
  sws_scale(sws_ctx_, src_data, src_linesize, 0, height_, frame_->data,
            frame_->linesize);

  frame_->pts = next_pts_++;
  encode(frame_);
}

void VideoWriter::encode(AVFrame *frame) {
  int ret = avcodec_send_frame(enc_ctx_, frame);
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Error sending frame to encoder: {}",
                                  av_error_string(ret)));
  }

  while (true) {
    ret = avcodec_receive_packet(enc_ctx_, pkt_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      return;
    if (ret < 0) {
      throw RedactError(ErrorCode::EncodeFailed,
                        fmt::format("Error encoding frame: {}",
                                    av_error_string(ret)));
    }

    av_packet_rescale_ts(pkt_, enc_ctx_->time_base, stream_->time_base);
    pkt_->stream_index = stream_->index;

    /// av_interleaved_write_frame takes ownership and resets the packet
    ret = av_interleaved_write_frame(ofmt_ctx_, pkt_);
    if (ret < 0) {
      throw RedactError(ErrorCode::EncodeFailed,
                        fmt::format("Error muxing packet: {}",
                                    av_error_string(ret)));
    }
  }
}

void VideoWriter::close() {
  if (!header_written_ || finished_)
    return;

  /// Flush delayed frames
  encode(nullptr);

  int ret = av_write_trailer(ofmt_ctx_);
  finished_ = true;
  if (ret < 0) {
    throw RedactError(ErrorCode::EncodeFailed,
                      fmt::format("Error writing trailer for {}: {}", path_,
                                  av_error_string(ret)));
  }

  if (!(ofmt_ctx_->oformat->flags & AVFMT_NOFILE))
    avio_closep(&ofmt_ctx_->pb);
}

} // namespace region_redact
