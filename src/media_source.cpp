/**
 * @file media_source.cpp
 * @brief FFmpeg demuxer/decoder ownership implementation
 */

#include "scene_cut/media_source.hpp"

extern "C" {
#include <libavutil/error.h>
}

#include <fmt/core.h>


namespace scene_cut {

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

MediaSource::MediaSource(std::string path) : path_(std::move(path)) {}

MediaSource::~MediaSource() {
  /// Free decoder context first
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);

  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MediaSource::open() {
  /// Open input (probes the container format)
  int ret = avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    /// avformat_open_input frees the context on failure
    fmt_ctx = nullptr;
    error_ = fmt::format("cannot open '{}': {}", path_, av_error_string(ret));
    return false;
  }

  /// Find stream info (reads some packets to determine streams)
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    error_ = fmt::format("cannot read stream info: {}", av_error_string(ret));
    return false;
  }

  /// Find the best video stream
  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    error_ = "no video stream found";
    return false;
  }

  /// Discard non-video streams to save processing time
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  return true;
}

bool MediaSource::has_decoder() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return false;
  const AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  return avcodec_find_decoder(param->codec_id) != nullptr;
}

bool MediaSource::open_decoder(int thread_count) {
  if (!fmt_ctx || video_stream_idx < 0) {
    error_ = "source not opened";
    return false;
  }

  /// Find decoder for the video stream
  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    error_ = fmt::format("no decoder for codec '{}'",
                         avcodec_get_name(param->codec_id));
    return false;
  }

  /// Allocate decoder context
  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    error_ = "failed to allocate decoder context";
    return false;
  }

  int ret = avcodec_parameters_to_context(dec_ctx, param);
  if (ret < 0) {
    error_ = fmt::format("cannot copy codec parameters: {}",
                         av_error_string(ret));
    return false;
  }

  // **--- DECODER OPTIMIZATIONS ---**

  /// Skip in-loop deblocking filter (only coarse luma is compared)
  dec_ctx->skip_loop_filter = AVDISCARD_ALL;
  dec_ctx->flags2 |= AV_CODEC_FLAG2_FAST;
  dec_ctx->thread_count = thread_count;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0) {
    error_ = fmt::format("avcodec_open2 failed: {}", av_error_string(ret));
    return false;
  }

  return true;
}

double MediaSource::duration() const {
  if (!fmt_ctx)
    return 0.0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
    return fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);

  /// Some containers only carry a per-stream duration
  if (video_stream_idx >= 0) {
    const AVStream *st = fmt_ctx->streams[video_stream_idx];
    if (st->duration != AV_NOPTS_VALUE && st->duration > 0)
      return st->duration * av_q2d(st->time_base);
  }
  return 0.0;
}

Rational MediaSource::frame_rate() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return {0, 1};

  AVStream *st = fmt_ctx->streams[video_stream_idx];
  AVRational r = st->r_frame_rate;
  if (r.num <= 0 || r.den <= 0) {
    r = av_guess_frame_rate(fmt_ctx, st, nullptr);
  }
  if (r.num <= 0 || r.den <= 0)
    return {0, 1};

  /// Keep the rational reduced so equal rates compare equal
  av_reduce(&r.num, &r.den, r.num, r.den, INT32_MAX);
  return {r.num, r.den};
}

int MediaSource::width() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return 0;
  return fmt_ctx->streams[video_stream_idx]->codecpar->width;
}

int MediaSource::height() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return 0;
  return fmt_ctx->streams[video_stream_idx]->codecpar->height;
}

} // namespace scene_cut
