/**
 * @file content_signal.cpp
 * @brief Content-difference signal implementation
 *
 * @details The decode-backed producer owns a FrameDifferenceReader through a
 *          shared_ptr so the Producer stays copy-constructible, as
 *          std::function requires. ContentSignal itself is still move-only.
 *
 * @attention HOT PATH:
 *
 *          - Luma planes are pre-allocated once and swapped per frame
 *
 *          - Scaling goes straight to GRAY8, chroma is never converted
 */

#include "scene_cut/content_signal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <utility>

extern "C" {
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

#include <fmt/core.h>

#include "scene_cut/errors.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/media_source.hpp"

namespace scene_cut {

// **---- ContentSignal ----**

ContentSignal::ContentSignal(Producer producer)
    : producer_(std::move(producer)) {
  if (!producer_)
    exhausted_ = true;
}

bool ContentSignal::next(SignalSample &sample) {
  if (exhausted_)
    return false;

  if (!producer_(sample)) {
    exhausted_ = true;
    /// Release the source as soon as the sequence ends
    producer_ = nullptr;
    return false;
  }

  ++consumed_;
  return true;
}

ContentSignal ContentSignal::from_samples(std::vector<SignalSample> samples) {
  auto data = std::make_shared<std::vector<SignalSample>>(std::move(samples));
  auto pos = std::make_shared<size_t>(0);
  return ContentSignal([data, pos](SignalSample &out) {
    if (*pos >= data->size())
      return false;
    out = (*data)[(*pos)++];
    return true;
  });
}

// **---- Decode-backed producer ----**

namespace {

/**
 * @class FrameDifferenceReader
 * @brief Decodes a video and scores consecutive analyzed frames.
 */
class FrameDifferenceReader {
  MediaSource source;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  SwsContext *sws_ctx = nullptr;

  int frame_step;
  int analysis_width;
  int plane_w = 0;
  int plane_h = 0;

  std::vector<uint8_t> prev_plane;
  std::vector<uint8_t> cur_plane;
  bool have_prev = false;

  int64_t decoded = 0; //< 1-indexed position of the last decoded frame
  bool draining = false;
  bool finished = false;

  /// Downscale the current frame into cur_plane
  void scale_frame();

  /// Mean absolute difference between cur_plane and prev_plane in [0, 1]
  double score_planes() const;

  /**
   * @brief Decode the next frame into `frame`.
   * @return false at end of stream
   */
  bool decode_next();

public:
  FrameDifferenceReader(const std::string &path, int step, int width)
      : source(path), frame_step(std::max(1, step)),
        analysis_width(std::max(8, width)) {
    frame = av_frame_alloc();
    pkt = av_packet_alloc();
  }

  ~FrameDifferenceReader() {
    if (sws_ctx)
      sws_freeContext(sws_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  FrameDifferenceReader(const FrameDifferenceReader &) = delete;
  FrameDifferenceReader &operator=(const FrameDifferenceReader &) = delete;

  void open() {
    if (!frame || !pkt)
      throw DetectionError("failed to allocate decode buffers");
    if (!source.open() || !source.open_decoder())
      throw DetectionError(source.error());
  }

  bool next(SignalSample &sample);
};

bool FrameDifferenceReader::decode_next() {
  AVCodecContext *dec_ctx = source.decoder();
  AVFormatContext *fmt_ctx = source.format();

  while (!finished) {
    int ret = avcodec_receive_frame(dec_ctx, frame);
    if (ret >= 0) {
      ++decoded;
      return true;
    }
    if (ret == AVERROR_EOF) {
      finished = true;
      break;
    }
    if (ret != AVERROR(EAGAIN)) {
      throw DetectionError(
          fmt::format("decode failed at frame {}: {}", decoded + 1,
                      av_error_string(ret)));
    }

    /// Decoder wants more input
    if (draining) {
      finished = true;
      break;
    }

    ret = av_read_frame(fmt_ctx, pkt);
    if (ret < 0) {
      /// End of input (or unreadable tail): flush the decoder
      draining = true;
      avcodec_send_packet(dec_ctx, nullptr);
      continue;
    }

    if (pkt->stream_index == source.stream_index()) {
      ret = avcodec_send_packet(dec_ctx, pkt);
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
        av_packet_unref(pkt);
        throw DetectionError(fmt::format("cannot send packet to decoder: {}",
                                         av_error_string(ret)));
      }
    }
    av_packet_unref(pkt);
  }
  return false;
}

void FrameDifferenceReader::scale_frame() {
  int w = std::min(analysis_width, frame->width);
  int h = std::max(1, static_cast<int>(std::lround(
                          static_cast<double>(frame->height) * w /
                          std::max(1, frame->width))));

  if (w != plane_w || h != plane_h) {
    plane_w = w;
    plane_h = h;
    cur_plane.assign(static_cast<size_t>(w) * h, 0);
    prev_plane.assign(static_cast<size_t>(w) * h, 0);
    /// A resolution change restarts the comparison chain
    have_prev = false;
  }

  sws_ctx = sws_getCachedContext(
      sws_ctx, frame->width, frame->height,
      static_cast<AVPixelFormat>(frame->format), plane_w, plane_h,
      AV_PIX_FMT_GRAY8, SWS_AREA, nullptr, nullptr, nullptr);
  if (!sws_ctx)
    throw DetectionError("cannot create scaler for analysis plane");

  uint8_t *dst[4] = {cur_plane.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {plane_w, 0, 0, 0};
  sws_scale(sws_ctx, frame->data, frame->linesize, 0, frame->height, dst,
            dst_linesize);
}

double FrameDifferenceReader::score_planes() const {
  const size_t n = cur_plane.size();
  if (n == 0)
    return 0.0;

  const uint8_t *__restrict a = cur_plane.data();
  const uint8_t *__restrict b = prev_plane.data();
  uint64_t sad = 0;
  for (size_t i = 0; i < n; ++i) {
    sad += static_cast<uint64_t>(std::abs(static_cast<int>(a[i]) - b[i]));
  }
  return static_cast<double>(sad) / (static_cast<double>(n) * 255.0);
}

bool FrameDifferenceReader::next(SignalSample &sample) {
  while (decode_next()) {
    /// Frame skipping: analyze decode positions 1, 1 + step, 1 + 2*step, ...
    if ((decoded - 1) % frame_step != 0) {
      av_frame_unref(frame);
      continue;
    }

    scale_frame();
    av_frame_unref(frame);

    if (!have_prev) {
      /// First analyzed frame has nothing to be compared against
      cur_plane.swap(prev_plane);
      have_prev = true;
      continue;
    }

    sample.frame = decoded;
    sample.score = score_planes();
    cur_plane.swap(prev_plane);
    return true;
  }

  LOG_INFO("Content signal finished after {} decoded frames", decoded);
  return false;
}

} // anonymous namespace

ContentSignal open_content_signal(const std::string &path, int frame_step,
                                  int analysis_width) {
  auto reader =
      std::make_shared<FrameDifferenceReader>(path, frame_step, analysis_width);
  reader->open();
  return ContentSignal(
      [reader](SignalSample &sample) { return reader->next(sample); });
}

} // namespace scene_cut
