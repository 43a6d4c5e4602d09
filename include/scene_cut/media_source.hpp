/**
 * @file media_source.hpp
 * @brief Owned FFmpeg demuxer/decoder pair for one video file
 *
 * @details MediaSource opens a file, selects the best video stream and,
 *          on request, opens a decoder for it. Both VideoProbe and the
 *          fallback content signal are built on top of it.
 *
 * @attention THREAD MODEL:
 *            - One instance per request. FFmpeg decoder state is not
 *              thread-safe and is never shared.
 */

#ifndef SCENE_CUT_MEDIA_SOURCE_HPP
#define SCENE_CUT_MEDIA_SOURCE_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <string>

#include "types.hpp"

namespace scene_cut {

/**
 * @class MediaSource
 * @brief RAII owner of AVFormatContext / AVCodecContext for a video file.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 */
class MediaSource {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  int video_stream_idx = -1;

  std::string path_;
  std::string error_; //< Reason for the last failed open step

public:
  explicit MediaSource(std::string path);
  ~MediaSource();

  /// Disable copy (FFmpeg contexts are not copyable)
  MediaSource(const MediaSource &) = delete;
  MediaSource &operator=(const MediaSource &) = delete;

  /**
   * @brief Open the container and select the best video stream.
   * @return true on success; error() describes a failure
   */
  bool open();

  /**
   * @brief Open a decoder for the selected stream.
   * @param thread_count Decoder threads (0 = FFmpeg default)
   * @return true on success; error() describes a failure
   */
  bool open_decoder(int thread_count = 0);

  const std::string &error() const { return error_; }
  const std::string &path() const { return path_; }

  /// Container duration in seconds (stream duration as fallback, else 0)
  double duration() const;

  /// Exact frame rate: r_frame_rate, else FFmpeg's guess
  Rational frame_rate() const;

  int width() const;
  int height() const;

  /// Whether a decoder exists for the selected stream's codec
  bool has_decoder() const;

  AVFormatContext *format() const { return fmt_ctx; }
  AVCodecContext *decoder() const { return dec_ctx; }
  int stream_index() const { return video_stream_idx; }
};

/**
 * @brief Render an FFmpeg error code as text.
 */
std::string av_error_string(int errnum);

} // namespace scene_cut

#endif // SCENE_CUT_MEDIA_SOURCE_HPP
