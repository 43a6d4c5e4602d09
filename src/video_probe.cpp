/**
 * @file video_probe.cpp
 * @brief Video metadata extraction implementation
 */

#include "scene_cut/video_probe.hpp"

#include "scene_cut/errors.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/media_source.hpp"
#include "scene_cut/timecode.hpp"

namespace scene_cut {

VideoInfo probe_video(const std::string &path) {
  TIMER_START(probe);

  MediaSource source(path);
  if (!source.open())
    throw ProbeError(source.error());

  if (!source.has_decoder())
    throw ProbeError("video stream is not decodable");

  VideoInfo info;
  info.duration = source.duration();
  info.fps = source.frame_rate();
  info.width = source.width();
  info.height = source.height();

  if (!info.fps.valid())
    throw ProbeError("video stream has no usable frame rate");

  info.total_frames = compute_total_frames(info.duration, info.fps);
  if (info.total_frames < 1)
    throw ProbeError("video stream has no frames");

  TIMER_END(probe);
  LOG_INFO("Probed {}: {}x{}, {} ({} frames @ {}/{} fps)", path, info.width,
           info.height, format_time(info.duration), info.total_frames,
           info.fps.num, info.fps.den);
  return info;
}

} // namespace scene_cut
