/**
 * @file fallback_detector.cpp
 * @brief Frame-difference scene boundary detector implementation
 */

#include "scene_cut/fallback_detector.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "scene_cut/errors.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/timecode.hpp"

namespace scene_cut {

namespace {

Scene make_scene(int64_t start_frame, int64_t end_frame, double end_time,
                 double fps) {
  Scene s;
  s.start_frame = start_frame;
  s.end_frame = end_frame;
  s.start_time = frame_start_time(start_frame, fps);
  s.end_time = end_time;
  s.duration = s.end_time - s.start_time;
  return s;
}

} // anonymous namespace

std::vector<Scene> detect_fallback_scenes(ContentSignal signal,
                                          const FallbackParams &params) {
  if (params.total_frames < 1)
    throw DetectionError("source has no frames");
  if (params.fps <= 0)
    throw DetectionError(fmt::format("invalid frame rate {}", params.fps));

  const int64_t min_frames = std::max<int64_t>(1, params.min_scene_frames);
  const int64_t total = params.total_frames;

  LOG_INFO("Fallback detector: threshold={:.3f}, min_length={} frames, "
           "total={} frames",
           params.threshold, min_frames, total);

  std::vector<Scene> scenes;
  int64_t open_start = 1;

  TIMER_START(fallback_detect);

  SignalSample sample;
  while (signal.next(sample)) {
    /// A cut on the last frame would leave an empty scene behind it
    if (sample.frame < open_start || sample.frame >= total)
      continue;

    if (sample.score > params.threshold &&
        sample.frame - open_start >= min_frames) {
      scenes.push_back(make_scene(open_start, sample.frame,
                                  frame_end_time(sample.frame, params.fps),
                                  params.fps));
      open_start = sample.frame + 1;
    }
  }

  TIMER_END(fallback_detect);

  // **---- TRAILING SCENE ----**

  const int64_t tail = total - open_start;
  if (scenes.empty() || 2 * tail >= min_frames) {
    scenes.push_back(make_scene(open_start, total, params.duration, params.fps));
  } else {
    /// Short tail: extend the last scene so coverage stays gapless
    Scene &last = scenes.back();
    last.end_frame = total;
    last.end_time = params.duration;
    last.duration = last.end_time - last.start_time;
  }

  for (size_t i = 0; i < scenes.size(); ++i)
    scenes[i].scene_number = static_cast<int>(i + 1);

  LOG_INFO("Fallback detector: {} samples, {} scenes", signal.consumed(),
           scenes.size());
  return scenes;
}

} // namespace scene_cut
