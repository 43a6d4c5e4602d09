/**
 * @file scene_detection.cpp
 * @brief Scene detection orchestration implementation
 */

#include "scene_cut/scene_detection.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/core.h>

#include "scene_cut/errors.hpp"
#include "scene_cut/fallback_detector.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/timecode.hpp"
#include "scene_cut/video_probe.hpp"

namespace scene_cut {

const char *to_string(DetectorKind kind) {
  return kind == DetectorKind::Primary ? "primary" : "fallback";
}

// **---- Backends ----**

DetectorBackends DetectorBackends::system(const DetectorConfig &config) {
  DetectorBackends b;
  b.probe = [](const std::string &path) { return probe_video(path); };
  b.primary = [command = config.primary_command,
               timeout = config.primary_timeout_sec](const PrimaryRequest &req) {
    return run_primary_detector(req, command, timeout);
  };
  b.fallback_signal = [step = config.signal_frame_step,
                       width = config.signal_analysis_width](
                          const std::string &path) {
    return open_content_signal(path, step, width);
  };
  return b;
}

// **---- Normalization ----**

std::vector<Scene> normalize_scenes(std::vector<Scene> scenes,
                                    const VideoInfo &info) {
  std::stable_sort(scenes.begin(), scenes.end(),
                   [](const Scene &a, const Scene &b) {
                     return a.start_frame < b.start_frame;
                   });

  const int64_t total = info.total_frames;
  const double duration = std::max(0.0, info.duration);

  std::vector<Scene> out;
  out.reserve(scenes.size());
  for (Scene s : scenes) {
    s.start_frame = std::max<int64_t>(1, s.start_frame);
    s.end_frame = std::min(total, s.end_frame);
    if (s.start_frame > s.end_frame)
      continue; //< Entirely outside the stream after clamping

    s.start_time = std::clamp(s.start_time, 0.0, duration);
    s.end_time = std::clamp(s.end_time, s.start_time, duration);
    out.push_back(s);
  }

  if (!out.empty()) {
    out.front().start_frame = 1;
    out.front().start_time = 0.0;
    out.back().end_frame = total;
    out.back().end_time = duration;
  }

  for (size_t i = 0; i < out.size(); ++i) {
    Scene &s = out[i];
    s.scene_number = static_cast<int>(i + 1);
    /// Rounding must not push a time past the stream end
    s.end_time = std::min(round_millis(s.end_time), duration);
    s.start_time = std::min(round_millis(s.start_time), s.end_time);
    s.duration = round_millis(s.end_time - s.start_time);
  }
  return out;
}

bool is_gapless(const std::vector<Scene> &scenes, int64_t total_frames) {
  if (scenes.empty() || total_frames < 1)
    return false;
  if (scenes.front().start_frame != 1 ||
      scenes.back().end_frame != total_frames)
    return false;

  for (size_t i = 0; i < scenes.size(); ++i) {
    if (scenes[i].start_frame > scenes[i].end_frame)
      return false;
    if (i > 0 && scenes[i].start_frame != scenes[i - 1].end_frame + 1)
      return false;
  }
  return true;
}

// **---- Orchestrator ----**

SceneDetectionOrchestrator::SceneDetectionOrchestrator(
    DetectorConfig config, DetectorBackends backends)
    : config_(std::move(config)), backends_(std::move(backends)) {}

std::vector<Scene>
SceneDetectionOrchestrator::detect_scenes(const std::string &path,
                                          const DetectionOptions &options) const {
  return run(path, options).scenes;
}

DetectionReport
SceneDetectionOrchestrator::run(const std::string &path,
                                const DetectionOptions &options) const {
  TIMER_START(detect_total);

  DetectionReport report;
  report.info = backends_.probe(path);

  // **---- PARAMETER NORMALIZATION ----**

  report.fps = (options.fps && *options.fps > 0) ? *options.fps
                                                 : report.info.fps.value();

  double min_len = options.min_scene_length.value_or(
      config_.default_min_scene_length);
  if (std::isnan(min_len))
    min_len = config_.default_min_scene_length;
  report.min_scene_length_sec =
      normalize_min_scene_length(min_len, report.fps, config_);

  report.threshold = normalize_threshold(
      options.threshold.value_or(config_.default_threshold), config_);

  LOG_PHASE("Detecting scenes: {}", path);
  LOG_INFO("threshold={}, min_length={:.3f}s, fps={:.3f}", report.threshold,
           report.min_scene_length_sec, report.fps);

  // **---- PRIMARY ----**

  PrimaryRequest request{path, report.threshold, report.min_scene_length_sec,
                         report.fps};
  PrimaryResult primary = backends_.primary
                              ? backends_.primary(request)
                              : PrimaryResult::failure(
                                    PrimaryStatus::SpawnFailed,
                                    "no primary detector configured");

  if (primary.ok()) {
    std::vector<Scene> scenes =
        normalize_scenes(std::move(primary.scenes), report.info);
    if (is_gapless(scenes, report.info.total_frames)) {
      report.scenes = std::move(scenes);
      report.source = DetectorKind::Primary;
      TIMER_END(detect_total);
      LOG_SUCCESS("Primary detector found {} scenes", report.scenes.size());
      return report;
    }
    primary = PrimaryResult::failure(PrimaryStatus::InvalidOutput,
                                     "scenes do not cover the stream without "
                                     "gaps or overlaps");
  }

  report.primary_status = primary.status;
  report.primary_detail = primary.detail;
  LOG_WARN("Primary detector {}: {}. Falling back to frame difference "
           "detection",
           to_string(primary.status), primary.detail);

  report = run_fallback(path, std::move(report));
  TIMER_END(detect_total);
  return report;
}

DetectionReport
SceneDetectionOrchestrator::run_fallback(const std::string &path,
                                         DetectionReport report) const {
  /// Decode positions and duration come from the probe, so scene times must
  /// use the probed rate even when the caller overrode fps
  const double native_fps = report.info.fps.value();

  FallbackParams params;
  params.threshold = fallback_threshold(report.threshold);
  params.min_scene_frames =
      seconds_to_frames(report.min_scene_length_sec, native_fps);
  params.fps = native_fps;
  params.total_frames = report.info.total_frames;
  params.duration = report.info.duration;

  if (!backends_.fallback_signal)
    throw DetectionError("no fallback signal source configured");

  std::vector<Scene> raw;
  try {
    raw = detect_fallback_scenes(backends_.fallback_signal(path), params);
  } catch (const DetectionError &) {
    throw;
  } catch (const std::exception &e) {
    throw DetectionError(e.what());
  }

  std::vector<Scene> scenes = normalize_scenes(std::move(raw), report.info);
  if (!is_gapless(scenes, report.info.total_frames))
    throw DetectionError("fallback scenes do not cover the stream");

  report.scenes = std::move(scenes);
  report.source = DetectorKind::Fallback;
  LOG_SUCCESS("Fallback detector found {} scenes", report.scenes.size());
  return report;
}

} // namespace scene_cut
