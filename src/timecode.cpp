/**
 * @file timecode.cpp
 * @brief Frame index / timestamp conversions implementation
 */

#include "scene_cut/timecode.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

namespace scene_cut {

// **---- Frame / Time ----**

int64_t compute_total_frames(double duration, const Rational &fps) {
  if (duration <= 0 || !fps.valid())
    return 0;
  /// Multiply before dividing so 30000/1001 sources do not pick up the
  /// rounding error of the decimal rate
  return static_cast<int64_t>(std::llround(
      duration * static_cast<double>(fps.num) / static_cast<double>(fps.den)));
}

double frame_start_time(int64_t frame, double fps) {
  return fps > 0 ? static_cast<double>(frame - 1) / fps : 0.0;
}

double frame_end_time(int64_t frame, double fps) {
  return fps > 0 ? static_cast<double>(frame) / fps : 0.0;
}

int64_t seconds_to_frames(double seconds, double fps) {
  int64_t frames = static_cast<int64_t>(std::llround(seconds * fps));
  return std::max<int64_t>(1, frames);
}

double round_millis(double seconds) {
  return std::round(seconds * 1000.0) / 1000.0;
}

// **---- Parameter Normalization ----**

double normalize_min_scene_length(double value, double fps,
                                  const DetectorConfig &cfg) {
  double seconds = value;
  if (seconds > cfg.frame_count_cutoff && fps > 0) {
    seconds = seconds / fps;
  }
  return std::clamp(seconds, cfg.min_scene_length_floor,
                    cfg.min_scene_length_ceiling);
}

double normalize_threshold(double value, const DetectorConfig &cfg) {
  if (std::isnan(value))
    return cfg.default_threshold;
  return std::clamp(value, cfg.threshold_min, cfg.threshold_max);
}

double fallback_threshold(double user_threshold) {
  return std::clamp(user_threshold / 100.0, 0.0, 1.0);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  long total_ms = std::lround(std::max(0.0, seconds) * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

} // namespace scene_cut
