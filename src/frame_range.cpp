/**
 * @file frame_range.cpp
 * @brief Frame range derivation and validation implementation
 */

#include "scene_cut/frame_range.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "scene_cut/errors.hpp"
#include "scene_cut/timecode.hpp"

namespace scene_cut {

ValidationError::ValidationError(std::vector<std::string> errors)
    : Error(fmt::format("Invalid frame range: {}", fmt::join(errors, ", "))),
      errors_(std::move(errors)) {}

FrameRange compute_range(const Scene &scene, int64_t offset_frames,
                         std::optional<int64_t> extract_frame_count,
                         int64_t total_frames) {
  int64_t new_start = scene.start_frame + offset_frames;
  int64_t new_end;

  if (extract_frame_count && *extract_frame_count > 0) {
    /// Fixed-length window; the scene's own length is ignored
    new_end = new_start + *extract_frame_count - 1;
  } else {
    new_end = new_start + (scene.end_frame - scene.start_frame);
  }

  new_start = std::max<int64_t>(1, new_start);
  new_end = std::min(total_frames, new_end);

  if (new_start > new_end) {
    /// Collapse to a single frame; never past the last frame
    new_start = std::max<int64_t>(1, std::min(new_start, total_frames));
    new_end = new_start;
  }

  return {new_start, new_end, new_end - new_start + 1};
}

int64_t effective_frame_limit(int64_t configured) {
  if (configured <= 0)
    return MAX_EXTRACT_FRAMES;
  return std::min<int64_t>(configured, MAX_EXTRACT_FRAMES);
}

RangeValidation validate_range(int64_t start_frame, int64_t end_frame,
                               int64_t total_frames, int64_t max_frames) {
  RangeValidation v;
  max_frames = effective_frame_limit(max_frames);

  if (start_frame < 1)
    v.errors.push_back("Start frame must be a positive integer");

  if (end_frame < 1)
    v.errors.push_back("End frame must be a positive integer");

  if (start_frame > end_frame)
    v.errors.push_back("Start frame must be less than or equal to end frame");

  if (end_frame > total_frames)
    v.errors.push_back(
        fmt::format("End frame cannot exceed total frames ({})", total_frames));

  v.frame_count = end_frame - start_frame + 1;
  if (v.frame_count > max_frames)
    v.errors.push_back(
        fmt::format("Cannot extract more than {} frames at once", max_frames));

  v.valid = v.errors.empty();
  return v;
}

FrameRange compute_and_validate_range(const Scene &scene, int64_t offset_frames,
                                      std::optional<int64_t> extract_frame_count,
                                      int64_t total_frames,
                                      int64_t max_frames) {
  auto out_of_bounds = [](int64_t value) {
    return value > MAX_FRAME_VALUE || value < -MAX_FRAME_VALUE;
  };

  std::vector<std::string> errors;
  if (out_of_bounds(scene.start_frame) || out_of_bounds(scene.end_frame))
    errors.push_back("Scene frames are out of range");
  if (out_of_bounds(offset_frames))
    errors.push_back("Offset is out of range");
  if (extract_frame_count && out_of_bounds(*extract_frame_count))
    errors.push_back("Frame count is out of range");
  if (out_of_bounds(total_frames))
    errors.push_back("Total frames is out of range");
  if (!errors.empty())
    throw ValidationError(std::move(errors));

  FrameRange range =
      compute_range(scene, offset_frames, extract_frame_count, total_frames);
  RangeValidation v = validate_range(range.start_frame, range.end_frame,
                                     total_frames, max_frames);
  if (!v.valid)
    throw ValidationError(std::move(v.errors));
  return range;
}

ExtractionPlan plan_extraction(const FrameRange &range, double fps) {
  ExtractionPlan plan;
  plan.range = range;
  plan.start_time = frame_start_time(range.start_frame, fps);
  plan.duration = fps > 0 ? static_cast<double>(range.frame_count) / fps : 0.0;
  return plan;
}

} // namespace scene_cut
