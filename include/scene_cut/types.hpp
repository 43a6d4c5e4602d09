/**
 * @file types.hpp
 * @brief Core data types for Scene Cut
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Rational for exact frame rates
 *
 *          - VideoInfo for probed stream metadata
 *
 *          - Scene, FrameRange and ExtractionPlan
 *
 *          - SignalSample for the fallback content signal
 */

#ifndef SCENE_CUT_TYPES_HPP
#define SCENE_CUT_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scene_cut {

// **----- CONSTANTS -----**

/// Largest frame range a single extraction may cover
constexpr int MAX_EXTRACT_FRAMES = 1000;

/// Largest magnitude accepted for a frame index, offset or count (2^40);
/// keeps every sum in compute_range() far from int64 overflow
constexpr int64_t MAX_FRAME_VALUE = int64_t(1) << 40;

// **----- DATA STRUCTURES -----**

/**
 * @struct Rational
 * @brief Exact frame rate as numerator/denominator.
 * @note Mirrors AVRational. Keeping the rational form means every call on the
 *       same source derives the same frame/time mapping.
 */
struct Rational {
  int64_t num = 0;
  int64_t den = 1;

  double value() const {
    return den != 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
  }
  bool valid() const { return num > 0 && den > 0; }
};

/**
 * @struct VideoInfo
 * @brief Probed metadata of the best video stream.
 */
struct VideoInfo {
  double duration = 0.0; //< Container duration in seconds
  Rational fps;          //< Exact frame rate
  int width = 0;
  int height = 0;
  int64_t total_frames = 0; //< round(duration * fps)
};

/**
 * @struct Scene
 * @brief A contiguous, 1-indexed frame interval [start_frame, end_frame].
 */
struct Scene {
  int scene_number = 0;
  int64_t start_frame = 0;
  int64_t end_frame = 0;
  double start_time = 0.0;
  double end_time = 0.0;
  double duration = 0.0;
};

/**
 * @struct FrameRange
 * @brief Inclusive frame range handed to extraction.
 */
struct FrameRange {
  int64_t start_frame = 0;
  int64_t end_frame = 0;
  int64_t frame_count = 0; //< end_frame - start_frame + 1
};

/**
 * @struct RangeValidation
 * @brief Outcome of validate_range(); every violated rule is listed.
 */
struct RangeValidation {
  bool valid = false;
  std::vector<std::string> errors;
  int64_t frame_count = 0;
};

/**
 * @struct ExtractionPlan
 * @brief Validated frame range translated to a seek position and length.
 */
struct ExtractionPlan {
  FrameRange range;
  double start_time = 0.0; //< (start_frame - 1) / fps
  double duration = 0.0;   //< frame_count / fps
};

/**
 * @struct SignalSample
 * @brief One content-difference measurement.
 * @note score is in [0, 1]; frame is the 1-indexed decode position of the
 *       analyzed frame compared against its predecessor.
 */
struct SignalSample {
  int64_t frame = 0;
  double score = 0.0;
};

/**
 * @struct DetectionOptions
 * @brief Per-request detection options; unset fields take config defaults.
 */
struct DetectionOptions {
  std::optional<double> fps;              //< Overrides the probed rate
  std::optional<double> min_scene_length; //< Seconds, or frames when > 300
  std::optional<double> threshold;        //< Sensitivity, 1-100
};

} // namespace scene_cut

#endif // SCENE_CUT_TYPES_HPP
