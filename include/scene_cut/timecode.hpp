/**
 * @file timecode.hpp
 * @brief Frame index / timestamp conversions and parameter normalization
 *
 * @details Every frame<->time mapping in the project goes through these
 *          helpers so that a detection call and a later extraction call on the
 *          same source agree to the frame.
 *
 *          Frame numbers are 1-indexed. Frame n covers the interval
 *          [(n - 1) / fps, n / fps).
 */

#ifndef SCENE_CUT_TIMECODE_HPP
#define SCENE_CUT_TIMECODE_HPP

#include <cstdint>
#include <string>

#include "config.hpp"
#include "types.hpp"

namespace scene_cut {

// **---- Frame / Time ----**

/// round(duration * fps); the anchor for every other conversion
int64_t compute_total_frames(double duration, const Rational &fps);

/// Start time of a 1-indexed frame: (frame - 1) / fps
double frame_start_time(int64_t frame, double fps);

/// End time of a 1-indexed frame: frame / fps
double frame_end_time(int64_t frame, double fps);

/// round(seconds * fps), never below 1
int64_t seconds_to_frames(double seconds, double fps);

/// Round to millisecond precision
double round_millis(double seconds);

// **---- Parameter Normalization ----**

/**
 * @brief Normalize a minimum scene length to seconds.
 *
 * @note Values above cfg.frame_count_cutoff are read as a frame count and
 *       divided by fps. The result is clamped to
 *       [cfg.min_scene_length_floor, cfg.min_scene_length_ceiling].
 *       A genuine 301-second request is therefore read as 301 frames.
 *
 * @param value Requested length (seconds, or frames when above the cutoff)
 * @param fps Frame rate used for the frame-count interpretation
 * @param cfg Detection bounds
 * @return Minimum scene length in seconds
 */
double normalize_min_scene_length(double value, double fps,
                                  const DetectorConfig &cfg);

/// Clamp a user threshold into [cfg.threshold_min, cfg.threshold_max]
double normalize_threshold(double value, const DetectorConfig &cfg);

/**
 * @brief Map a user threshold (1-100) onto the [0, 1] difference scale.
 * @note Monotonic: a higher threshold always yields a less sensitive cut.
 */
double fallback_threshold(double user_threshold);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.mmm string.
 */
std::string format_time(double seconds);

} // namespace scene_cut

#endif // SCENE_CUT_TIMECODE_HPP
