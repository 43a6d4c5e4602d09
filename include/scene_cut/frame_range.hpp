/**
 * @file frame_range.hpp
 * @brief Frame range derivation and validation for extraction
 *
 * @details compute_range() applies, in this order: offset, then length, then
 *          clamping. Clamping first would silently change the duration the
 *          caller asked for.
 */

#ifndef SCENE_CUT_FRAME_RANGE_HPP
#define SCENE_CUT_FRAME_RANGE_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace scene_cut {

/**
 * @brief Derive a candidate range from a selected scene.
 *
 * @param scene Selected scene (only start_frame/end_frame are used)
 * @param offset_frames Shift applied to the scene start; may be negative
 * @param extract_frame_count Fixed window length when set and > 0, otherwise
 *        the scene's own span is kept
 * @param total_frames Frames in the source
 * @return Range with start >= 1, end <= total_frames and start <= end.
 *         When clamping inverts the range it collapses to one frame.
 * @pre Every input lies within +/- MAX_FRAME_VALUE
 *      (compute_and_validate_range() checks this).
 */
FrameRange compute_range(const Scene &scene, int64_t offset_frames,
                         std::optional<int64_t> extract_frame_count,
                         int64_t total_frames);

/**
 * @brief Cap actually enforced for a configured extraction limit.
 * @note A configured value can only tighten MAX_EXTRACT_FRAMES; zero or
 *       negative means "no override".
 */
int64_t effective_frame_limit(int64_t configured);

/**
 * @brief Check a range against every extraction rule.
 * @note All rules are evaluated; errors lists each violation. max_frames
 *       passes through effective_frame_limit().
 */
RangeValidation validate_range(int64_t start_frame, int64_t end_frame,
                               int64_t total_frames,
                               int64_t max_frames = MAX_EXTRACT_FRAMES);

/**
 * @brief compute_range() followed by validate_range().
 * @throws ValidationError carrying every violated rule, or the out-of-bounds
 *         inputs when any exceeds MAX_FRAME_VALUE
 */
FrameRange compute_and_validate_range(const Scene &scene, int64_t offset_frames,
                                      std::optional<int64_t> extract_frame_count,
                                      int64_t total_frames,
                                      int64_t max_frames = MAX_EXTRACT_FRAMES);

/**
 * @brief Translate a validated range into a seek position and length.
 * @param range Validated range
 * @param fps Frame rate of the source
 */
ExtractionPlan plan_extraction(const FrameRange &range, double fps);

} // namespace scene_cut

#endif // SCENE_CUT_FRAME_RANGE_HPP
