/**
 * @file fallback_detector.hpp
 * @brief Deterministic frame-difference scene boundary detector
 *
 * @details Walks a ContentSignal once. Whenever a sample's score exceeds the
 *          threshold and at least min_scene_frames have passed since the open
 *          scene started, the open scene is closed at that frame and the next
 *          one opens at frame + 1. When the signal ends the remainder up to
 *          total_frames becomes a trailing scene, or is folded into the last
 *          scene when it is shorter than half of min_scene_frames.
 *
 *          The result always covers [1, total_frames] without gaps and is
 *          never empty for total_frames >= 1.
 */

#ifndef SCENE_CUT_FALLBACK_DETECTOR_HPP
#define SCENE_CUT_FALLBACK_DETECTOR_HPP

#include <cstdint>
#include <vector>

#include "content_signal.hpp"
#include "types.hpp"

namespace scene_cut {

/**
 * @struct FallbackParams
 * @brief Inputs of one fallback detection pass.
 */
struct FallbackParams {
  double threshold = 0.2;       //< cut when score > threshold, [0, 1]
  int64_t min_scene_frames = 1; //< round(min length seconds * fps)
  double fps = 0.0;
  int64_t total_frames = 0;
  double duration = 0.0;
};

/**
 * @brief Split [1, total_frames] into scenes from a content signal.
 *
 * @param signal Consumed completely; cannot be reused
 * @param params Threshold, minimum length and stream geometry
 * @return Ordered, gapless scenes (times not yet rounded)
 * @throws DetectionError on invalid geometry or a failing signal source
 */
std::vector<Scene> detect_fallback_scenes(ContentSignal signal,
                                          const FallbackParams &params);

} // namespace scene_cut

#endif // SCENE_CUT_FALLBACK_DETECTOR_HPP
