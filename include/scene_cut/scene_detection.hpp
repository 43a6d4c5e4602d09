/**
 * @file scene_detection.hpp
 * @brief Scene detection orchestration with primary/fallback resilience
 *
 * @details SceneDetectionOrchestrator drives one detection request:
 *
 *          1. Probe the source (ProbeError propagates)
 *
 *          2. Normalize min scene length and threshold
 *
 *          3. Run the primary analyzer
 *
 *          4. On any primary failure, run the fallback detector once
 *
 *          5. Normalize the chosen scene list and check coverage
 *
 * @note The detector variants are plain callables in DetectorBackends. The
 *       resilience policy that picks between them lives in the orchestrator,
 *       not in a detector class hierarchy. Tests inject their own backends.
 */

#ifndef SCENE_CUT_SCENE_DETECTION_HPP
#define SCENE_CUT_SCENE_DETECTION_HPP

#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "content_signal.hpp"
#include "primary_detector.hpp"
#include "types.hpp"

namespace scene_cut {

/**
 * @struct DetectorBackends
 * @brief External collaborators of the orchestrator.
 */
struct DetectorBackends {
  std::function<VideoInfo(const std::string &)> probe;
  std::function<PrimaryResult(const PrimaryRequest &)> primary;
  std::function<ContentSignal(const std::string &)> fallback_signal;

  /// FFmpeg probe, child-process analyzer and decode-backed signal
  static DetectorBackends system(const DetectorConfig &config);
};

enum class DetectorKind { Primary, Fallback };

const char *to_string(DetectorKind kind);

/**
 * @struct DetectionReport
 * @brief Scenes plus the parameters and path that produced them.
 */
struct DetectionReport {
  std::vector<Scene> scenes;
  VideoInfo info;
  DetectorKind source = DetectorKind::Primary;
  PrimaryStatus primary_status = PrimaryStatus::Ok;
  std::string primary_detail;
  double fps = 0.0;
  double min_scene_length_sec = 0.0;
  double threshold = 0.0;
};

/**
 * @class SceneDetectionOrchestrator
 * @brief Stateless per request; safe to share across threads.
 */
class SceneDetectionOrchestrator {
public:
  SceneDetectionOrchestrator(DetectorConfig config, DetectorBackends backends);

  /**
   * @brief Detect scenes covering [1, total_frames].
   * @throws ProbeError if the source cannot be probed
   * @throws DetectionError if the fallback detector fails
   */
  std::vector<Scene> detect_scenes(const std::string &path,
                                   const DetectionOptions &options = {}) const;

  /// As detect_scenes(), with the detector path and effective parameters
  DetectionReport run(const std::string &path,
                      const DetectionOptions &options = {}) const;

  const DetectorConfig &config() const { return config_; }

private:
  DetectorConfig config_;
  DetectorBackends backends_;

  DetectionReport run_fallback(const std::string &path,
                               DetectionReport report) const;
};

/**
 * @brief Clamp, snap and renumber a raw scene list.
 *
 * @note Applied identically to primary and fallback output:
 *
 *       - sort by start_frame, drop scenes entirely outside the stream
 *
 *       - clamp frames to [1, total_frames] and times to [0, duration]
 *
 *       - first scene starts at frame 1 / 0s, last ends at total_frames /
 *         duration
 *
 *       - times rounded to milliseconds, duration recomputed
 */
std::vector<Scene> normalize_scenes(std::vector<Scene> scenes,
                                    const VideoInfo &info);

/**
 * @brief Check that scenes are non-empty, ordered and contiguous over
 *        [1, total_frames].
 */
bool is_gapless(const std::vector<Scene> &scenes, int64_t total_frames);

} // namespace scene_cut

#endif // SCENE_CUT_SCENE_DETECTION_HPP
