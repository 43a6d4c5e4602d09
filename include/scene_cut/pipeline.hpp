/**
 * @file pipeline.hpp
 * @brief Per-source workflows: detection and frame-accurate extraction
 *
 * @details The ScenePipeline class runs the two request types on one source:
 *
 *          detect():
 *
 *          1. Probe video metadata
 *
 *          2. Run primary detection, fall back if needed
 *
 *          3. Return the normalized scene list
 *
 *          extract():
 *
 *          1. Probe video metadata
 *
 *          2. Compute the range from scene, offset and length
 *
 *          3. Validate the range (ValidationError, nothing executed)
 *
 *          4. Translate frames to time and run FFmpeg (ExtractionError)
 *
 * @note Nothing is cached between calls. Each request recomputes from the
 *       source, so an interrupted request leaves no partial state behind.
 *       When stream_id >= 0 all log messages are prefixed with [Stream N].
 */

#ifndef SCENE_CUT_PIPELINE_HPP
#define SCENE_CUT_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "config.hpp"
#include "scene_detection.hpp"
#include "types.hpp"

namespace scene_cut {

/**
 * @struct ExtractionRequest
 * @brief Scene selection plus offset/length intent.
 */
struct ExtractionRequest {
  Scene scene;                                //< start_frame/end_frame used
  int64_t offset_frames = 0;                  //< may be negative
  std::optional<int64_t> extract_frame_count; //< fixed length when > 0
  std::optional<double> fps;                  //< overrides the probed rate
};

/**
 * @class ScenePipeline
 * @brief Runs detection and extraction requests for one source file.
 */
class ScenePipeline {
public:
  /// Runs ffmpeg; returns 0 on success (see execute_ffmpeg_extract)
  using Executor = std::function<int(const std::string &, const std::string &,
                                     const ExtractionPlan &, int)>;

  /**
   * @brief Construct a pipeline with the system backends.
   * @param in Input file path
   * @param config Detection defaults and bounds
   * @param stream_id Stream ID for log prefixing (-1 = no prefix, default)
   */
  ScenePipeline(std::string in, DetectorConfig config, int stream_id = -1);

  /**
   * @brief Construct a pipeline with injected collaborators.
   */
  ScenePipeline(std::string in, DetectorConfig config,
                DetectorBackends backends, Executor executor,
                int stream_id = -1);

  /**
   * @brief Detect scenes in the input.
   * @throws ProbeError, DetectionError
   */
  DetectionReport detect(const DetectionOptions &options = {});

  /**
   * @brief Compute and validate the extraction plan without executing it.
   * @throws ProbeError, ValidationError
   */
  ExtractionPlan plan(const ExtractionRequest &request);

  /**
   * @brief Plan and execute an extraction into output_path.
   * @throws ProbeError, ValidationError, ExtractionError
   */
  ExtractionPlan extract(const ExtractionRequest &request,
                         const std::string &output_path);

  const std::string &input() const { return input_path; }

private:
  std::string input_path;
  int stream_id_; //< Stream ID for log prefixing (-1 = no prefix)
  std::function<VideoInfo(const std::string &)> probe_;
  SceneDetectionOrchestrator detector_;
  Executor executor_;

  /**
   * @brief Log a message with optional stream prefix.
   */
  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);
};

} // namespace scene_cut

#endif // SCENE_CUT_PIPELINE_HPP
