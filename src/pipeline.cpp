/**
 * @file pipeline.cpp
 * @brief Per-source workflow implementation
 */

#include "scene_cut/pipeline.hpp"

#include <utility>

#include <fmt/core.h>

#include "scene_cut/errors.hpp"
#include "scene_cut/ffmpeg_executor.hpp"
#include "scene_cut/frame_range.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/timecode.hpp"

namespace scene_cut {

// **---- Constructors ----**

ScenePipeline::ScenePipeline(std::string in, DetectorConfig config,
                             int stream_id)
    : ScenePipeline(std::move(in), config, DetectorBackends::system(config),
                    execute_ffmpeg_extract, stream_id) {}

ScenePipeline::ScenePipeline(std::string in, DetectorConfig config,
                             DetectorBackends backends, Executor executor,
                             int stream_id)
    : input_path(std::move(in)), stream_id_(stream_id),
      probe_(backends.probe), detector_(std::move(config), std::move(backends)),
      executor_(std::move(executor)) {}

// **---- Logging Helpers ----**

void ScenePipeline::log_info(const std::string &msg) {
  if (stream_id_ >= 0) {
    LOG_INFO("[Stream {}] {}", stream_id_, msg);
  } else {
    LOG_INFO("{}", msg);
  }
}

void ScenePipeline::log_phase(const std::string &msg) {
  if (stream_id_ >= 0) {
    LOG_PHASE("[Stream {}] {}", stream_id_, msg);
  } else {
    LOG_PHASE("{}", msg);
  }
}

// **---- Detection ----**

DetectionReport ScenePipeline::detect(const DetectionOptions &options) {
  log_phase("Scene detection...");
  DetectionReport report = detector_.run(input_path, options);
  log_info(fmt::format("{} scenes over {} frames ({}) via {} detector",
                       report.scenes.size(), report.info.total_frames,
                       format_time(report.info.duration),
                       to_string(report.source)));
  return report;
}

// **---- Extraction ----**

ExtractionPlan ScenePipeline::plan(const ExtractionRequest &request) {
  VideoInfo info = probe_(input_path);
  double fps = (request.fps && *request.fps > 0) ? *request.fps
                                                 : info.fps.value();

  FrameRange range = compute_and_validate_range(
      request.scene, request.offset_frames, request.extract_frame_count,
      info.total_frames, Config::max_extract_frames());

  ExtractionPlan result = plan_extraction(range, fps);
  log_info(fmt::format("Range {}-{} ({} frames) -> {} + {:.3f}s",
                       range.start_frame, range.end_frame, range.frame_count,
                       format_time(result.start_time), result.duration));
  return result;
}

ExtractionPlan ScenePipeline::extract(const ExtractionRequest &request,
                                      const std::string &output_path) {
  log_phase("Extraction...");
  ExtractionPlan result = plan(request);

  int status = executor_(input_path, output_path, result, stream_id_);
  if (status != 0) {
    throw ExtractionError(
        fmt::format("ffmpeg returned {} for {}", status, output_path), status);
  }

  log_info(fmt::format("Wrote {}", output_path));
  return result;
}

} // namespace scene_cut
