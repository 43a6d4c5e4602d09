/**
 * @file serialization.cpp
 * @brief JSON encoding implementation
 */

#include "scene_cut/serialization.hpp"

#include "scene_cut/timecode.hpp"

namespace scene_cut {

using json = nlohmann::json;

void to_json(json &j, const Rational &r) {
  j = json{{"num", r.num}, {"den", r.den}};
}

void to_json(json &j, const VideoInfo &info) {
  j = json{{"duration", info.duration},
           {"fps", info.fps.value()},
           {"frame_rate", info.fps},
           {"width", info.width},
           {"height", info.height},
           {"total_frames", info.total_frames}};
}

void to_json(json &j, const Scene &scene) {
  j = json{{"scene_number", scene.scene_number},
           {"start_frame", scene.start_frame},
           {"end_frame", scene.end_frame},
           {"start_time", scene.start_time},
           {"end_time", scene.end_time},
           {"duration", scene.duration}};
}

void to_json(json &j, const FrameRange &range) {
  j = json{{"start_frame", range.start_frame},
           {"end_frame", range.end_frame},
           {"frame_count", range.frame_count}};
}

void to_json(json &j, const ExtractionPlan &plan) {
  j = plan.range;
  j["start_time"] = round_millis(plan.start_time);
  j["duration"] = round_millis(plan.duration);
}

void to_json(json &j, const DetectionReport &report) {
  j = json{{"scenes", report.scenes},
           {"video", report.info},
           {"detector", to_string(report.source)},
           {"fps", report.fps},
           {"min_scene_length", report.min_scene_length_sec},
           {"threshold", report.threshold}};
  if (report.source == DetectorKind::Fallback) {
    j["primary_failure"] = {{"status", to_string(report.primary_status)},
                            {"detail", report.primary_detail}};
  }
}

} // namespace scene_cut
