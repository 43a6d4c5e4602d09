/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "scene_cut/ffmpeg_executor.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "scene_cut/config.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/process_runner.hpp"

namespace scene_cut {

std::vector<std::string> build_extract_command(const std::string &ffmpeg_bin,
                                               const std::string &input_path,
                                               const std::string &output_path,
                                               const ExtractionPlan &plan) {
  /// Input-side -ss seeks fast; re-encoding makes the first frame exact
  return {ffmpeg_bin,
          "-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-ss",
          fmt::format("{:.6f}", plan.start_time),
          "-i",
          input_path,
          "-t",
          fmt::format("{:.6f}", plan.duration),
          "-c:v",
          "libx264",
          "-preset",
          "fast",
          "-crf",
          "18",
          "-c:a",
          "aac",
          "-b:a",
          "192k",
          "-avoid_negative_ts",
          "make_zero",
          output_path};
}

int execute_ffmpeg_extract(const std::string &input_path,
                           const std::string &output_path,
                           const ExtractionPlan &plan, int stream_id) {
  if (plan.range.frame_count < 1 || plan.duration <= 0) {
    if (stream_id >= 0) {
      LOG_WARN("[Stream {}] Empty extraction plan", stream_id);
    } else {
      LOG_WARN("Empty extraction plan");
    }
    return -1;
  }

  auto argv = build_extract_command(Config::ffmpeg_bin(), input_path,
                                    output_path, plan);

  if (stream_id >= 0) {
    LOG_INFO("[Stream {}] Extracting frames {}-{} -> {}", stream_id,
             plan.range.start_frame, plan.range.end_frame,
             std::filesystem::path(output_path).filename().string());
  } else {
    LOG_INFO("Extracting frames {}-{} ({:.3f}s, {:.3f}s duration) -> {}",
             plan.range.start_frame, plan.range.end_frame, plan.start_time,
             plan.duration,
             std::filesystem::path(output_path).filename().string());
  }

  TIMER_START(ffmpeg_extract);
  /// No timeout: encode time scales with the segment, not with a hang
  ProcessResult proc = run_process(argv, 0);
  TIMER_END(ffmpeg_extract);

  if (!proc.succeeded()) {
    std::string reason = describe(proc);
    if (stream_id >= 0) {
      LOG_ERROR("[Stream {}] FFmpeg failed ({}): {}", stream_id, reason,
                proc.err);
    } else {
      LOG_ERROR("FFmpeg failed ({}): {}", reason, proc.err);
    }
    if (!proc.spawned)
      return 127;
    return proc.exit_code != 0 ? proc.exit_code : 128 + proc.term_signal;
  }

  return 0;
}

} // namespace scene_cut
