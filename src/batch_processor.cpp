/**
 * @file batch_processor.cpp
 * @brief Concurrent scene detection implementation
 */

#include "scene_cut/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "scene_cut/errors.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/pipeline.hpp"
#include "scene_cut/serialization.hpp"
#include "scene_cut/system.hpp"

namespace scene_cut {

namespace fs = std::filesystem;

std::vector<std::string> collect_video_files(const std::string &dir) {
  std::vector<std::string> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
        ext == ".avi" || ext == ".webm") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

BatchProcessor::BatchProcessor(DetectorConfig config, int num_streams)
    : config_(std::move(config)),
      num_streams_(calculate_parallel_streams(num_streams)) {}

int BatchProcessor::process(const std::vector<std::string> &input_files,
                            const std::string &output_dir,
                            const DetectionOptions &options) {
  if (input_files.empty()) {
    LOG_WARN("No input files to process");
    return 0;
  }

  TaskQueue queue;
  int id = 0;
  for (const auto &file : input_files) {
    fs::path out =
        fs::path(output_dir) / (fs::path(file).stem().string() + ".scenes.json");
    queue.push({file, out.string(), id++});
  }
  queue.finish();

  int workers = std::min(num_streams_, static_cast<int>(input_files.size()));

  LOG_PHASE("================== BATCH DETECTION ==================");
  LOG_INFO("Files to process: {}", input_files.size());
  LOG_INFO("Parallel streams: {}", workers);
  LOG_PHASE("=====================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  ResultCollector results;
  std::vector<std::thread> streams;
  for (int i = 0; i < workers; ++i) {
    streams.emplace_back(&BatchProcessor::stream_worker, this, i,
                         std::ref(queue), std::ref(results), std::cref(options));
  }
  for (auto &stream : streams) {
    stream.join();
  }

  auto batch_end = std::chrono::high_resolution_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  std::vector<FileResult> collected = results.extract();
  print_batch_summary(collected, elapsed_sec);

  return static_cast<int>(
      std::count_if(collected.begin(), collected.end(),
                    [](const FileResult &r) { return !r.success; }));
}

void BatchProcessor::stream_worker(int stream_id, TaskQueue &queue,
                                   ResultCollector &results,
                                   const DetectionOptions &options) {
  DetectTask task;
  while (queue.pop(task)) {
    FileResult result;
    result.filename = fs::path(task.input_path).filename().string();

    LOG_INFO("[Stream {}] Processing: {}", stream_id, result.filename);
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
      ScenePipeline pipeline(task.input_path, config_, stream_id);
      DetectionReport report = pipeline.detect(options);

      std::ofstream out(task.output_path);
      if (!out)
        throw Error(fmt::format("cannot write {}", task.output_path));
      out << nlohmann::json(report).dump(2) << '\n';
      if (!out)
        throw Error(fmt::format("write failed for {}", task.output_path));

      result.success = true;
      result.used_fallback = report.source == DetectorKind::Fallback;
      result.scene_count = report.scenes.size();
    } catch (const Error &e) {
      result.error = e.what();
    } catch (const std::exception &e) {
      /// Filesystem and allocation failures: report per file, keep going
      result.error = fmt::format("unexpected error: {}", e.what());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.processing_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                              start_time)
            .count();

    if (result.success) {
      LOG_SUCCESS("[Stream {}] Completed: {} ({} scenes, {:.1f}s)", stream_id,
                  result.filename, result.scene_count,
                  result.processing_time_us / 1000000.0);
    } else {
      LOG_ERROR("[Stream {}] Failed: {}: {}", stream_id, result.filename,
                result.error);
    }
    results.add(std::move(result));
  }

  LOG_INFO("[Stream {}] Finished (no more files)", stream_id);
}

void BatchProcessor::print_batch_summary(const std::vector<FileResult> &results,
                                         double wall_clock_sec) {
  int total = static_cast<int>(results.size());
  int success = 0;
  int fallback = 0;
  long total_time_us = 0;

  for (const auto &result : results) {
    if (result.success)
      success++;
    if (result.used_fallback)
      fallback++;
    total_time_us += result.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "============== BATCH DETECTION SUMMARY ==============\n");
  fmt::print(stderr, "{:<25} {:>25}\n", "Total files:", total);
  fmt::print(stderr, "{:<25} {:>25}\n", "Successful:", success);
  fmt::print(stderr, "{:<25} {:>25}\n", "Failed:", total - success);
  fmt::print(stderr, "{:<25} {:>25}\n", "Used fallback:", fallback);
  fmt::print(stderr, "{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print(stderr, "{:<25} {:>22.1f}s\n", "Sum of file times:", sum_time_sec);
  fmt::print(stderr, "{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  fmt::print(stderr, fg(fmt::color::cyan),
             "=====================================================\n");

  if (success < total) {
    fmt::print(stderr, fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : results) {
      if (!result.success) {
        fmt::print(stderr, fg(fmt::color::red), "  - {}: {}\n",
                   result.filename, result.error);
      }
    }
  }
  std::fflush(stderr);
}

} // namespace scene_cut
