/**
 * @file batch_processor.hpp
 * @brief Concurrent scene detection over a directory of videos
 *
 * @details The BatchProcessor class runs independent detection requests in
 *          parallel:
 *
 *          - Spawns num_streams worker threads
 *
 *          - Workers pull files from a shared TaskQueue
 *
 *          - Each file gets its own ScenePipeline; nothing is shared between
 *            requests except the queue, the result collector and the log
 *
 *          - Results are written as `<name>.scenes.json` in the output dir
 *
 * @note PARALLEL_STREAMS controls the worker count (0 = CPU limit).
 */

#ifndef SCENE_CUT_BATCH_PROCESSOR_HPP
#define SCENE_CUT_BATCH_PROCESSOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace scene_cut {

/**
 * @brief List video files (by extension) in a directory, sorted.
 */
std::vector<std::string> collect_video_files(const std::string &dir);

/**
 * @class BatchProcessor
 * @brief Orchestrates parallel detection across many files.
 */
class BatchProcessor {
public:
  /**
   * @brief Construct a batch processor.
   * @param config Detection defaults shared by every request
   * @param num_streams Number of parallel workers (0 = auto-detect, capped
   *                    at the CPU limit)
   */
  explicit BatchProcessor(DetectorConfig config, int num_streams = 0);

  /**
   * @brief Detect scenes in every input file.
   *
   * @param input_files List of input video file paths
   * @param output_dir Output directory for the JSON results
   * @param options Detection options applied to every file
   * @return Number of failures (0 = all succeeded)
   */
  int process(const std::vector<std::string> &input_files,
              const std::string &output_dir,
              const DetectionOptions &options = {});

  int num_streams() const { return num_streams_; }

private:
  DetectorConfig config_;
  int num_streams_;

  /**
   * @brief Worker function for each stream thread.
   */
  void stream_worker(int stream_id, TaskQueue &queue, ResultCollector &results,
                     const DetectionOptions &options);

  /**
   * @brief Print final batch summary.
   * @param results Per-file outcomes
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(const std::vector<FileResult> &results,
                           double wall_clock_sec);
};

} // namespace scene_cut

#endif // SCENE_CUT_BATCH_PROCESSOR_HPP
