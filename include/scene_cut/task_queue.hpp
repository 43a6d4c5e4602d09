/**
 * @file task_queue.hpp
 * @brief Thread-safe task queue and result collection for batch detection
 *
 * @details Provides:
 *          - TaskQueue: Shared queue workers pull source files from
 *
 *          - ResultCollector: Thread-safe aggregator for per-file results
 */

#ifndef SCENE_CUT_TASK_QUEUE_HPP
#define SCENE_CUT_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace scene_cut {

/**
 * @struct DetectTask
 * @brief A work unit: one source file to run detection on.
 */
struct DetectTask {
  std::string input_path;
  std::string output_path; //< JSON destination
  int id = 0;
};

/**
 * @struct FileResult
 * @brief Outcome of one batch task.
 */
struct FileResult {
  std::string filename;
  bool success = false;
  bool used_fallback = false;
  size_t scene_count = 0;
  std::string error;
  long processing_time_us = 0;
};

/**
 * @class TaskQueue
 * @brief Thread-safe work queue for dynamic load balancing.
 *
 * @attention DESIGN:
 *
 * - Workers pop tasks from a shared queue
 *
 * - A slow file (long video, hung analyzer) only holds up its own worker
 */
class TaskQueue {
  std::queue<DetectTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(DetectTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(DetectTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe aggregator for per-file results.
 */
class ResultCollector {
  std::vector<FileResult> results;
  std::mutex mutex;

public:
  void add(FileResult result);

  /**
   * @brief Extract all collected results.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<FileResult> extract();
};

} // namespace scene_cut

#endif // SCENE_CUT_TASK_QUEUE_HPP
