/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and result collection implementation
 */

#include "scene_cut/task_queue.hpp"

#include <utility>

namespace scene_cut {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(DetectTask task) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    tasks.push(std::move(task));
  }
  cv.notify_one();
}

bool TaskQueue::pop(DetectTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ResultCollector Implementation -----**

void ResultCollector::add(FileResult result) {
  std::lock_guard<std::mutex> lock(mutex);
  results.push_back(std::move(result));
}

std::vector<FileResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(results);
}

} // namespace scene_cut
