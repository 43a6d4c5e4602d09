/**
 * @file scene_signal_dump.cpp
 * @brief Content Signal Dump Utility
 *
 * @details Standalone utility that prints the frame-difference signal used by
 *          the fallback detector, one `frame score` pair per line, followed
 *          by a short summary on stderr. Useful for picking a threshold.
 *
 * @usage
 *   scene_signal_dump video.mp4 [frame_step] [analysis_width]
 *
 * @note Scores are on the [0, 1] scale; the fallback detector cuts where
 *       score > threshold / 100.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

#include <fmt/core.h>

#include "scene_cut/config.hpp"
#include "scene_cut/content_signal.hpp"
#include "scene_cut/errors.hpp"

using steady_clock = std::chrono::steady_clock;

int main(int argc, char **argv) {
  if (argc < 2) {
    fmt::print(stderr, "Usage: {} video.mp4 [frame_step] [analysis_width]\n",
               argv[0]);
    return 1;
  }

  int step = scene_cut::Config::signal_frame_step();
  int width = scene_cut::Config::signal_analysis_width();
  try {
    if (argc > 2)
      step = std::stoi(argv[2]);
    if (argc > 3)
      width = std::stoi(argv[3]);
  } catch (const std::exception &e) {
    fmt::print(stderr, "Invalid numeric argument: {}\n", e.what());
    return 1;
  }

  // ---- START TIMER ----
  auto wall_start = steady_clock::now();

  // ---- WORK ----
  double max_score = 0.0;
  double sum = 0.0;
  int64_t max_frame = 0;

  try {
    scene_cut::ContentSignal signal =
        scene_cut::open_content_signal(argv[1], step, width);
    scene_cut::SignalSample sample;
    while (signal.next(sample)) {
      fmt::print("{} {:.6f}\n", sample.frame, sample.score);
      sum += sample.score;
      if (sample.score > max_score) {
        max_score = sample.score;
        max_frame = sample.frame;
      }
    }

    // ---- STOP TIMER ----
    double wall_sec =
        std::chrono::duration<double>(steady_clock::now() - wall_start).count();

    int64_t n = signal.consumed();
    fmt::print(stderr, "samples      : {}\n", n);
    fmt::print(stderr, "mean score   : {:.6f}\n", n > 0 ? sum / n : 0.0);
    fmt::print(stderr, "max score    : {:.6f} (frame {})\n", max_score,
               max_frame);
    fmt::print(stderr, "wall time    : {:.3f} s\n", wall_sec);
  } catch (const scene_cut::Error &e) {
    fmt::print(stderr, "{}\n", e.what());
    return 1;
  }

  return 0;
}
