/**
 * @file main.cpp
 * @brief Entry point for the scene_cut command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - detect: scene list of one video as JSON on stdout
 *
 *          - detect on a directory: parallel detection with BatchProcessor
 *
 *          - extract: frame-accurate extraction of a computed range
 *
 *          - probe: stream metadata as JSON on stdout
 *
 * @note Logs go to stderr; stdout carries only the JSON result.
 *       Set PARALLEL_STREAMS environment variable to control parallelism.
 */

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "scene_cut/batch_processor.hpp"
#include "scene_cut/config.hpp"
#include "scene_cut/errors.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/pipeline.hpp"
#include "scene_cut/serialization.hpp"
#include "scene_cut/video_probe.hpp"

using namespace scene_cut;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERIC = 1;
constexpr int EXIT_VALIDATION = 2;
constexpr int EXIT_EXTRACTION = 3;

void print_usage() {
  LOG_WARN("Usage:");
  LOG_WARN("  scene_cut detect <video> [--threshold N] [--min-scene-length S] "
           "[--fps F]");
  LOG_WARN("  scene_cut detect <dir> <out_dir> [--threshold N] "
           "[--min-scene-length S] [--fps F]");
  LOG_WARN("  scene_cut extract <video> <output> --start F --end F "
           "[--offset N] [--frames N] [--fps F]");
  LOG_WARN("  scene_cut probe <video>");
}

/// Positional arguments and --name value pairs, in order of appearance
struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
};

bool parse_args(int argc, char *argv[], Args &args) {
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        LOG_ERROR("Missing value for {}", arg);
        return false;
      }
      args.options[arg.substr(2)] = argv[++i];
    } else {
      args.positional.push_back(arg);
    }
  }
  return true;
}

std::optional<double> option_double(const Args &args, const std::string &name) {
  auto it = args.options.find(name);
  if (it == args.options.end())
    return std::nullopt;
  size_t pos = 0;
  double value = std::stod(it->second, &pos);
  if (pos != it->second.size())
    throw std::invalid_argument(it->second);
  return value;
}

std::optional<int64_t> option_int(const Args &args, const std::string &name) {
  auto it = args.options.find(name);
  if (it == args.options.end())
    return std::nullopt;
  size_t pos = 0;
  long long value = std::stoll(it->second, &pos);
  if (pos != it->second.size())
    throw std::invalid_argument(it->second);
  if (value > MAX_FRAME_VALUE || value < -MAX_FRAME_VALUE)
    throw std::out_of_range(fmt::format("--{} {}", name, it->second));
  return static_cast<int64_t>(value);
}

DetectionOptions detection_options(const Args &args) {
  DetectionOptions options;
  options.threshold = option_double(args, "threshold");
  options.min_scene_length = option_double(args, "min-scene-length");
  options.fps = option_double(args, "fps");
  return options;
}

// **---- COMMANDS ----**

int run_detect(const Args &args, const DetectorConfig &config) {
  namespace fs = std::filesystem;

  if (args.positional.empty()) {
    print_usage();
    return EXIT_FAILURE_GENERIC;
  }

  DetectionOptions options = detection_options(args);
  const std::string &input_arg = args.positional[0];

  if (fs::is_directory(input_arg)) {
    // **---- BATCH MODE - Parallel detection ----**

    if (args.positional.size() < 2) {
      print_usage();
      return EXIT_FAILURE_GENERIC;
    }
    const std::string &output_arg = args.positional[1];
    if (!fs::exists(output_arg)) {
      fs::create_directories(output_arg);
    }

    LOG_INFO("Scene Cut - Batch Mode");
    LOG_INFO("Input directory: {}", input_arg);
    LOG_INFO("Output directory: {}", output_arg);

    std::vector<std::string> files = collect_video_files(input_arg);
    if (files.empty()) {
      LOG_WARN("No video files found in directory");
      return EXIT_OK;
    }

    LOG_INFO("Found {} video files", files.size());

    BatchProcessor processor(config, Config::parallel_streams());
    return processor.process(files, output_arg, options);
  }

  // **---- SINGLE FILE MODE ----**

  LOG_INFO("Scene Cut - Single File Mode");
  LOG_INFO("Input: {}", input_arg);

  ScenePipeline pipeline(input_arg, config);
  DetectionReport report = pipeline.detect(options);
  std::cout << nlohmann::json(report).dump(2) << std::endl;
  return EXIT_OK;
}

int run_extract(const Args &args, const DetectorConfig &config) {
  std::optional<int64_t> start = option_int(args, "start");
  std::optional<int64_t> end = option_int(args, "end");
  if (args.positional.size() < 2 || !start || !end) {
    print_usage();
    return EXIT_FAILURE_GENERIC;
  }

  ExtractionRequest request;
  request.scene.start_frame = *start;
  request.scene.end_frame = *end;
  request.offset_frames = option_int(args, "offset").value_or(0);
  std::optional<int64_t> frames = option_int(args, "frames");
  if (frames && *frames > 0)
    request.extract_frame_count = frames;
  request.fps = option_double(args, "fps");

  ScenePipeline pipeline(args.positional[0], config);
  ExtractionPlan plan = pipeline.extract(request, args.positional[1]);

  nlohmann::json out = plan;
  out["output"] = args.positional[1];
  std::cout << out.dump(2) << std::endl;
  return EXIT_OK;
}

int run_probe(const Args &args) {
  if (args.positional.empty()) {
    print_usage();
    return EXIT_FAILURE_GENERIC;
  }
  VideoInfo info = probe_video(args.positional[0]);
  std::cout << nlohmann::json(info).dump(2) << std::endl;
  return EXIT_OK;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc < 3) {
    print_usage();
    return EXIT_FAILURE_GENERIC;
  }

  std::string command = argv[1];
  Args args;
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return EXIT_FAILURE_GENERIC;
  }

  DetectorConfig config = DetectorConfig::from_env();
  int status = EXIT_FAILURE_GENERIC;

  try {
    if (command == "detect") {
      status = run_detect(args, config);
    } else if (command == "extract") {
      status = run_extract(args, config);
    } else if (command == "probe") {
      status = run_probe(args);
    } else {
      LOG_ERROR("Unknown command: {}", command);
      print_usage();
      return EXIT_FAILURE_GENERIC;
    }
  } catch (const ValidationError &e) {
    for (const auto &error : e.errors()) {
      LOG_ERROR("{}", error);
    }
    return EXIT_VALIDATION;
  } catch (const ExtractionError &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_EXTRACTION;
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_FAILURE_GENERIC;
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid numeric argument: {}", e.what());
    print_usage();
    return EXIT_FAILURE_GENERIC;
  } catch (const std::out_of_range &e) {
    LOG_ERROR("Numeric argument out of range: {}", e.what());
    return EXIT_FAILURE_GENERIC;
  } catch (const std::filesystem::filesystem_error &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_FAILURE_GENERIC;
  }

  TimingCollector::print_summary();
  return status;
}
