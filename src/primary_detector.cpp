/**
 * @file primary_detector.cpp
 * @brief External scene analyzer invocation and output parsing
 */

#include "scene_cut/primary_detector.hpp"

#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "scene_cut/config.hpp"
#include "scene_cut/logging.hpp"
#include "scene_cut/process_runner.hpp"

namespace scene_cut {

using json = nlohmann::json;

const char *to_string(PrimaryStatus status) {
  switch (status) {
  case PrimaryStatus::Ok:
    return "ok";
  case PrimaryStatus::SpawnFailed:
    return "spawn failed";
  case PrimaryStatus::NonZeroExit:
    return "non-zero exit";
  case PrimaryStatus::TimedOut:
    return "timed out";
  case PrimaryStatus::Unparseable:
    return "unparseable output";
  case PrimaryStatus::ReportedError:
    return "reported error";
  case PrimaryStatus::InvalidOutput:
    return "invalid output";
  }
  return "unknown";
}

std::vector<std::string> build_primary_command(const std::string &command,
                                               const PrimaryRequest &request) {
  std::vector<std::string> argv;
  std::istringstream words(command);
  std::string word;
  while (words >> word)
    argv.push_back(word);
  if (argv.empty())
    return argv;

  argv.push_back(request.path);
  argv.push_back("--threshold");
  argv.push_back(fmt::format("{}", request.threshold));
  argv.push_back("--min-scene-length");
  argv.push_back(fmt::format("{}", request.min_scene_length_sec));
  argv.push_back("--fps");
  argv.push_back(fmt::format("{}", request.fps));
  return argv;
}

namespace {

/// Last non-empty line of a text block
std::string last_line(const std::string &text) {
  size_t end = text.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return {};
  size_t start = text.find_last_of('\n', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return text.substr(start, end - start + 1);
}

Scene scene_from_json(const json &j) {
  Scene s;
  s.start_frame = j.at("start_frame").get<int64_t>();
  s.end_frame = j.at("end_frame").get<int64_t>();
  s.start_time = j.value("start_time", 0.0);
  s.end_time = j.value("end_time", 0.0);
  s.duration = s.end_time - s.start_time;
  return s;
}

} // anonymous namespace

PrimaryResult parse_primary_output(const std::string &output) {
  json doc = json::parse(output, nullptr, false);
  if (doc.is_discarded()) {
    doc = json::parse(last_line(output), nullptr, false);
  }
  if (doc.is_discarded() || !doc.is_object()) {
    return PrimaryResult::failure(PrimaryStatus::Unparseable,
                                  "stdout is not a JSON object");
  }

  if (doc.contains("error") && !doc["error"].is_null()) {
    std::string reason = doc["error"].is_string() ? doc["error"].get<std::string>()
                                                  : doc["error"].dump();
    return PrimaryResult::failure(PrimaryStatus::ReportedError, reason);
  }

  auto it = doc.find("scenes");
  if (it == doc.end() || !it->is_array()) {
    return PrimaryResult::failure(PrimaryStatus::Unparseable,
                                  "missing \"scenes\" array");
  }

  PrimaryResult result;
  try {
    result.scenes.reserve(it->size());
    for (const auto &entry : *it) {
      result.scenes.push_back(scene_from_json(entry));
    }
  } catch (const json::exception &e) {
    return PrimaryResult::failure(PrimaryStatus::Unparseable,
                                  fmt::format("malformed scene: {}", e.what()));
  }

  if (result.scenes.empty()) {
    return PrimaryResult::failure(PrimaryStatus::InvalidOutput,
                                  "analyzer returned no scenes");
  }
  return result;
}

PrimaryResult run_primary_detector(const PrimaryRequest &request,
                                   const std::string &command,
                                   double timeout_sec) {
  auto argv = build_primary_command(command, request);
  if (argv.empty()) {
    return PrimaryResult::failure(PrimaryStatus::SpawnFailed,
                                  "no analyzer command configured");
  }

  LOG_INFO("Primary detector: {} (threshold={}, min_length={:.3f}s, fps={:.3f})",
           argv[0], request.threshold, request.min_scene_length_sec,
           request.fps);

  /// The analyzer always runs under a deadline, even if misconfigured
  timeout_sec = bounded_timeout(timeout_sec);

  TIMER_START(primary_detect);
  ProcessResult proc = run_process(argv, timeout_sec);
  TIMER_END(primary_detect);

  if (!proc.spawned)
    return PrimaryResult::failure(PrimaryStatus::SpawnFailed, proc.err);

  if (proc.timed_out) {
    return PrimaryResult::failure(
        PrimaryStatus::TimedOut,
        fmt::format("no result after {:.0f}s", timeout_sec));
  }

  if (!proc.succeeded()) {
    std::string detail = describe(proc);
    std::string diag = last_line(proc.err);
    if (!diag.empty())
      detail += ": " + diag;
    return PrimaryResult::failure(PrimaryStatus::NonZeroExit, detail);
  }

  return parse_primary_output(proc.out);
}

} // namespace scene_cut
