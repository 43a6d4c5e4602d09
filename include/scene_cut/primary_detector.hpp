/**
 * @file primary_detector.hpp
 * @brief External content-based scene analyzer, run as a child process
 *
 * @details The analyzer is invoked as
 *
 *          `<command> <video> --threshold T --min-scene-length S --fps F`
 *
 *          and must print one JSON document on stdout:
 *
 *          - success: `{"scenes": [{"start_frame": 1, "end_frame": 48,
 *            "start_time": 0.0, "end_time": 2.0}, ...]}`
 *
 *          - failure: `{"error": "reason"}`
 *
 *          stderr is kept for diagnostics only. Every failure is reported as
 *          a PrimaryStatus; nothing here throws.
 */

#ifndef SCENE_CUT_PRIMARY_DETECTOR_HPP
#define SCENE_CUT_PRIMARY_DETECTOR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace scene_cut {

enum class PrimaryStatus {
  Ok,
  SpawnFailed,   //< analyzer could not be started
  NonZeroExit,   //< exited with a non-zero code or was killed
  TimedOut,      //< exceeded the bounded wait
  Unparseable,   //< stdout was not the expected JSON document
  ReportedError, //< JSON carried an "error" field
  InvalidOutput  //< parsed, but the scene list cannot be used
};

const char *to_string(PrimaryStatus status);

/**
 * @struct PrimaryRequest
 * @brief Arguments forwarded to the analyzer.
 */
struct PrimaryRequest {
  std::string path;
  double threshold = 0.0;            //< analyzer's native scale
  double min_scene_length_sec = 0.0; //< already normalized
  double fps = 0.0;
};

/**
 * @struct PrimaryResult
 * @brief Scenes on success, otherwise a status and a diagnostic.
 */
struct PrimaryResult {
  PrimaryStatus status = PrimaryStatus::Ok;
  std::vector<Scene> scenes;
  std::string detail;

  bool ok() const { return status == PrimaryStatus::Ok; }

  static PrimaryResult failure(PrimaryStatus status, std::string detail) {
    PrimaryResult r;
    r.status = status;
    r.detail = std::move(detail);
    return r;
  }
};

/**
 * @brief Build the analyzer argv.
 * @param command Analyzer command line; split on whitespace so that
 *        "python3 /opt/detect.py" works. Empty when command has no words
 */
std::vector<std::string> build_primary_command(const std::string &command,
                                               const PrimaryRequest &request);

/**
 * @brief Parse the analyzer's stdout into scenes.
 * @note Falls back to the last non-empty line when the whole output is not a
 *       JSON document (analyzers that print progress before the result).
 */
PrimaryResult parse_primary_output(const std::string &output);

/**
 * @brief Run the analyzer and parse its output.
 * @param request Forwarded arguments
 * @param command Analyzer command line
 * @param timeout_sec Bounded wait; a hang is reported as TimedOut.
 *        Non-positive values use DEFAULT_PRIMARY_TIMEOUT_SEC
 */
PrimaryResult run_primary_detector(const PrimaryRequest &request,
                                   const std::string &command,
                                   double timeout_sec);

} // namespace scene_cut

#endif // SCENE_CUT_PRIMARY_DETECTOR_HPP
