/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          DetectorConfig, the explicit value handed to the detection
 *          orchestrator so it never reads globals itself.
 *
 */

#ifndef SCENE_CUT_CONFIG_HPP
#define SCENE_CUT_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace scene_cut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/// Default detection sensitivity (1-100, higher = fewer cuts)
inline double scene_threshold() {
  static double val = get_env_double("SCENE_THRESHOLD", 20.0);
  return val;
}

/// Default minimum scene length in seconds
inline double min_scene_length_sec() {
  static double val = get_env_double("MIN_SCENE_LENGTH_SEC", 1.0);
  return val;
}

/**
 * @brief External content-based analyzer invoked as the primary detector
 * @note Resolved through PATH. Called as
 *       `<cmd> <video> --threshold T --min-scene-length S --fps F` and
 *       expected to print one JSON document on stdout.
 */
inline std::string primary_detector_cmd() {
  static std::string val =
      get_env_string("PRIMARY_DETECTOR_CMD", "scene_detector");
  return val;
}

/// Hard wait limit for the primary detector process
inline double primary_timeout_sec() {
  static double val = get_env_double("PRIMARY_TIMEOUT_SEC", 300.0);
  return val;
}

/**
 * @brief Analyze every Nth decoded frame for the fallback content signal
 * @note 1 = every frame. Larger values trade boundary precision for speed.
 */
inline int signal_frame_step() {
  static int val = get_env_int("SIGNAL_FRAME_STEP", 1);
  return val;
}

/// Width of the downscaled luma plane used for frame differencing
inline int signal_analysis_width() {
  static int val = get_env_int("SIGNAL_ANALYSIS_WIDTH", 160);
  return val;
}

/// Cap on frames in one extraction; can only lower the built-in 1000
inline int max_extract_frames() {
  static int val = get_env_int("MAX_EXTRACT_FRAMES", 1000);
  return val;
}

/// FFmpeg binary used for extraction
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of concurrent detections in batch mode
 * @note 0 = auto-detect from the cgroup-aware CPU limit
 */
inline int parallel_streams() {
  static int val = get_env_int("PARALLEL_STREAMS", 0);
  return val;
}

} // namespace Config

/// Analyzer wait used when no valid timeout is configured
constexpr double DEFAULT_PRIMARY_TIMEOUT_SEC = 300.0;

/**
 * @brief Analyzer timeout that is always a finite, positive bound.
 * @return requested when it is > 0 and finite, else the default
 */
inline double bounded_timeout(double requested) {
  return (std::isfinite(requested) && requested > 0)
             ? requested
             : DEFAULT_PRIMARY_TIMEOUT_SEC;
}

/**
 * @struct DetectorConfig
 * @brief Detection defaults and bounds, fixed at orchestrator construction.
 */
struct DetectorConfig {
  double default_threshold = 20.0;
  double default_min_scene_length = 1.0; //< seconds
  double min_scene_length_floor = 0.5;   //< seconds
  double min_scene_length_ceiling = 60.0;
  /// min_scene_length values above this are read as a frame count
  double frame_count_cutoff = 300.0;
  double threshold_min = 1.0;
  double threshold_max = 100.0;
  double primary_timeout_sec = DEFAULT_PRIMARY_TIMEOUT_SEC;
  std::string primary_command = "scene_detector";
  int signal_frame_step = 1;
  int signal_analysis_width = 160;

  /// Snapshot of the Config:: environment values
  static DetectorConfig from_env() {
    DetectorConfig cfg;
    cfg.default_threshold = Config::scene_threshold();
    cfg.default_min_scene_length = Config::min_scene_length_sec();
    cfg.primary_timeout_sec = bounded_timeout(Config::primary_timeout_sec());
    cfg.primary_command = Config::primary_detector_cmd();
    cfg.signal_frame_step = Config::signal_frame_step();
    cfg.signal_analysis_width = Config::signal_analysis_width();
    return cfg;
  }
};

} // namespace scene_cut

#endif // SCENE_CUT_CONFIG_HPP
