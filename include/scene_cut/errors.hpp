/**
 * @file errors.hpp
 * @brief Exception taxonomy surfaced to callers
 *
 * @details - ProbeError: source unreadable or not a video
 *
 *          - DetectionError: both detectors failed
 *
 *          - ValidationError: computed range breaks an invariant
 *
 *          - ExtractionError: the external codec process failed
 *
 * @note Primary detector failures never appear here; they are reported as a
 *       PrimaryStatus and absorbed by the fallback path.
 */

#ifndef SCENE_CUT_ERRORS_HPP
#define SCENE_CUT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace scene_cut {

/// Common base so callers can catch every scene_cut failure in one place
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

class ProbeError : public Error {
public:
  explicit ProbeError(const std::string &what)
      : Error("Failed to probe video: " + what) {}
};

class DetectionError : public Error {
public:
  explicit DetectionError(const std::string &what)
      : Error("Scene detection failed: " + what) {}
};

/**
 * @class ValidationError
 * @brief Carries the complete list of violated range rules.
 */
class ValidationError : public Error {
public:
  explicit ValidationError(std::vector<std::string> errors);

  const std::vector<std::string> &errors() const { return errors_; }

private:
  std::vector<std::string> errors_;
};

class ExtractionError : public Error {
public:
  ExtractionError(const std::string &what, int status)
      : Error("Extraction failed: " + what), status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

} // namespace scene_cut

#endif // SCENE_CUT_ERRORS_HPP
