/**
 * @file content_signal.hpp
 * @brief Lazy per-frame content-difference signal for the fallback detector
 *
 * @details ContentSignal is a finite, single-pass sequence of SignalSample
 *          values. It is move-only and has no rewind: once next() has
 *          returned false it keeps returning false.
 *
 *          open_content_signal() backs the sequence with an FFmpeg decode of
 *          the source. Frames are downscaled to a small luma plane and each
 *          analyzed frame is scored against the previous analyzed frame by
 *          mean absolute difference, normalized to [0, 1].
 */

#ifndef SCENE_CUT_CONTENT_SIGNAL_HPP
#define SCENE_CUT_CONTENT_SIGNAL_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

namespace scene_cut {

/**
 * @class ContentSignal
 * @brief Single-pass sequence of content-difference samples.
 */
class ContentSignal {
public:
  /// Produces the next sample; returns false when the sequence has ended
  using Producer = std::function<bool(SignalSample &)>;

  explicit ContentSignal(Producer producer);

  ContentSignal(ContentSignal &&) = default;
  ContentSignal &operator=(ContentSignal &&) = default;

  /// Disable copy (a copy would allow a second pass over the source)
  ContentSignal(const ContentSignal &) = delete;
  ContentSignal &operator=(const ContentSignal &) = delete;

  /**
   * @brief Pull the next sample.
   * @param sample Output sample
   * @return false once the sequence is exhausted (sticky)
   * @throws DetectionError if the underlying source fails mid-stream
   */
  bool next(SignalSample &sample);

  bool exhausted() const { return exhausted_; }

  /// Number of samples handed out so far
  int64_t consumed() const { return consumed_; }

  /// In-memory signal, used by tools and tests
  static ContentSignal from_samples(std::vector<SignalSample> samples);

private:
  Producer producer_;
  bool exhausted_ = false;
  int64_t consumed_ = 0;
};

/**
 * @brief Open a decode-backed content signal for a video file.
 *
 * @param path Video file path
 * @param frame_step Analyze every Nth decoded frame (values < 1 mean 1)
 * @param analysis_width Width of the downscaled luma plane
 * @return Signal positioned before the first sample
 * @throws DetectionError if the source cannot be opened or decoded
 */
ContentSignal open_content_signal(const std::string &path, int frame_step,
                                  int analysis_width);

} // namespace scene_cut

#endif // SCENE_CUT_CONTENT_SIGNAL_HPP
