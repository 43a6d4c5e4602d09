#include <gtest/gtest.h>

#include <vector>

#include "scene_cut/errors.hpp"
#include "scene_cut/fallback_detector.hpp"

namespace scene_cut {

class FallbackDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    params_.threshold = 0.2;
    params_.min_scene_frames = 30;
    params_.fps = 30.0;
    params_.total_frames = 300;
    params_.duration = 10.0;
  }

  /// Quiet signal for frames 2..total with spikes at the given frames
  ContentSignal signal_with_spikes(const std::vector<int64_t> &spikes,
                                   double spike_score = 0.9) const {
    std::vector<SignalSample> samples;
    for (int64_t f = 2; f <= params_.total_frames; ++f) {
      double score = 0.01;
      for (int64_t s : spikes) {
        if (s == f)
          score = spike_score;
      }
      samples.push_back({f, score});
    }
    return ContentSignal::from_samples(std::move(samples));
  }

  static void expect_gapless(const std::vector<Scene> &scenes, int64_t total) {
    ASSERT_FALSE(scenes.empty());
    EXPECT_EQ(scenes.front().start_frame, 1);
    EXPECT_EQ(scenes.back().end_frame, total);
    for (size_t i = 0; i < scenes.size(); ++i) {
      EXPECT_EQ(scenes[i].scene_number, static_cast<int>(i + 1));
      EXPECT_LE(scenes[i].start_frame, scenes[i].end_frame);
      if (i > 0) {
        EXPECT_EQ(scenes[i].start_frame, scenes[i - 1].end_frame + 1);
      }
    }
  }

  FallbackParams params_;
};

TEST_F(FallbackDetectorTest, CutsAtSpikes) {
  auto scenes = detect_fallback_scenes(signal_with_spikes({100, 200}), params_);
  ASSERT_EQ(scenes.size(), 3u);
  EXPECT_EQ(scenes[0].end_frame, 100);
  EXPECT_EQ(scenes[1].start_frame, 101);
  EXPECT_EQ(scenes[1].end_frame, 200);
  EXPECT_EQ(scenes[2].start_frame, 201);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, SceneTimesFollowFrames) {
  auto scenes = detect_fallback_scenes(signal_with_spikes({150}), params_);
  ASSERT_EQ(scenes.size(), 2u);
  EXPECT_DOUBLE_EQ(scenes[0].start_time, 0.0);
  EXPECT_DOUBLE_EQ(scenes[0].end_time, 5.0);
  EXPECT_DOUBLE_EQ(scenes[1].start_time, 5.0);
  EXPECT_DOUBLE_EQ(scenes[1].end_time, 10.0);
  EXPECT_DOUBLE_EQ(scenes[1].duration, 5.0);
}

TEST_F(FallbackDetectorTest, NoCutsGivesSingleScene) {
  auto scenes = detect_fallback_scenes(signal_with_spikes({}), params_);
  ASSERT_EQ(scenes.size(), 1u);
  expect_gapless(scenes, 300);
  EXPECT_DOUBLE_EQ(scenes[0].end_time, 10.0);
}

TEST_F(FallbackDetectorTest, EmptySignalGivesSingleScene) {
  auto scenes =
      detect_fallback_scenes(ContentSignal::from_samples({}), params_);
  ASSERT_EQ(scenes.size(), 1u);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, SpikeTooCloseToPreviousCutIgnored) {
  auto scenes = detect_fallback_scenes(signal_with_spikes({10, 100, 110}),
                                       params_);
  ASSERT_EQ(scenes.size(), 2u);
  EXPECT_EQ(scenes[0].end_frame, 100);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, ScoreEqualToThresholdDoesNotCut) {
  auto scenes =
      detect_fallback_scenes(signal_with_spikes({150}, 0.2), params_);
  EXPECT_EQ(scenes.size(), 1u);
}

TEST_F(FallbackDetectorTest, ShortTailMergedIntoLastScene) {
  auto scenes =
      detect_fallback_scenes(signal_with_spikes({100, 200, 290}), params_);
  ASSERT_EQ(scenes.size(), 3u);
  EXPECT_EQ(scenes[2].start_frame, 201);
  EXPECT_EQ(scenes[2].end_frame, 300);
  EXPECT_DOUBLE_EQ(scenes[2].end_time, 10.0);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, TailOfHalfMinimumIsKept) {
  /// Cut at 284 leaves 300 - 285 = 15 = 30 / 2
  auto scenes =
      detect_fallback_scenes(signal_with_spikes({100, 284}), params_);
  ASSERT_EQ(scenes.size(), 3u);
  EXPECT_EQ(scenes[1].end_frame, 284);
  EXPECT_EQ(scenes[2].start_frame, 285);
  EXPECT_EQ(scenes[2].end_frame, 300);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, TailBelowHalfMinimumIsMerged) {
  /// Cut at 285 leaves 300 - 286 = 14 < 30 / 2
  auto scenes =
      detect_fallback_scenes(signal_with_spikes({100, 285}), params_);
  ASSERT_EQ(scenes.size(), 2u);
  EXPECT_EQ(scenes[1].start_frame, 101);
  EXPECT_EQ(scenes[1].end_frame, 300);
  EXPECT_DOUBLE_EQ(scenes[1].end_time, 10.0);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, CutOnLastFrameIgnored) {
  auto scenes = detect_fallback_scenes(signal_with_spikes({300}), params_);
  ASSERT_EQ(scenes.size(), 1u);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, SamplesPastEndIgnored) {
  auto scenes = detect_fallback_scenes(
      ContentSignal::from_samples({{150, 0.9}, {450, 0.9}}), params_);
  ASSERT_EQ(scenes.size(), 2u);
  expect_gapless(scenes, 300);
}

TEST_F(FallbackDetectorTest, RejectsEmptySource) {
  params_.total_frames = 0;
  EXPECT_THROW(detect_fallback_scenes(ContentSignal::from_samples({}), params_),
               DetectionError);
}

TEST_F(FallbackDetectorTest, RejectsInvalidFrameRate) {
  params_.fps = 0.0;
  EXPECT_THROW(detect_fallback_scenes(ContentSignal::from_samples({}), params_),
               DetectionError);
}

} // namespace scene_cut
