#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "scene_cut/errors.hpp"
#include "scene_cut/scene_detection.hpp"

namespace scene_cut {

namespace {

Scene scene(int64_t start, int64_t end, double start_time, double end_time) {
  Scene s;
  s.start_frame = start;
  s.end_frame = end;
  s.start_time = start_time;
  s.end_time = end_time;
  s.duration = end_time - start_time;
  return s;
}

} // anonymous namespace

/**
 * @brief Orchestrator tests with every collaborator replaced by a stub.
 *
 * The stub source is 10 s at 30 fps (300 frames).
 */
class SceneDetectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    info_.duration = 10.0;
    info_.fps = Rational{30, 1};
    info_.width = 640;
    info_.height = 360;
    info_.total_frames = 300;

    backends_.probe = [this](const std::string &) {
      ++probe_calls_;
      return info_;
    };
    backends_.primary = [this](const PrimaryRequest &req) {
      ++primary_calls_;
      last_request_ = req;
      return primary_result_;
    };
    backends_.fallback_signal = [this](const std::string &) {
      ++fallback_calls_;
      return ContentSignal::from_samples(fallback_samples_);
    };
  }

  SceneDetectionOrchestrator make() const {
    return SceneDetectionOrchestrator(config_, backends_);
  }

  static void expect_gapless(const std::vector<Scene> &scenes, int64_t total) {
    ASSERT_FALSE(scenes.empty());
    EXPECT_EQ(scenes.front().start_frame, 1);
    EXPECT_DOUBLE_EQ(scenes.front().start_time, 0.0);
    EXPECT_EQ(scenes.back().end_frame, total);
    for (size_t i = 0; i < scenes.size(); ++i) {
      EXPECT_EQ(scenes[i].scene_number, static_cast<int>(i + 1));
      if (i > 0) {
        EXPECT_EQ(scenes[i].start_frame, scenes[i - 1].end_frame + 1);
      }
    }
  }

  /// Scene invariant: 0 <= start_time <= end_time <= duration
  static void expect_times_within(const std::vector<Scene> &scenes,
                                  double duration) {
    for (const auto &s : scenes) {
      EXPECT_GE(s.start_time, 0.0) << "scene " << s.scene_number;
      EXPECT_LE(s.start_time, s.end_time) << "scene " << s.scene_number;
      EXPECT_LE(s.end_time, duration) << "scene " << s.scene_number;
      EXPECT_GE(s.duration, 0.0) << "scene " << s.scene_number;
    }
  }

  DetectorConfig config_;
  DetectorBackends backends_;
  VideoInfo info_;
  PrimaryResult primary_result_;
  PrimaryRequest last_request_;
  std::vector<SignalSample> fallback_samples_ = {{150, 0.9}};
  int probe_calls_ = 0;
  int primary_calls_ = 0;
  int fallback_calls_ = 0;
};

TEST_F(SceneDetectionTest, PrimarySuccessPassesThrough) {
  primary_result_.scenes = {scene(1, 120, 0.0, 4.0),
                            scene(121, 300, 4.0, 10.0)};

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Primary);
  EXPECT_EQ(primary_calls_, 1);
  EXPECT_EQ(fallback_calls_, 0);
  ASSERT_EQ(report.scenes.size(), 2u);
  EXPECT_EQ(report.scenes[0].end_frame, 120);
  EXPECT_DOUBLE_EQ(report.scenes[1].duration, 6.0);
  expect_gapless(report.scenes, 300);
}

TEST_F(SceneDetectionTest, PrimaryNonZeroExitRunsFallbackOnce) {
  primary_result_ =
      PrimaryResult::failure(PrimaryStatus::NonZeroExit, "exit code 1");

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(primary_calls_, 1);
  EXPECT_EQ(fallback_calls_, 1);
  EXPECT_EQ(report.source, DetectorKind::Fallback);
  EXPECT_EQ(report.primary_status, PrimaryStatus::NonZeroExit);
  EXPECT_EQ(report.primary_detail, "exit code 1");
  ASSERT_EQ(report.scenes.size(), 2u);
  EXPECT_EQ(report.scenes[0].end_frame, 150);
  EXPECT_DOUBLE_EQ(report.scenes[0].end_time, 5.0);
  EXPECT_DOUBLE_EQ(report.scenes.back().end_time, 10.0);
  expect_gapless(report.scenes, 300);
}

TEST_F(SceneDetectionTest, BothDetectorsShareNormalization) {
  /// Same boundaries from either detector give identical output
  primary_result_.scenes = {scene(1, 150, 0.0, 5.0),
                            scene(151, 300, 5.0, 10.0)};
  std::vector<Scene> from_primary = make().detect_scenes("in.mp4");

  primary_result_ =
      PrimaryResult::failure(PrimaryStatus::TimedOut, "no result after 300s");
  std::vector<Scene> from_fallback = make().detect_scenes("in.mp4");

  ASSERT_EQ(from_primary.size(), from_fallback.size());
  for (size_t i = 0; i < from_primary.size(); ++i) {
    EXPECT_EQ(from_primary[i].scene_number, from_fallback[i].scene_number);
    EXPECT_EQ(from_primary[i].start_frame, from_fallback[i].start_frame);
    EXPECT_EQ(from_primary[i].end_frame, from_fallback[i].end_frame);
    EXPECT_DOUBLE_EQ(from_primary[i].start_time, from_fallback[i].start_time);
    EXPECT_DOUBLE_EQ(from_primary[i].end_time, from_fallback[i].end_time);
    EXPECT_DOUBLE_EQ(from_primary[i].duration, from_fallback[i].duration);
  }
}

TEST_F(SceneDetectionTest, GappyPrimaryOutputFallsBack) {
  primary_result_.scenes = {scene(1, 100, 0.0, 3.333),
                            scene(120, 300, 3.967, 10.0)};

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Fallback);
  EXPECT_EQ(report.primary_status, PrimaryStatus::InvalidOutput);
  EXPECT_EQ(fallback_calls_, 1);
  expect_gapless(report.scenes, 300);
}

TEST_F(SceneDetectionTest, PrimaryOutputClampedToStream) {
  /// Analyzer overshoots by a frame and misses the first frame
  primary_result_.scenes = {scene(2, 150, 0.033, 5.0),
                            scene(151, 301, 5.0, 10.04)};

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Primary);
  expect_gapless(report.scenes, 300);
  EXPECT_DOUBLE_EQ(report.scenes.back().end_time, 10.0);
}

TEST_F(SceneDetectionTest, UnsortedPrimaryScenesAreOrdered) {
  primary_result_.scenes = {scene(151, 300, 5.0, 10.0),
                            scene(1, 150, 0.0, 5.0)};

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Primary);
  expect_gapless(report.scenes, 300);
}

TEST_F(SceneDetectionTest, FallbackFailureIsDetectionError) {
  primary_result_ =
      PrimaryResult::failure(PrimaryStatus::SpawnFailed, "not installed");
  backends_.fallback_signal = [](const std::string &) -> ContentSignal {
    throw std::runtime_error("decoder exploded");
  };

  EXPECT_THROW(make().run("in.mp4"), DetectionError);
}

TEST_F(SceneDetectionTest, MissingPrimaryBackendFallsBack) {
  backends_.primary = nullptr;

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Fallback);
  EXPECT_EQ(report.primary_status, PrimaryStatus::SpawnFailed);
}

TEST_F(SceneDetectionTest, ProbeErrorPropagates) {
  backends_.probe = [](const std::string &) -> VideoInfo {
    throw ProbeError("no such file");
  };

  EXPECT_THROW(make().run("missing.mp4"), ProbeError);
  EXPECT_EQ(primary_calls_, 0);
  EXPECT_EQ(fallback_calls_, 0);
}

TEST_F(SceneDetectionTest, ParametersNormalizedBeforePrimary) {
  primary_result_.scenes = {scene(1, 300, 0.0, 10.0)};

  DetectionOptions options;
  options.min_scene_length = 450.0; //< frames
  options.threshold = 500.0;
  make().run("in.mp4", options);

  EXPECT_DOUBLE_EQ(last_request_.min_scene_length_sec, 15.0);
  EXPECT_DOUBLE_EQ(last_request_.threshold, 100.0);
  EXPECT_DOUBLE_EQ(last_request_.fps, 30.0);
}

TEST_F(SceneDetectionTest, DefaultsFromConfig) {
  primary_result_.scenes = {scene(1, 300, 0.0, 10.0)};
  config_.default_threshold = 35.0;
  config_.default_min_scene_length = 2.0;

  DetectionReport report = make().run("in.mp4");

  EXPECT_DOUBLE_EQ(report.threshold, 35.0);
  EXPECT_DOUBLE_EQ(report.min_scene_length_sec, 2.0);
  EXPECT_DOUBLE_EQ(last_request_.threshold, 35.0);
}

TEST_F(SceneDetectionTest, FpsOverride) {
  primary_result_.scenes = {scene(1, 300, 0.0, 10.0)};

  DetectionOptions options;
  options.fps = 25.0;
  DetectionReport report = make().run("in.mp4", options);

  EXPECT_DOUBLE_EQ(report.fps, 25.0);
  EXPECT_DOUBLE_EQ(last_request_.fps, 25.0);
}

TEST_F(SceneDetectionTest, FallbackTimesUseProbedRateUnderFpsOverride) {
  primary_result_ =
      PrimaryResult::failure(PrimaryStatus::NonZeroExit, "exit code 1");

  DetectionOptions options;
  options.fps = 10.0; //< lower than the probed 30 fps
  DetectionReport report = make().run("in.mp4", options);

  EXPECT_EQ(report.source, DetectorKind::Fallback);
  ASSERT_EQ(report.scenes.size(), 2u);
  EXPECT_EQ(report.scenes[0].end_frame, 150);
  EXPECT_DOUBLE_EQ(report.scenes[0].end_time, 5.0);
  EXPECT_DOUBLE_EQ(report.scenes[1].start_time, 5.0);
  EXPECT_DOUBLE_EQ(report.scenes[1].end_time, 10.0);
  EXPECT_DOUBLE_EQ(report.scenes[1].duration, 5.0);
  expect_gapless(report.scenes, 300);
  expect_times_within(report.scenes, info_.duration);
}

TEST_F(SceneDetectionTest, FallbackTimesUseProbedRateUnderHigherFps) {
  primary_result_ =
      PrimaryResult::failure(PrimaryStatus::TimedOut, "no result after 300s");

  DetectionOptions options;
  options.fps = 60.0;
  DetectionReport report = make().run("in.mp4", options);

  ASSERT_EQ(report.scenes.size(), 2u);
  EXPECT_DOUBLE_EQ(report.scenes[0].end_time, 5.0);
  expect_times_within(report.scenes, info_.duration);
}

TEST_F(SceneDetectionTest, PrimaryTimesPastDurationClamped) {
  /// Analyzer reports times on a different clock than the probe
  primary_result_.scenes = {scene(1, 150, 0.0, 15.0),
                            scene(151, 300, 15.0, 30.0)};

  DetectionReport report = make().run("in.mp4");

  EXPECT_EQ(report.source, DetectorKind::Primary);
  expect_gapless(report.scenes, 300);
  expect_times_within(report.scenes, info_.duration);
}

// **---- Helpers ----**

TEST(NormalizeScenesTest, DropsScenesOutsideStream) {
  VideoInfo info;
  info.duration = 10.0;
  info.fps = Rational{30, 1};
  info.total_frames = 300;

  auto out = normalize_scenes(
      {scene(1, 300, 0.0, 10.0), scene(400, 450, 13.3, 15.0)}, info);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].end_frame, 300);
}

TEST(NormalizeScenesTest, RoundingStaysWithinDuration) {
  VideoInfo info;
  info.duration = 10.0006;
  info.fps = Rational{30, 1};
  info.total_frames = 300;

  auto out = normalize_scenes(
      {scene(1, 150, 0.0, 5.0), scene(151, 300, 5.0, 10.0006)}, info);
  ASSERT_EQ(out.size(), 2u);
  for (const auto &s : out) {
    EXPECT_LE(s.start_time, s.end_time);
    EXPECT_LE(s.end_time, info.duration);
  }
}

TEST(NormalizeScenesTest, StartTimeBeyondDurationClamped) {
  VideoInfo info;
  info.duration = 10.0;
  info.fps = Rational{30, 1};
  info.total_frames = 300;

  auto out = normalize_scenes(
      {scene(1, 100, 0.0, 12.0), scene(101, 200, 12.0, 14.0),
       scene(201, 300, 14.0, 20.0)},
      info);
  ASSERT_EQ(out.size(), 3u);
  for (const auto &s : out) {
    EXPECT_LE(s.start_time, s.end_time);
    EXPECT_LE(s.end_time, 10.0);
    EXPECT_GE(s.duration, 0.0);
  }
}

TEST(IsGaplessTest, DetectsOverlapAndGap) {
  EXPECT_TRUE(is_gapless({scene(1, 10, 0, 1), scene(11, 20, 1, 2)}, 20));
  EXPECT_FALSE(is_gapless({scene(1, 10, 0, 1), scene(10, 20, 1, 2)}, 20));
  EXPECT_FALSE(is_gapless({scene(1, 10, 0, 1), scene(12, 20, 1, 2)}, 20));
  EXPECT_FALSE(is_gapless({scene(1, 10, 0, 1)}, 20));
  EXPECT_FALSE(is_gapless({}, 20));
}

} // namespace scene_cut
