#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>

#include "scene_cut/errors.hpp"
#include "scene_cut/frame_range.hpp"

namespace scene_cut {

namespace {

Scene make_scene(int64_t start, int64_t end) {
  Scene s;
  s.scene_number = 1;
  s.start_frame = start;
  s.end_frame = end;
  return s;
}

bool contains(const std::vector<std::string> &errors, const std::string &msg) {
  return std::find(errors.begin(), errors.end(), msg) != errors.end();
}

} // anonymous namespace

// **---- compute_range ----**

TEST(ComputeRangeTest, NegativeOffsetKeepsLength) {
  FrameRange r = compute_range(make_scene(100, 340), -50, std::nullopt, 1000);
  EXPECT_EQ(r.start_frame, 50);
  EXPECT_EQ(r.end_frame, 290);
  EXPECT_EQ(r.frame_count, 241);
}

TEST(ComputeRangeTest, FixedFrameCount) {
  FrameRange r = compute_range(make_scene(100, 340), 0, 50, 1000);
  EXPECT_EQ(r.start_frame, 100);
  EXPECT_EQ(r.end_frame, 149);
  EXPECT_EQ(r.frame_count, 50);
}

TEST(ComputeRangeTest, NonPositiveCountUsesSceneLength) {
  FrameRange r = compute_range(make_scene(100, 340), 0, 0, 1000);
  EXPECT_EQ(r.end_frame, 340);
  r = compute_range(make_scene(100, 340), 0, -5, 1000);
  EXPECT_EQ(r.end_frame, 340);
}

TEST(ComputeRangeTest, OffsetBeforeStartCollapsesToFirstFrame) {
  FrameRange r = compute_range(make_scene(1, 10), -100, std::nullopt, 500);
  EXPECT_EQ(r.start_frame, 1);
  EXPECT_GE(r.end_frame, r.start_frame);
  EXPECT_EQ(r.frame_count, 1);
}

TEST(ComputeRangeTest, OffsetPastEndCollapsesToLastFrame) {
  FrameRange r = compute_range(make_scene(490, 495), 20, std::nullopt, 500);
  EXPECT_EQ(r.start_frame, 500);
  EXPECT_EQ(r.end_frame, 500);
  EXPECT_EQ(r.frame_count, 1);
}

TEST(ComputeRangeTest, EndClampedToTotal) {
  FrameRange r = compute_range(make_scene(400, 450), 0, 200, 500);
  EXPECT_EQ(r.start_frame, 400);
  EXPECT_EQ(r.end_frame, 500);
  EXPECT_EQ(r.frame_count, 101);
}

// **---- validate_range ----**

TEST(ValidateRangeTest, ValidRange) {
  RangeValidation v = validate_range(1, 1000, 1000);
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.errors.empty());
  EXPECT_EQ(v.frame_count, 1000);
}

TEST(ValidateRangeTest, ReversedRange) {
  RangeValidation v = validate_range(500, 100, 1000);
  EXPECT_FALSE(v.valid);
  EXPECT_TRUE(contains(v.errors,
                       "Start frame must be less than or equal to end frame"));
}

TEST(ValidateRangeTest, ReportsEveryViolation) {
  RangeValidation v = validate_range(0, 0, 10);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.errors.size(), 2u);
  EXPECT_TRUE(contains(v.errors, "Start frame must be a positive integer"));
  EXPECT_TRUE(contains(v.errors, "End frame must be a positive integer"));
}

TEST(ValidateRangeTest, EndPastTotal) {
  RangeValidation v = validate_range(1, 600, 500);
  EXPECT_FALSE(v.valid);
  EXPECT_TRUE(contains(v.errors, "End frame cannot exceed total frames (500)"));
}

TEST(ValidateRangeTest, TooManyFrames) {
  RangeValidation v = validate_range(1, 1001, 2000);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.frame_count, 1001);
  EXPECT_TRUE(
      contains(v.errors, "Cannot extract more than 1000 frames at once"));
}

TEST(ValidateRangeTest, CustomLimit) {
  RangeValidation v = validate_range(1, 11, 100, 10);
  EXPECT_TRUE(contains(v.errors, "Cannot extract more than 10 frames at once"));
}

TEST(ValidateRangeTest, ConfiguredLimitCannotRaiseCap) {
  RangeValidation v = validate_range(1, 3000, 10000, 5000);
  EXPECT_FALSE(v.valid);
  EXPECT_TRUE(
      contains(v.errors, "Cannot extract more than 1000 frames at once"));
}

TEST(EffectiveFrameLimitTest, OnlyTightens) {
  EXPECT_EQ(effective_frame_limit(5000), MAX_EXTRACT_FRAMES);
  EXPECT_EQ(effective_frame_limit(1000), MAX_EXTRACT_FRAMES);
  EXPECT_EQ(effective_frame_limit(10), 10);
  EXPECT_EQ(effective_frame_limit(0), MAX_EXTRACT_FRAMES);
  EXPECT_EQ(effective_frame_limit(-3), MAX_EXTRACT_FRAMES);
}

// **---- compute_and_validate_range ----**

TEST(ComputeAndValidateTest, RaisedLimitStillRejectsLargeRange) {
  EXPECT_THROW(compute_and_validate_range(make_scene(1, 3000), 0,
                                          std::nullopt, 10000, 5000),
               ValidationError);
}

TEST(ComputeAndValidateTest, ExtremeInputsRejected) {
  const int64_t big = std::numeric_limits<int64_t>::max();
  try {
    compute_and_validate_range(make_scene(big, big), 1, std::nullopt, 500);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_TRUE(contains(e.errors(), "Scene frames are out of range"));
  }

  EXPECT_THROW(compute_and_validate_range(make_scene(1, 10),
                                          std::numeric_limits<int64_t>::min(),
                                          std::nullopt, 500),
               ValidationError);
  EXPECT_THROW(
      compute_and_validate_range(make_scene(1, 10), 0, big, 500),
      ValidationError);
}

TEST(ComputeAndValidateTest, LargestAcceptedValuesCollapse) {
  FrameRange r = compute_and_validate_range(
      make_scene(MAX_FRAME_VALUE, MAX_FRAME_VALUE), MAX_FRAME_VALUE,
      std::nullopt, 500);
  EXPECT_EQ(r.start_frame, 500);
  EXPECT_EQ(r.end_frame, 500);
}

TEST(ComputeAndValidateTest, ThrowsWithFullErrorList) {
  try {
    compute_and_validate_range(make_scene(1, 1500), 0, std::nullopt, 2000);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    ASSERT_EQ(e.errors().size(), 1u);
    EXPECT_EQ(e.errors()[0], "Cannot extract more than 1000 frames at once");
    EXPECT_NE(std::string(e.what()).find("Cannot extract more than"),
              std::string::npos);
  }
}

TEST(ComputeAndValidateTest, ReturnsRange) {
  FrameRange r = compute_and_validate_range(make_scene(100, 340), -50,
                                            std::nullopt, 1000);
  EXPECT_EQ(r.start_frame, 50);
  EXPECT_EQ(r.end_frame, 290);
}

// **---- plan_extraction ----**

TEST(PlanExtractionTest, SeekAndDuration) {
  ExtractionPlan plan = plan_extraction(FrameRange{31, 60, 30}, 30.0);
  EXPECT_DOUBLE_EQ(plan.start_time, 1.0);
  EXPECT_DOUBLE_EQ(plan.duration, 1.0);
  EXPECT_EQ(plan.range.start_frame, 31);
}

} // namespace scene_cut
