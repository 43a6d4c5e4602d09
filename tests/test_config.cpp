#include <gtest/gtest.h>

#include <cstdlib>
#include <limits>

#include "scene_cut/config.hpp"

namespace scene_cut {

TEST(BoundedTimeoutTest, PositiveValueKept) {
  EXPECT_DOUBLE_EQ(bounded_timeout(12.5), 12.5);
}

TEST(BoundedTimeoutTest, NonPositiveOrNonFiniteUsesDefault) {
  EXPECT_DOUBLE_EQ(bounded_timeout(0.0), DEFAULT_PRIMARY_TIMEOUT_SEC);
  EXPECT_DOUBLE_EQ(bounded_timeout(-5.0), DEFAULT_PRIMARY_TIMEOUT_SEC);
  EXPECT_DOUBLE_EQ(bounded_timeout(std::numeric_limits<double>::infinity()),
                   DEFAULT_PRIMARY_TIMEOUT_SEC);
  EXPECT_DOUBLE_EQ(bounded_timeout(std::numeric_limits<double>::quiet_NaN()),
                   DEFAULT_PRIMARY_TIMEOUT_SEC);
}

TEST(DetectorConfigTest, ZeroTimeoutFromEnvironmentStaysBounded) {
  /// Config getters memoize on first use; nothing else in this binary reads
  /// PRIMARY_TIMEOUT_SEC
  ::setenv("PRIMARY_TIMEOUT_SEC", "0", 1);
  DetectorConfig cfg = DetectorConfig::from_env();
  EXPECT_DOUBLE_EQ(cfg.primary_timeout_sec, DEFAULT_PRIMARY_TIMEOUT_SEC);
}

} // namespace scene_cut
