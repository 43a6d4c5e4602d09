#include <gtest/gtest.h>

#include <vector>

#include "scene_cut/system.hpp"

namespace scene_cut {

TEST(CpusetParseTest, RangesAndSingles) {
  EXPECT_EQ(parse_cpuset_string("0-3,8"), (std::vector<int>{0, 1, 2, 3, 8}));
  EXPECT_EQ(parse_cpuset_string("5"), (std::vector<int>{5}));
  EXPECT_EQ(parse_cpuset_string("0-1,4-5\n"), (std::vector<int>{0, 1, 4, 5}));
}

TEST(CpusetParseTest, EmptyAndMalformed) {
  EXPECT_TRUE(parse_cpuset_string("").empty());
  EXPECT_TRUE(parse_cpuset_string("x-y").empty());
}

TEST(CpuMaxParseTest, QuotaRoundsUp) {
  EXPECT_EQ(parse_cpu_max("200000 100000"), 2);
  EXPECT_EQ(parse_cpu_max("150000 100000"), 2);
  EXPECT_EQ(parse_cpu_max("50000 100000"), 1);
}

TEST(CpuMaxParseTest, UnlimitedOrMalformed) {
  EXPECT_EQ(parse_cpu_max("max 100000"), -1);
  EXPECT_EQ(parse_cpu_max("-1 100000"), -1);
  EXPECT_EQ(parse_cpu_max(""), -1);
  EXPECT_EQ(parse_cpu_max("abc 100000"), -1);
}

TEST(CpuLimitTest, WithinBounds) {
  int limit = detect_cpu_limit();
  EXPECT_GE(limit, 1);
  EXPECT_LE(limit, MAX_CPU_LIMIT);
}

TEST(CpuLimitTest, RequestedStreamsCapped) {
  int limit = detect_cpu_limit();
  EXPECT_EQ(calculate_parallel_streams(0), limit);
  EXPECT_EQ(calculate_parallel_streams(1), 1);
  EXPECT_EQ(calculate_parallel_streams(limit + 10), limit);
}

} // namespace scene_cut
