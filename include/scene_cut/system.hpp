/**
 * @file system.hpp
 * @brief Sizing the batch worker pool from the container's CPU budget
 *
 * @details Each batch worker runs one detection at a time: a child analyzer
 *          process, or the in-process decoder when the analyzer fails. The
 *          pool is therefore sized by the number of CPUs this process may
 *          actually use, which inside a container is the cgroup quota rather
 *          than the host core count.
 */

#ifndef SCENE_CUT_SYSTEM_HPP
#define SCENE_CUT_SYSTEM_HPP

#include <string>
#include <vector>

namespace scene_cut {

/// Upper bound on the detected CPU budget
constexpr int MAX_CPU_LIMIT = 64;

/**
 * @brief CPUs granted by a cgroup quota/period pair, rounded up.
 * @param quota_line Content of `cpu.max` ("<quota> <period>" or "max ...")
 * @return CPU count, or -1 if unlimited or unreadable
 */
int parse_cpu_max(const std::string &quota_line);

/**
 * @brief Parse a cpuset list such as "0-3,6,8-9".
 * @return CPU ids in listed order; empty on malformed input
 */
std::vector<int> parse_cpuset_string(const std::string &line);

/**
 * @brief Number of CPUs this process may use.
 *
 * @note Sources, first match wins:
 *
 *        - cgroup v2 `cpu.max`
 *
 *        - cgroup v1 `cpu.cfs_quota_us` / `cpu.cfs_period_us`
 *
 *        - cpuset `cpuset.cpus.effective` or `cpuset.cpus`
 *
 *        - std::thread::hardware_concurrency()
 *
 * @return Value in [1, MAX_CPU_LIMIT]
 */
int detect_cpu_limit();

/**
 * @brief Number of concurrent detections for batch mode.
 * @param requested Worker count asked for (<= 0 = one per available CPU)
 */
int calculate_parallel_streams(int requested);

} // namespace scene_cut

#endif // SCENE_CUT_SYSTEM_HPP
