/**
 * @file system.cpp
 * @brief CPU budget detection implementation
 */

#include "scene_cut/system.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "scene_cut/logging.hpp"

namespace scene_cut {

namespace {

/// First line of a pseudo-file; empty if missing
std::string read_first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

int ceil_div(long quota, long period) {
  return static_cast<int>((quota + period - 1) / period);
}

int cgroup_v2_limit() {
  return parse_cpu_max(read_first_line("/sys/fs/cgroup/cpu.max"));
}

int cgroup_v1_limit() {
  std::string quota = read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  std::string period = read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (quota.empty() || period.empty())
    return -1;
  return parse_cpu_max(quota + " " + period);
}

int cpuset_limit() {
  for (const char *path : {"/sys/fs/cgroup/cpuset.cpus.effective",
                           "/sys/fs/cgroup/cpuset/cpuset.cpus"}) {
    auto cpus = parse_cpuset_string(read_first_line(path));
    if (!cpus.empty())
      return static_cast<int>(cpus.size());
  }
  return -1;
}

} // anonymous namespace

int parse_cpu_max(const std::string &quota_line) {
  std::istringstream in(quota_line);
  std::string quota_str;
  long period = 0;
  if (!(in >> quota_str >> period) || quota_str == "max" || period <= 0)
    return -1;

  try {
    long quota = std::stol(quota_str);
    /// v1 reports an unlimited quota as -1
    return quota > 0 ? ceil_div(quota, period) : -1;
  } catch (const std::logic_error &) {
    return -1;
  }
}

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  std::istringstream in(line);
  std::string item;

  try {
    while (std::getline(in, item, ',')) {
      if (item.empty())
        continue;
      size_t dash = item.find('-');
      int first = std::stoi(item.substr(0, dash));
      int last = dash == std::string::npos ? first
                                           : std::stoi(item.substr(dash + 1));
      for (int cpu = first; cpu <= last; ++cpu)
        cpus.push_back(cpu);
    }
  } catch (const std::logic_error &) {
    /// Malformed cgroup content counts as "no information"
    return {};
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = cgroup_v2_limit();
  if (limit <= 0)
    limit = cgroup_v1_limit();
  if (limit <= 0)
    limit = cpuset_limit();
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());
  if (limit <= 0) {
    LOG_WARN("Could not determine CPU count, assuming 4");
    limit = 4;
  }
  return std::min(limit, MAX_CPU_LIMIT);
}

int calculate_parallel_streams(int requested) {
  int available = detect_cpu_limit();
  if (requested <= 0)
    return available;
  return std::max(1, std::min(requested, available));
}

} // namespace scene_cut
