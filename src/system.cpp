/**
 * @file system.cpp
 * @brief CPU budget detection and pool sizing
 *
 * @details The CPU budget is the larger of the cgroup CPU quota and the
 *          cpuset size, so a container limited by either reports the cores
 *          it can actually use.
 */

#include "keycrop/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

#include "keycrop/config.hpp"
#include "keycrop/logging.hpp"

namespace keycrop {

namespace {

constexpr int FALLBACK_CPUS = 4;
constexpr int MAX_CPUS = 64;

/// First line of a file, empty when unreadable
std::string first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

/// Parse a whole non-negative integer; -1 on anything else
long parse_count(const std::string &text) {
  if (text.empty())
    return -1;
  char *end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || v < 0)
    return -1;
  return v;
}

/// ceil(quota / period), or -1 when either is missing or unlimited
int quota_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

/// cgroup v2 "cpu.max" holds "<quota|max> <period>"
int cgroup_v2_quota() {
  std::string line = first_line("/sys/fs/cgroup/cpu.max");
  size_t space = line.find(' ');
  if (space == std::string::npos)
    return -1;
  return quota_cpus(parse_count(line.substr(0, space)),
                    parse_count(line.substr(space + 1)));
}

int cgroup_v1_quota() {
  return quota_cpus(
      parse_count(first_line("/sys/fs/cgroup/cpu/cpu.cfs_quota_us")),
      parse_count(first_line("/sys/fs/cgroup/cpu/cpu.cfs_period_us")));
}

} // anonymous namespace

int count_cpu_list(const std::string &list) {
  int total = 0;
  size_t pos = 0;
  while (pos < list.size()) {
    size_t comma = list.find(',', pos);
    std::string item = list.substr(pos, comma == std::string::npos
                                            ? std::string::npos
                                            : comma - pos);
    pos = comma == std::string::npos ? list.size() : comma + 1;
    if (item.empty())
      continue;

    size_t dash = item.find('-');
    long lo = parse_count(item.substr(0, dash));
    long hi = dash == std::string::npos ? lo : parse_count(item.substr(dash + 1));
    if (lo < 0 || hi < lo)
      return -1;
    total += static_cast<int>(hi - lo + 1);
  }
  return total > 0 ? total : -1;
}

int detect_cpu_limit() {
  int quota = cgroup_v2_quota();
  if (quota <= 0)
    quota = cgroup_v1_quota();

  int cpuset = count_cpu_list(first_line("/sys/fs/cgroup/cpuset.cpus.effective"));
  if (cpuset <= 0)
    cpuset = count_cpu_list(first_line("/sys/fs/cgroup/cpuset/cpuset.cpus"));

  int limit = std::max(quota, cpuset);
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());
  if (limit <= 0)
    limit = FALLBACK_CPUS;
  return std::min(limit, MAX_CPUS);
}

int calculate_parallel_jobs() {
  int available = detect_cpu_limit();
  int configured = Config::max_parallel_jobs();

  /// Every job runs its own multi-threaded encoder
  int jobs = configured > 0 ? std::min(configured, available) : available / 4;
  jobs = std::max(1, jobs);
  LOG_INFO("CPU budget {} -> {} parallel export job(s)", available, jobs);
  return jobs;
}

int calculate_mask_workers() {
  int configured = Config::mask_workers();
  return configured > 0 ? configured : std::max(1, detect_cpu_limit());
}

} // namespace keycrop
