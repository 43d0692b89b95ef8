/**
 * @file system.hpp
 * @brief CPU detection and worker pool sizing
 */

#ifndef KEYCROP_SYSTEM_HPP
#define KEYCROP_SYSTEM_HPP

#include <string>

namespace keycrop {

/**
 * @brief CPUs this process may use.
 *
 * @note std::thread::hardware_concurrency() reports the host inside a
 *       container. The cgroup quota (v2 `cpu.max`, v1 `cpu.cfs_quota_us`)
 *       and the cpuset are consulted first; the result is capped at 64.
 */
int detect_cpu_limit();

/**
 * @brief Count CPUs in a cpuset list such as "0-3,8,10-11".
 * @return Count, or -1 when the list is empty or malformed
 */
int count_cpu_list(const std::string &list);

/**
 * @brief Number of export jobs allowed to run concurrently.
 *
 * @note MAX_PARALLEL_JOBS when set (capped at the CPU budget); otherwise a
 *       quarter of the CPUs, at least 1.
 */
int calculate_parallel_jobs();

/// MASK_WORKERS when set, otherwise one rasterizer thread per CPU
int calculate_mask_workers();

} // namespace keycrop

#endif // KEYCROP_SYSTEM_HPP
