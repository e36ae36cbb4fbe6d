#pragma once

/**
 * @file worker_pool.hpp
 * @brief Bounded worker pool over an index range
 */

#include <cstddef>
#include <functional>
#include <stop_token>

namespace ecv::common {

/// 0 means hardware concurrency (at least 1).
[[nodiscard]] std::size_t resolve_jobs(std::size_t jobs);

/**
 * Run `task(i, stop)` for every i in [0, count) on at most `jobs` threads.
 *
 * Indices are handed out in increasing order. Once `stop` is requested no
 * further index is started; tasks already running receive the same token.
 * Each task must only write to state owned by its own index. An exception
 * escaping a task is rethrown on the calling thread after all workers join.
 */
void parallel_for(std::size_t count,
                  std::size_t jobs,
                  std::stop_token stop,
                  const std::function<void(std::size_t, std::stop_token)>& task);

}  // namespace ecv::common
