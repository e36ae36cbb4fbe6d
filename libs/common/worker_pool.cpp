/**
 * @file worker_pool.cpp
 * @brief std::jthread based worker pool
 */

#include "ecv/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ecv::common {

std::size_t resolve_jobs(std::size_t jobs)
{
    if (jobs > 0) {
        return jobs;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<std::size_t>(hw);
}

void parallel_for(std::size_t count,
                  std::size_t jobs,
                  std::stop_token stop,
                  const std::function<void(std::size_t, std::stop_token)>& task)
{
    const std::size_t workers = std::min(resolve_jobs(jobs), count);
    if (workers <= 1) {
        for (std::size_t i = 0; i < count && !stop.stop_requested(); ++i) {
            task(i, stop);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    {
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&] {
                while (!stop.stop_requested()) {
                    const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= count) {
                        return;
                    }
                    try {
                        task(i, stop);
                    } catch (...) {
                        const std::scoped_lock lock(error_mutex);
                        if (!first_error) {
                            first_error = std::current_exception();
                        }
                        return;
                    }
                }
            });
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace ecv::common
