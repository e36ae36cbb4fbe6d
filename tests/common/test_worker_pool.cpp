/**
 * @file test_worker_pool.cpp
 * @brief Index coverage, cancellation and error propagation of parallel_for
 */

#include "ecv/worker_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <stop_token>
#include <vector>

#include <gtest/gtest.h>

namespace ecv::common::test {

TEST(WorkerPoolTest, ResolveJobs)
{
    EXPECT_GE(resolve_jobs(0), 1U);
    EXPECT_EQ(resolve_jobs(3), 3U);
}

TEST(WorkerPoolTest, EveryIndexRunsOnce)
{
    for (std::size_t jobs : {1U, 2U, 8U}) {
        SCOPED_TRACE(jobs);
        std::vector<int> hits(100, 0);
        parallel_for(hits.size(), jobs, std::stop_token{}, [&](std::size_t i, std::stop_token) {
            ++hits[i];
        });
        for (int h : hits) {
            EXPECT_EQ(h, 1);
        }
    }
}

TEST(WorkerPoolTest, EmptyRange)
{
    std::atomic<int> calls{0};
    parallel_for(0, 4, std::stop_token{}, [&](std::size_t, std::stop_token) { ++calls; });
    EXPECT_EQ(calls.load(), 0);
}

TEST(WorkerPoolTest, StopBeforeStartRunsNothing)
{
    std::stop_source source;
    source.request_stop();
    std::atomic<int> calls{0};
    parallel_for(50, 4, source.get_token(), [&](std::size_t, std::stop_token) { ++calls; });
    EXPECT_EQ(calls.load(), 0);
}

TEST(WorkerPoolTest, StopDuringRunSkipsLaterIndices)
{
    std::stop_source source;
    std::vector<int> hits(20, 0);
    parallel_for(hits.size(), 1, source.get_token(), [&](std::size_t i, std::stop_token) {
        ++hits[i];
        if (i == 4) {
            source.request_stop();
        }
    });
    for (std::size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i], i <= 4 ? 1 : 0) << i;
    }
}

TEST(WorkerPoolTest, TaskExceptionIsRethrown)
{
    for (std::size_t jobs : {1U, 4U}) {
        SCOPED_TRACE(jobs);
        EXPECT_THROW(parallel_for(10,
                                  jobs,
                                  std::stop_token{},
                                  [](std::size_t i, std::stop_token) {
                                      if (i == 3) {
                                          throw std::runtime_error("boom");
                                      }
                                  }),
                     std::runtime_error);
    }
}

}  // namespace ecv::common::test
