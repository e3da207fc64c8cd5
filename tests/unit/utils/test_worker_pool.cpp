/**
 * @file test_worker_pool.cpp
 * @brief WorkerPool scheduling and error propagation tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "atomcrypte/utils/worker_pool.h"

using namespace atomcrypte;

TEST(WorkerPoolTest, EveryTaskRunsExactlyOnce) {
    WorkerPool pool(4);
    std::vector<std::atomic<int>> hits(1000);
    for (auto& h : hits) h.store(0);

    pool.run(hits.size(), [&](size_t i, uint32_t worker) {
        EXPECT_LT(worker, 4u);
        hits[i].fetch_add(1);
    });

    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "task " << i;
    }
}

TEST(WorkerPoolTest, ZeroWorkersMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1u);

    std::vector<size_t> order;
    pool.run(5, [&](size_t i, uint32_t worker) {
        EXPECT_EQ(worker, 0u);
        order.push_back(i);
    });
    EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST(WorkerPoolTest, NoTasksIsANoOp) {
    WorkerPool pool(8);
    bool called = false;
    pool.run(0, [&](size_t, uint32_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(WorkerPoolTest, FirstFailureIsRethrown) {
    WorkerPool pool(4);
    EXPECT_THROW(pool.run(64, [](size_t i, uint32_t) {
        if (i == 17) {
            throw std::runtime_error("chunk failed");
        }
    }), std::runtime_error);
}

namespace {

/// Starts `allowed` threads, then refuses like a process at its thread limit
WorkerPool::Spawner limited_spawner(int allowed, std::atomic<int>& started) {
    return [allowed, &started](std::function<void()> fn) {
        if (started.fetch_add(1) >= allowed) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit");
        }
        return std::thread(std::move(fn));
    };
}

} // anonymous namespace

TEST(WorkerPoolTest, RefusedThreadsLeaveWorkToStartedWorkers) {
    std::atomic<int> started(0);
    WorkerPool pool(16, limited_spawner(2, started));
    std::vector<std::atomic<int>> hits(500);
    for (auto& h : hits) h.store(0);

    pool.run(hits.size(), [&](size_t i, uint32_t worker) {
        EXPECT_LT(worker, 2u);
        hits[i].fetch_add(1);
    });

    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "task " << i;
    }
}

TEST(WorkerPoolTest, NoThreadAvailableRunsOnCaller) {
    std::atomic<int> started(0);
    WorkerPool pool(8, limited_spawner(0, started));
    const auto caller = std::this_thread::get_id();
    size_t count = 0;

    pool.run(32, [&](size_t, uint32_t worker) {
        EXPECT_EQ(worker, 0u);
        EXPECT_EQ(std::this_thread::get_id(), caller);
        count++;
    });
    EXPECT_EQ(count, 32u);
}

TEST(WorkerPoolTest, FailureAfterRefusedThreadIsStillRethrown) {
    std::atomic<int> started(0);
    WorkerPool pool(8, limited_spawner(3, started));
    EXPECT_THROW(pool.run(64, [](size_t i, uint32_t) {
        if (i == 40) {
            throw std::runtime_error("chunk failed");
        }
    }), std::runtime_error);
}

TEST(WorkerPoolTest, NonStandardExceptionIsRethrown) {
    WorkerPool pool(4);
    EXPECT_THROW(pool.run(16, [](size_t i, uint32_t) {
        if (i == 5) {
            throw 42;
        }
    }), int);
}
