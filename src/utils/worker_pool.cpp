/**
 * @file worker_pool.cpp
 * @brief Scoped std::thread pool with an atomic task counter
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/utils/worker_pool.h"
#include "atomcrypte/utils/log.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace atomcrypte {

namespace {

std::thread spawn_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

} // anonymous namespace

WorkerPool::WorkerPool(uint32_t worker_count)
    : WorkerPool(worker_count, spawn_thread) {}

WorkerPool::WorkerPool(uint32_t worker_count, Spawner spawner)
    : worker_count_(std::max(1u, worker_count)),
      spawner_(spawner ? std::move(spawner) : Spawner(spawn_thread)) {}

void WorkerPool::run(size_t task_count, const Task& task) const {
    if (task_count == 0) {
        return;
    }

    const uint32_t threads = static_cast<uint32_t>(
        std::min<size_t>(worker_count_, task_count));

    if (threads == 1) {
        for (size_t i = 0; i < task_count; i++) {
            task(i, 0);
        }
        return;
    }

    std::atomic<size_t> next_task(0);
    std::atomic<bool> failed(false);
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&](uint32_t worker_index) {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t i = next_task.fetch_add(1);
            if (i >= task_count) {
                break;
            }
            try {
                task(i, worker_index);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (uint32_t t = 0; t < threads; t++) {
        try {
            pool.push_back(spawner_([&worker, t]() { worker(t); }));
        } catch (const std::exception& e) {
            // Started workers keep draining the shared counter
            log::warn("worker pool: started " + std::to_string(pool.size()) + " of " +
                      std::to_string(threads) + " threads (" + e.what() + ")");
            break;
        }
    }
    if (pool.empty()) {
        worker(0);
    }
    for (auto& th : pool) {
        if (th.joinable()) {
            th.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace atomcrypte
