/**
 * @file worker_pool.h
 * @brief Scoped data-parallel task runner
 *
 * run() spawns up to worker_count threads that pull task indices from a
 * shared atomic counter and joins them before returning. The first
 * exception thrown by any task stops the remaining tasks from being
 * picked up and is rethrown on the calling thread after the join.
 * If the system refuses a thread, the workers already started finish the
 * remaining tasks; with none started the tasks run on the caller.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_UTILS_WORKER_POOL_H
#define ATOMCRYPTE_UTILS_WORKER_POOL_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

namespace atomcrypte {

class WorkerPool {
public:
    /// task(task_index, worker_index)
    using Task = std::function<void(size_t, uint32_t)>;
    /// Starts one worker thread; may throw std::system_error
    using Spawner = std::function<std::thread(std::function<void()>)>;

    explicit WorkerPool(uint32_t worker_count);
    WorkerPool(uint32_t worker_count, Spawner spawner);

    uint32_t worker_count() const noexcept { return worker_count_; }

    /**
     * @brief Run task for every index in [0, task_count)
     *
     * With one worker (or one task) everything runs inline on the caller.
     */
    void run(size_t task_count, const Task& task) const;

private:
    uint32_t worker_count_;
    Spawner spawner_;
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_UTILS_WORKER_POOL_H
