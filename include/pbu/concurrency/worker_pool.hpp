/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool returning futures
 *
 * The uploader runs two of these: one bounding how many files are in flight,
 * one (shared by every file) bounding how many chunk appends are in flight.
 *
 * THREAD SAFETY:
 * - submit() may be called from any thread, including pool workers of
 *   another pool
 * - A task must never block on a future of a task queued in the same pool
 *
 * EXAMPLE:
 * WorkerPool pool(4, "chunks");
 * auto future = pool.submit([] { return 42; });
 * future.get();  // 42
 */

#pragma once

#include "pbu/concurrency/task_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace pbu::concurrency {

class WorkerPool {
public:
    /**
     * @param thread_count Number of worker threads; must be > 0
     * @param name Label used in log lines
     */
    WorkerPool(std::size_t thread_count, std::string name);

    /// Drains queued tasks and joins every worker.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable for execution on a worker thread
     *
     * Exceptions thrown by the callable surface from future::get().
     *
     * THROWS: std::runtime_error if the pool is shutting down
     */
    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        auto future = packaged->get_future();

        if (!queue_.push([packaged]() { (*packaged)(); })) {
            throw std::runtime_error("worker pool '" + name_ + "' is shutting down");
        }
        return future;
    }

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Tasks queued but not yet picked up by a worker.
    [[nodiscard]] std::size_t pending() const { return queue_.size(); }

    /// Stop accepting work, finish what is queued and join. Idempotent.
    void shutdown();

private:
    void worker_loop(std::size_t worker_index);

    std::string name_;
    TaskQueue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
};

} // namespace pbu::concurrency
