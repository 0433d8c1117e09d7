/**
 * @file task_queue.hpp
 * @brief Blocking FIFO shared between a producer and pool workers
 *
 * Producers push without blocking; consumers block in pop() until an item
 * arrives or the queue is closed. After close(), pop() keeps draining the
 * remaining items and then returns nullopt.
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace pbu::concurrency {

template<typename T>
class TaskQueue {
public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * @brief Enqueue an item
     *
     * RETURNS: false if the queue was already closed (item is dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue an item, waiting until one is available
     *
     * RETURNS: nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    /// Reject further pushes and wake every waiting consumer.
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace pbu::concurrency
