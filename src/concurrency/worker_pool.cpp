#include "pbu/concurrency/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace pbu::concurrency {

WorkerPool::WorkerPool(std::size_t thread_count, std::string name)
    : name_(std::move(name)) {
    if (thread_count == 0) {
        throw std::invalid_argument("worker pool '" + name_ + "' needs at least one thread");
    }

    workers_.reserve(thread_count);
    try {
        for (std::size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back(&WorkerPool::worker_loop, this, i);
        }
    } catch (const std::system_error& e) {
        // Join the threads that did start before the members are destroyed
        spdlog::error("Worker pool '{}' started only {} of {} threads: {}",
                      name_, workers_.size(), thread_count, e.what());
        shutdown();
        throw;
    }
    spdlog::debug("Worker pool '{}' started with {} threads", name_, thread_count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    queue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop(std::size_t worker_index) {
    // Packaged tasks capture their own exceptions, so the loop never unwinds.
    while (auto task = queue_.pop()) {
        (*task)();
    }
    spdlog::trace("Worker {}#{} exiting", name_, worker_index);
}

} // namespace pbu::concurrency
