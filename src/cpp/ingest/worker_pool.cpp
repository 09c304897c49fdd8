#include "worker_pool.hpp"
#include "../utils/logger.hpp"
#include <exception>

namespace mdingest {

WorkerPool::WorkerPool(size_t workers, size_t queue_depth)
    : queue_(queue_depth > 0 ? queue_depth : 1) {
    if (workers == 0) workers = 1;
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        threads_.emplace_back(&WorkerPool::run, this, i);
    LOG_DBG("[pool] Started %zu workers (queue depth %zu)", workers,
        queue_depth > 0 ? queue_depth : size_t{1});
}

bool WorkerPool::submit(Task task) {
    return queue_.push(std::move(task));
}

void WorkerPool::shutdown() {
    queue_.close();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::run(size_t index) {
    while (auto task = queue_.pop()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            LOG_ERR("[pool] Worker %zu: task failed: %s", index, e.what());
        }
    }
}

} // namespace mdingest
