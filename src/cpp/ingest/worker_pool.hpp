#pragma once
// Fixed-size pool of worker threads fed by a bounded task queue.
// submit() blocks while the queue is full, which is what bounds the number
// of chunks buffered ahead of the workers.
#include <functional>
#include <thread>
#include <vector>
#include "../utils/blocking_queue.hpp"

namespace mdingest {

class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t workers, size_t queue_depth);
    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks while the queue is full; false once the pool is shut down
    bool submit(Task task);

    // Runs the queued tasks to completion, then joins the workers
    void shutdown();

    [[nodiscard]] size_t size() const { return threads_.size(); }

private:
    BlockingQueue<Task> queue_;
    std::vector<std::thread> threads_;

    void run(size_t index);
};

} // namespace mdingest
