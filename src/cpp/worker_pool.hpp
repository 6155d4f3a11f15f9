#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed number of threads sharing a single FIFO task queue.
// Keeps disk and JSON work off the GLib main loop.
class WorkerPool {
public:
    using Task = std::function<void()>;

    // Throws std::invalid_argument for a zero thread count
    explicit WorkerPool(std::uint32_t thread_count);

    // Stops accepting work, wakes the workers and joins them.
    // Tasks still queued at that point are discarded.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is shutting down
    bool enqueue(Task task);

    std::size_t thread_count() const { return threads_.size(); }

private:
    void run();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};
