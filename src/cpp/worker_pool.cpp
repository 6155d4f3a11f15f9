#include "worker_pool.hpp"
#include "debug.hpp"
#include <exception>
#include <stdexcept>
#include <string>

WorkerPool::WorkerPool(std::uint32_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("Invalid worker thread count: " + std::to_string(thread_count));
    }
    for (std::uint32_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    wake_.notify_all();
    for (auto& thread : threads_) {
        thread.join();
    }
}

bool WorkerPool::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    wake_.notify_one();
    return true;
}

void WorkerPool::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // A throwing task must not take the worker down with it
        try {
            task();
        } catch (const std::exception& e) {
            ERROR_LOG("Worker task failed: " << e.what());
        }
    }
}
