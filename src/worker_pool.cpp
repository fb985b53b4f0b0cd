#include "worker_pool.hpp"
#include "logger.hpp"
#include <system_error>

namespace savekeeper {

WorkerPool::WorkerPool(size_t thread_count, std::string name)
    : name_(std::move(name)) {
    if (thread_count == 0) thread_count = 1;

    for (size_t i = 0; i < thread_count; i++) {
        try {
            threads_.emplace_back(&WorkerPool::worker_loop, this);
        } catch (const std::system_error& e) {
            Logger::error("[WorkerPool] " + name_ + ": failed to start worker thread: " + e.what());
            break;
        }
    }
    Logger::debug("[WorkerPool] " + name_ + " started with " + std::to_string(threads_.size()) + " threads");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || threads_.empty()) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("[WorkerPool] " + name_ + ": task failed: " + e.what());
        }
    }
}

} // namespace savekeeper
