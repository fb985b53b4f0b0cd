#pragma once

#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>
#include <string>

namespace savekeeper {

/**
 * WorkerPool - fixed set of threads draining a FIFO of tasks
 *
 * shutdown() stops accepting work, lets the queued tasks finish and joins.
 * A task that throws is logged and does not take its thread down.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t thread_count, std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shut down or if no worker thread could be started
    bool submit(Task task);

    void shutdown();


private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> threads_;
    std::deque<Task> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace savekeeper
