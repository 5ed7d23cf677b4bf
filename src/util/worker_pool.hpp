#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO task queue.
// Shared by transfer execution and collector host jobs so the total number
// of concurrently running remote operations stays bounded.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t threads, std::string name = "workers");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. Returns false once the pool is stopping.
    bool submit(Task task);

    // Stop accepting work, finish queued tasks, join threads. Idempotent.
    void stop();

    std::size_t thread_count() const { return threads_.size(); }
    std::size_t pending() const;
    std::size_t active() const { return active_; }

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> threads_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::atomic<std::size_t> active_{0};
};
