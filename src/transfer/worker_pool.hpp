#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO of tasks. Jobs run as tasks on the
// pool, so many jobs share a few threads instead of one thread each.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once stop() has been called.
    bool submit(const std::string& label, Task task);

    // Block until the queue is empty and no task is running.
    void wait_idle();

    // Refuse new tasks, let workers drain what is queued, then join them.
    void stop();

    bool running() const { return !stopping_.load(); }
    std::size_t queue_size() const;
    int worker_count() const { return workers_; }

private:
    struct Entry {
        std::string label;
        Task task;
    };

    void worker_loop(int worker_id);

    int workers_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::condition_variable idle_;
    std::queue<Entry> queue_;
    int active_ = 0;

    std::vector<std::thread> threads_;
};
