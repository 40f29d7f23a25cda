#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

WorkerPool::WorkerPool(int workers) : workers_(workers > 0 ? workers : 1) {
    threads_.reserve(workers_);
    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    haul_log(fmt::format("pool: started {} workers", workers_));
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(const std::string& label, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            haul_log(fmt::format("pool: rejected {} (stopping)", label));
            return false;
        }
        queue_.push(Entry{label, std::move(task)});
    }
    available_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load() && threads_.empty()) return;
        stopping_.store(true);
    }
    available_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    haul_log("pool: stopped");
}

std::size_t WorkerPool::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop(int worker_id) {
    while (true) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            available_.wait(lock, [this] { return stopping_.load() || !queue_.empty(); });

            // Queued tasks still run after stop() so no job is left Pending
            // behind a start that already succeeded.
            if (queue_.empty()) {
                break;
            }
            entry = std::move(queue_.front());
            queue_.pop();
            ++active_;
        }

        try {
            entry.task();
        } catch (const std::exception& e) {
            haul_log(fmt::format("pool: worker {} task {} threw: {}",
                                 worker_id, entry.label, e.what()));
        } catch (...) {
            haul_log(fmt::format("pool: worker {} task {} threw a non-standard exception",
                                 worker_id, entry.label));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_.notify_all();
    }
}
