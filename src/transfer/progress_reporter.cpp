#include "progress_reporter.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

ProgressSample compute_sample(uint64_t bytes_done, uint64_t bytes_total, double elapsed_seconds) {
    ProgressSample s;
    s.speed_bytes_per_sec = elapsed_seconds > 0.0
        ? static_cast<double>(bytes_done) / elapsed_seconds
        : 0.0;

    uint64_t remaining = bytes_total > bytes_done ? bytes_total - bytes_done : 0;
    s.eta_seconds = s.speed_bytes_per_sec > 0.0
        ? static_cast<uint64_t>(static_cast<double>(remaining) / s.speed_bytes_per_sec)
        : 0;
    return s;
}

ProgressReporter::ProgressReporter(ProgressSink* sink, std::size_t queue_capacity)
    : sink_(sink), capacity_(queue_capacity > 0 ? queue_capacity : 1) {
    thread_ = std::thread(&ProgressReporter::delivery_loop, this);
}

ProgressReporter::~ProgressReporter() {
    flush();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressReporter::emit(const ProgressEvent& event) {
    Item item;
    item.event = event;
    push(std::move(item));
}

void ProgressReporter::emit_error(const std::string& job_id, const std::string& message) {
    Item item;
    item.is_error = true;
    item.job_id = job_id;
    item.message = message;
    push(std::move(item));
}

void ProgressReporter::push(Item item) {
    if (!sink_) return;

    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();

    if (dropped) {
        uint64_t n = ++dropped_;
        // One line per 100 drops keeps a stalled observer from flooding the log
        if (n == 1 || n % 100 == 0) {
            haul_log(fmt::format("progress: observer is behind, {} events dropped", n));
        }
    }
}

void ProgressReporter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

void ProgressReporter::delivery_loop() {
    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stop_ and nothing left
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        deliver(item);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }
}

void ProgressReporter::deliver(const Item& item) {
    try {
        if (item.is_error) {
            sink_->emit_error(item.job_id, item.message);
        } else {
            sink_->emit(item.event);
        }
    } catch (const std::exception& e) {
        haul_log(fmt::format("progress: sink threw for job {}: {}",
                             item.is_error ? item.job_id : item.event.job_id, e.what()));
    } catch (...) {
        haul_log(fmt::format("progress: sink threw a non-standard exception for job {}",
                             item.is_error ? item.job_id : item.event.job_id));
    }
}
