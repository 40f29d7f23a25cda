#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include "job.hpp"

// One structured progress message for a job.
struct ProgressEvent {
    std::string job_id;
    JobKind kind = JobKind::Backup;
    std::string current_file_name;
    uint64_t current_file_index = 0;    // 1-based
    uint64_t files_total = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    double speed_bytes_per_sec = 0.0;
    uint64_t eta_seconds = 0;
};

// Throughput and ETA derived from counters plus elapsed wall-clock time.
struct ProgressSample {
    double speed_bytes_per_sec = 0.0;
    uint64_t eta_seconds = 0;
};

// speed = bytes_done / elapsed (0 if elapsed is 0); eta = remaining / speed
// (0 if speed is 0), with remaining saturating at zero.
ProgressSample compute_sample(uint64_t bytes_done, uint64_t bytes_total, double elapsed_seconds);

// Whatever the host exposes for observers (terminal, log, GUI bridge).
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void emit(const ProgressEvent& event) = 0;
    virtual void emit_error(const std::string& job_id, const std::string& message) = 0;
};

// Fire-and-forget publisher. Events are queued and delivered to the sink on
// a dedicated thread, so a slow sink never stalls a transfer. When the queue
// is full the oldest pending event is dropped. Sink exceptions are logged
// and swallowed. Delivery order matches emit order.
class ProgressReporter {
public:
    // sink may be null: events are then discarded.
    ProgressReporter(ProgressSink* sink, std::size_t queue_capacity);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void emit(const ProgressEvent& event);
    void emit_error(const std::string& job_id, const std::string& message);

    // Block until everything queued so far has been handed to the sink.
    void flush();

    uint64_t dropped() const { return dropped_.load(); }

private:
    struct Item {
        bool is_error = false;
        ProgressEvent event;
        std::string job_id;
        std::string message;
    };

    void push(Item item);
    void delivery_loop();
    void deliver(const Item& item);

    ProgressSink* sink_;
    std::size_t capacity_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Item> queue_;
    bool delivering_ = false;
    bool stop_ = false;
    std::atomic<uint64_t> dropped_{0};

    std::thread thread_;
};
