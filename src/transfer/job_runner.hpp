#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include "job.hpp"
#include "job_policy.hpp"
#include "transfer_context.hpp"
#include "worker_pool.hpp"

// Drives jobs end to end: enumerate units, then for each one take a copy
// permit, copy and verify under the retry policy, record the result and
// publish progress; finally let the job's policy finalize and settle the
// terminal status.
//
// Cancellation only applies to Pending jobs. A running job cannot be
// cancelled; it stops early only when the runner shuts down, and then
// finishes Failed with "interrupted by shutdown".
class JobRunner {
public:
    explicit JobRunner(TransferContext& ctx);
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    Result<Job> submit_job(const JobRequest& request);

    // Freezes the totals, flips the job to InProgress and queues it on the
    // worker pool. InvalidState unless the job is Pending.
    Result<void> start_job(const std::string& id);

    Result<void> cancel_job(const std::string& id);
    Result<void> remove_job(const std::string& id);
    Result<Job> get_job(const std::string& id);
    std::vector<Job> list_jobs(JobKind kind);

    // Block until every started job has reached a terminal status and its
    // progress events have been delivered.
    void wait_idle();

    // Stop taking new work, let running jobs bail out between files, join.
    void shutdown();

    const JobPolicy& policy(JobKind kind) const;

private:
    using Clock = std::chrono::steady_clock;

    struct UnitResult {
        bool ok = false;
        uint64_t bytes = 0;
        std::string error;
    };

    void run(const Job& job, std::vector<TransferUnit> units);
    void run_sequential(const Job& job, const std::vector<TransferUnit>& units,
                        RunReport& report, JobOutcome& outcome, Clock::time_point started);
    void run_parallel(const Job& job, const std::vector<TransferUnit>& units,
                      RunReport& report, JobOutcome& outcome, Clock::time_point started);

    // Copy + verify one file under a permit and the retry policy.
    // on_bytes sees the bytes written so far for the current attempt.
    UnitResult transfer_unit(const Job& job, const TransferUnit& unit,
                             const std::function<void(uint64_t)>& on_bytes);

    // Returns false when the job must abort.
    bool handle_failure(const Job& job, const TransferUnit& unit, const std::string& error,
                        RunReport& report, JobOutcome& outcome);

    void publish(const Job& job, const std::string& file_name, uint64_t file_index,
                 uint64_t files_total, uint64_t bytes_done, uint64_t bytes_total,
                 Clock::time_point started);

    void settle(const Job& job, RunReport& report, JobOutcome outcome);

    JobPolicy& policy_for(JobKind kind);

    TransferContext& ctx_;
    std::vector<std::unique_ptr<JobPolicy>> policies_;
    std::atomic<bool> shutdown_{false};
    WorkerPool pool_;
};
