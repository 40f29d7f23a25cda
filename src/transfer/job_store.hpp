#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <unordered_map>
#include <functional>
#include <optional>
#include <core/types.hpp>
#include "job.hpp"

// Owns every job of one kind and enforces the status lifecycle:
//   Pending -> InProgress -> {Completed, Failed, Cancelled}
//   Pending -> Cancelled
// One mutex guards the map. It is held only for the map mutation itself,
// never across I/O or hashing; submit() scans sources before locking.
class JobStore {
public:
    explicit JobStore(JobKind kind);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    JobKind kind() const { return kind_; }

    // Creates a Pending job with precomputed totals. InvalidInput if the
    // request is for another kind or its sources cannot be enumerated.
    Result<Job> submit(const JobRequest& request);

    // Pending -> InProgress, stamps started_at. When totals are given they
    // replace the submit-time estimate; after this call they are frozen.
    Result<Job> start(const std::string& id,
                      const std::optional<JobTotals>& totals = std::nullopt);

    // Applies a counter delta to an InProgress job. A missing job is a
    // no-op (it raced with removal). A delta that would break
    // files_done + files_skipped <= files_total is rejected; bytes_done is
    // clamped to bytes_total.
    void update(const std::string& id, const std::function<void(JobCounters&)>& mutator);

    void record_skipped(const std::string& id, const std::string& file_name);
    void set_manifest_path(const std::string& id, const std::string& path);

    // Sets the terminal status. No-op if the job is missing or already
    // terminal; InvalidInput if outcome.status is not terminal.
    Result<void> finish(const std::string& id, const JobOutcome& outcome);

    // Pending -> Cancelled. InvalidState for any other status, NotFound if absent.
    Result<void> cancel(const std::string& id);

    // InvalidState if the job is InProgress; unknown ids succeed.
    Result<void> remove(const std::string& id);

    Result<Job> get(const std::string& id) const;

    // Newest submitted first.
    std::vector<Job> list() const;

private:
    JobKind kind_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Job> jobs_;
    uint64_t next_seq_ = 0;
};
