#include "job_store.hpp"
#include "source_scan.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

JobStore::JobStore(JobKind kind) : kind_(kind) {}

Result<Job> JobStore::submit(const JobRequest& request) {
    if (request.kind != kind_) {
        return Result<Job>::Err(ErrorKind::InvalidInput,
            fmt::format("{} job submitted to the {} store",
                        job_kind_name(request.kind), job_kind_name(kind_)));
    }
    if (request.destination.empty()) {
        return Result<Job>::Err(ErrorKind::InvalidInput, "Destination is empty");
    }

    // Enumerate outside the lock
    auto totals = count_sources(request.sources);
    if (totals.is_err()) {
        return Result<Job>::Err(ErrorKind::InvalidInput, totals.error);
    }

    Job job;
    job.id = generate_uuid();
    job.kind = request.kind;
    job.project_id = request.project_id;
    job.project_name = request.project_name;
    job.sources = request.sources;
    job.destination = request.destination;
    job.options = request.options;
    job.created_at = now_iso();
    job.counters.files_total = totals.value.files;
    job.counters.bytes_total = totals.value.bytes;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.seq = next_seq_++;
        jobs_[job.id] = job;
    }

    haul_log(fmt::format("[{}] submitted {} ({} files, {} bytes)",
                         job_kind_name(kind_), job.id,
                         job.counters.files_total, job.counters.bytes_total));
    return Result<Job>::Ok(job);
}

Result<Job> JobStore::start(const std::string& id, const std::optional<JobTotals>& totals) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<Job>::Err(ErrorKind::NotFound, "Job not found: " + id);
    }
    Job& job = it->second;
    if (job.status != JobStatus::Pending) {
        return Result<Job>::Err(ErrorKind::InvalidState,
            fmt::format("Job {} is not pending (status: {})", id, job_status_name(job.status)));
    }

    if (totals) {
        job.counters.files_total = totals->files;
        job.counters.bytes_total = totals->bytes;
    }
    job.status = JobStatus::InProgress;
    job.started_at = now_iso();
    return Result<Job>::Ok(job);
}

void JobStore::update(const std::string& id, const std::function<void(JobCounters&)>& mutator) {
    JobCounters rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.status != JobStatus::InProgress) {
            return;
        }

        JobCounters next = it->second.counters;
        mutator(next);

        // Totals are frozen once the job is running
        next.files_total = it->second.counters.files_total;
        next.bytes_total = it->second.counters.bytes_total;

        if (next.bytes_done > next.bytes_total) {
            next.bytes_done = next.bytes_total;
        }
        if (next.files_done + next.files_skipped <= next.files_total) {
            it->second.counters = next;
            return;
        }
        rejected = next;
    }

    haul_log(fmt::format("[{}] rejected counter update for {}: {} done + {} skipped > {} total",
                         job_kind_name(kind_), id, rejected.files_done,
                         rejected.files_skipped, rejected.files_total));
}

void JobStore::record_skipped(const std::string& id, const std::string& file_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end()) {
        it->second.skipped_files.push_back(file_name);
    }
}

void JobStore::set_manifest_path(const std::string& id, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end()) {
        it->second.manifest_path = path;
    }
}

Result<void> JobStore::finish(const std::string& id, const JobOutcome& outcome) {
    if (!is_terminal(outcome.status)) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("finish() needs a terminal status, got {}", job_status_name(outcome.status)));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || is_terminal(it->second.status)) {
            return Result<void>::Ok();
        }
        Job& job = it->second;
        job.status = outcome.status;
        job.completed_at = now_iso();
        if (outcome.error) job.error = outcome.error;
    }

    haul_log(fmt::format("[{}] finished {} as {}{}", job_kind_name(kind_), id,
                         job_status_name(outcome.status),
                         outcome.error ? ": " + *outcome.error : ""));
    return Result<void>::Ok();
}

Result<void> JobStore::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return Result<void>::Err(ErrorKind::NotFound, "Job not found: " + id);
        }
        Job& job = it->second;
        if (job.status != JobStatus::Pending) {
            return Result<void>::Err(ErrorKind::InvalidState,
                fmt::format("Can only cancel pending jobs ({} is {})", id, job_status_name(job.status)));
        }
        job.status = JobStatus::Cancelled;
        job.completed_at = now_iso();
    }

    haul_log(fmt::format("[{}] cancelled {}", job_kind_name(kind_), id));
    return Result<void>::Ok();
}

Result<void> JobStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<void>::Ok();
    }
    if (it->second.status == JobStatus::InProgress) {
        return Result<void>::Err(ErrorKind::InvalidState, "Cannot remove in-progress job " + id);
    }
    jobs_.erase(it);
    return Result<void>::Ok();
}

Result<Job> JobStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<Job>::Err(ErrorKind::NotFound, "Job not found: " + id);
    }
    return Result<Job>::Ok(it->second);
}

std::vector<Job> JobStore::list() const {
    std::vector<Job> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(jobs_.size());
        for (const auto& [id, job] : jobs_) {
            out.push_back(job);
        }
    }
    std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) {
        return a.seq > b.seq;
    });
    return out;
}
