#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

enum class JobKind {
    Backup,
    Delivery,
    Archive,
    Import,     // generic copy: photos/videos routed into subfolders
};

enum class JobStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

const char* job_kind_name(JobKind kind);
const char* job_status_name(JobStatus status);
std::optional<JobKind> parse_job_kind(const std::string& name);
std::optional<JobStatus> parse_job_status(const std::string& name);

inline bool is_terminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed || s == JobStatus::Cancelled;
}

struct JobOptions {
    std::optional<std::string> naming_template;   // delivery: "{index}_{name}.{ext}"
    bool compress = false;                        // archive: rejected as Unimplemented
};

// What the caller asks for. Sources are already resolved by the caller.
struct JobRequest {
    JobKind kind = JobKind::Backup;
    std::string project_id;
    std::string project_name;
    std::vector<std::string> sources;
    std::string destination;
    JobOptions options;
};

struct JobCounters {
    uint64_t files_total = 0;
    uint64_t files_done = 0;
    uint64_t files_skipped = 0;
    uint64_t bytes_total = 0;
    uint64_t bytes_done = 0;
};

struct JobTotals {
    uint64_t files = 0;
    uint64_t bytes = 0;
};

struct Job {
    std::string id;
    JobKind kind = JobKind::Backup;
    std::string project_id;
    std::string project_name;
    std::vector<std::string> sources;
    std::string destination;
    JobOptions options;
    std::string created_at;             // ISO timestamp
    uint64_t seq = 0;                   // submission order, breaks created_at ties

    JobStatus status = JobStatus::Pending;
    JobCounters counters;
    std::string started_at;
    std::string completed_at;
    std::optional<std::string> error;

    // Kind-specific results
    std::vector<std::string> skipped_files;
    std::optional<std::string> manifest_path;   // delivery
};

struct JobOutcome {
    JobStatus status = JobStatus::Completed;
    std::optional<std::string> error;
};
