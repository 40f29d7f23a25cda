#include "job.hpp"

const char* job_kind_name(JobKind kind) {
    switch (kind) {
        case JobKind::Backup:   return "backup";
        case JobKind::Delivery: return "delivery";
        case JobKind::Archive:  return "archive";
        case JobKind::Import:   return "import";
    }
    return "unknown";
}

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:    return "pending";
        case JobStatus::InProgress: return "inprogress";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
        case JobStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

std::optional<JobKind> parse_job_kind(const std::string& name) {
    if (name == "backup")   return JobKind::Backup;
    if (name == "delivery") return JobKind::Delivery;
    if (name == "archive")  return JobKind::Archive;
    if (name == "import" || name == "copy") return JobKind::Import;
    return std::nullopt;
}

std::optional<JobStatus> parse_job_status(const std::string& name) {
    if (name == "pending")    return JobStatus::Pending;
    if (name == "inprogress") return JobStatus::InProgress;
    if (name == "completed")  return JobStatus::Completed;
    if (name == "failed")     return JobStatus::Failed;
    if (name == "cancelled")  return JobStatus::Cancelled;
    return std::nullopt;
}
