#pragma once

#include "job_policy.hpp"

class HistoryLog;
class ProjectRegistry;

// Mirrors each source under <dest>/<source name>/. Failed files are skipped;
// every finished run is prepended to the backup history.
class BackupPolicy : public JobPolicy {
public:
    explicit BackupPolicy(HistoryLog& history) : history_(history) {}

    JobKind kind() const override { return JobKind::Backup; }
    Result<std::vector<TransferUnit>> enumerate(const Job& job) const override;
    FailureAction on_unit_failure() const override { return FailureAction::Skip; }
    void on_finished(const Job& job, const RunReport& report) override;

private:
    HistoryLog& history_;
};

// Copies hand-picked files into one folder, optionally renamed, and writes
// a manifest. Any failed file fails the delivery.
class DeliveryPolicy : public JobPolicy {
public:
    JobKind kind() const override { return JobKind::Delivery; }
    Result<void> validate(const JobRequest& request) const override;
    Result<std::vector<TransferUnit>> enumerate(const Job& job) const override;
    FailureAction on_unit_failure() const override { return FailureAction::Abort; }
    Result<void> finalize(const Job& job, RunReport& report) override;
};

// Moves a project folder to <dest>/<project name>/: copy everything, then
// delete the source and mark the project Archived. Any failed file fails
// the archive and leaves the source untouched.
class ArchivePolicy : public JobPolicy {
public:
    explicit ArchivePolicy(ProjectRegistry& projects) : projects_(projects) {}

    JobKind kind() const override { return JobKind::Archive; }
    Result<void> validate(const JobRequest& request) const override;
    Result<std::vector<TransferUnit>> enumerate(const Job& job) const override;
    FailureAction on_unit_failure() const override { return FailureAction::Abort; }
    Result<void> finalize(const Job& job, RunReport& report) override;

private:
    ProjectRegistry& projects_;
};

// Card import: files fan out in parallel into Photos/ and Videos/ by
// extension. Failed files are skipped; each run lands in the import history.
class ImportPolicy : public JobPolicy {
public:
    explicit ImportPolicy(HistoryLog& history) : history_(history) {}

    JobKind kind() const override { return JobKind::Import; }
    Result<std::vector<TransferUnit>> enumerate(const Job& job) const override;
    FailureAction on_unit_failure() const override { return FailureAction::Skip; }
    bool parallel() const override { return true; }
    void on_finished(const Job& job, const RunReport& report) override;

private:
    HistoryLog& history_;
};

// Shared by the history-writing policies.
std::string join_sources(const std::vector<std::string>& sources);
