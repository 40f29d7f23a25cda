#pragma once

#include <core/config.hpp>
#include <history/history_log.hpp>
#include <history/project_registry.hpp>
#include "job_store.hpp"
#include "concurrency_limiter.hpp"
#include "integrity_verifier.hpp"
#include "retry_policy.hpp"
#include "progress_reporter.hpp"
#include "transfer_engine.hpp"

// Shared state every job operation works against. Built once at startup
// by the host and passed by reference; it must outlive any JobRunner
// using it. Collaborators it does not own (project registry, copy engine,
// progress sink) are borrowed.
class TransferContext {
public:
    TransferContext(const Config& config,
                    ProjectRegistry& projects,
                    TransferEngine& engine,
                    ProgressSink* sink,
                    RetryPolicy::Sleeper sleeper = nullptr);

    TransferContext(const TransferContext&) = delete;
    TransferContext& operator=(const TransferContext&) = delete;

    const Config& config() const { return config_; }

    JobStore& store(JobKind kind);

    // The store holding id, or nullptr if no store knows it.
    JobStore* find_store(const std::string& id);

    ConcurrencyLimiter& limiter() { return limiter_; }
    const IntegrityVerifier& verifier() const { return verifier_; }
    const RetryPolicy& retry() const { return retry_; }
    ProgressReporter& progress() { return progress_; }
    HistoryLog& backup_history() { return backup_history_; }
    HistoryLog& import_history() { return import_history_; }
    ProjectRegistry& projects() { return projects_; }
    TransferEngine& engine() { return engine_; }

private:
    Config config_;

    JobStore backups_{JobKind::Backup};
    JobStore deliveries_{JobKind::Delivery};
    JobStore archives_{JobKind::Archive};
    JobStore imports_{JobKind::Import};

    ConcurrencyLimiter limiter_;
    IntegrityVerifier verifier_;
    RetryPolicy retry_;
    ProgressReporter progress_;
    HistoryLog backup_history_;
    HistoryLog import_history_;

    ProjectRegistry& projects_;
    TransferEngine& engine_;
};
