#include "job_runner.hpp"
#include "kind_policies.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

namespace {

void remove_partial(const fs::path& dest) {
    std::error_code ec;
    fs::remove(dest, ec);
    if (ec) {
        haul_log(fmt::format("runner: could not remove partial {}: {}", dest.string(), ec.message()));
    }
}

} // namespace

JobRunner::JobRunner(TransferContext& ctx)
    : ctx_(ctx), pool_(ctx.config().transfer().workers) {
    // Indexed by JobKind
    policies_.push_back(std::make_unique<BackupPolicy>(ctx_.backup_history()));
    policies_.push_back(std::make_unique<DeliveryPolicy>());
    policies_.push_back(std::make_unique<ArchivePolicy>(ctx_.projects()));
    policies_.push_back(std::make_unique<ImportPolicy>(ctx_.import_history()));
}

JobRunner::~JobRunner() {
    shutdown();
}

JobPolicy& JobRunner::policy_for(JobKind kind) {
    return *policies_[static_cast<std::size_t>(kind)];
}

const JobPolicy& JobRunner::policy(JobKind kind) const {
    return *policies_[static_cast<std::size_t>(kind)];
}

// ── Job operations ─────────────────────────────────────────

Result<Job> JobRunner::submit_job(const JobRequest& request) {
    auto valid = policy_for(request.kind).validate(request);
    if (valid.is_err()) {
        haul_log(fmt::format("[{}] submit rejected: {}", job_kind_name(request.kind), valid.error));
        return Result<Job>::Err(valid);
    }

    auto job = ctx_.store(request.kind).submit(request);
    if (job.is_ok()) {
        append_job_log(job.value.id, fmt::format("submitted {} job: {} source(s) -> {}",
                       job_kind_name(request.kind), request.sources.size(), request.destination));
    }
    return job;
}

Result<void> JobRunner::start_job(const std::string& id) {
    if (shutdown_.load()) {
        return Result<void>::Err(ErrorKind::InvalidState, "Runner is shutting down");
    }

    JobStore* store = ctx_.find_store(id);
    if (!store) {
        return Result<void>::Err(ErrorKind::NotFound, "Job not found: " + id);
    }
    auto current = store->get(id);
    if (current.is_err()) {
        return Result<void>::Err(current);
    }
    if (current.value.status != JobStatus::Pending) {
        return Result<void>::Err(ErrorKind::InvalidState,
            fmt::format("Job {} is not pending (status: {})", id, job_status_name(current.value.status)));
    }

    // Enumerate before flipping the status so the totals are frozen at start
    auto units = policy_for(current.value.kind).enumerate(current.value);
    if (units.is_err()) {
        // Sources changed since submit; the job can no longer run as described
        auto started = store->start(id);
        if (started.is_err()) {
            return Result<void>::Err(started);
        }
        auto finished = store->finish(id, JobOutcome{JobStatus::Failed, units.error});
        if (finished.is_err()) {
            haul_log(fmt::format("runner: finish {} failed: {}", id, finished.error));
        }
        ctx_.progress().emit_error(id, units.error);
        append_job_log(id, "failed to enumerate sources: " + units.error);
        return Result<void>::Err(units);
    }

    JobTotals totals;
    totals.files = units.value.size();
    for (const auto& u : units.value) {
        totals.bytes += u.size;
    }

    auto started = store->start(id, totals);
    if (started.is_err()) {
        return Result<void>::Err(started);
    }
    append_job_log(id, fmt::format("started: {} files, {} bytes", totals.files, totals.bytes));
    haul_log(fmt::format("[{}] started {}", job_kind_name(started.value.kind), id));

    Job job = started.value;
    auto queued = pool_.submit(id, [this, job, units = std::move(units.value)]() mutable {
        run(job, std::move(units));
    });
    if (!queued) {
        auto finished = store->finish(id, JobOutcome{JobStatus::Failed, std::string(SHUTDOWN_ERROR)});
        if (finished.is_err()) {
            haul_log(fmt::format("runner: finish {} failed: {}", id, finished.error));
        }
        return Result<void>::Err(ErrorKind::InvalidState, "Runner is shutting down");
    }
    return Result<void>::Ok();
}

Result<void> JobRunner::cancel_job(const std::string& id) {
    JobStore* store = ctx_.find_store(id);
    if (!store) {
        return Result<void>::Err(ErrorKind::NotFound, "Job not found: " + id);
    }
    auto cancelled = store->cancel(id);
    if (cancelled.is_ok()) {
        append_job_log(id, "cancelled");
    }
    return cancelled;
}

Result<void> JobRunner::remove_job(const std::string& id) {
    JobStore* store = ctx_.find_store(id);
    if (!store) {
        // Unknown ids are not an error
        return Result<void>::Ok();
    }
    auto removed = store->remove(id);
    if (removed.is_ok()) {
        haul_log(fmt::format("[{}] removed {}", job_kind_name(store->kind()), id));
    }
    return removed;
}

Result<Job> JobRunner::get_job(const std::string& id) {
    JobStore* store = ctx_.find_store(id);
    if (!store) {
        return Result<Job>::Err(ErrorKind::NotFound, "Job not found: " + id);
    }
    return store->get(id);
}

std::vector<Job> JobRunner::list_jobs(JobKind kind) {
    return ctx_.store(kind).list();
}

void JobRunner::wait_idle() {
    pool_.wait_idle();
    ctx_.progress().flush();
}

void JobRunner::shutdown() {
    if (!shutdown_.exchange(true)) {
        haul_log("runner: shutting down");
    }
    pool_.stop();
    ctx_.progress().flush();
}

// ── Execution ──────────────────────────────────────────────

void JobRunner::run(const Job& job, std::vector<TransferUnit> units) {
    auto started = Clock::now();
    RunReport report;
    JobOutcome outcome{JobStatus::Completed, std::nullopt};

    try {
        if (policy_for(job.kind).parallel()) {
            run_parallel(job, units, report, outcome, started);
        } else {
            run_sequential(job, units, report, outcome, started);
        }
    } catch (const std::exception& e) {
        outcome = JobOutcome{JobStatus::Failed, fmt::format("unexpected error: {}", e.what())};
        ctx_.progress().emit_error(job.id, *outcome.error);
    }

    settle(job, report, outcome);
}

void JobRunner::run_sequential(const Job& job, const std::vector<TransferUnit>& units,
                               RunReport& report, JobOutcome& outcome,
                               Clock::time_point started) {
    JobStore& store = ctx_.store(job.kind);
    const uint64_t files_total = job.counters.files_total;
    const uint64_t bytes_total = job.counters.bytes_total;
    uint64_t bytes_done = 0;

    // A single large file reports per chunk; many files report per file.
    const bool per_chunk = units.size() == 1;

    for (std::size_t i = 0; i < units.size(); ++i) {
        if (shutdown_.load()) {
            outcome = JobOutcome{JobStatus::Failed, std::string(SHUTDOWN_ERROR)};
            return;
        }

        const TransferUnit& unit = units[i];
        uint64_t high_water = bytes_done;
        std::function<void(uint64_t)> on_bytes;
        if (per_chunk) {
            on_bytes = [&](uint64_t written) {
                // A retry starts the file over; never report going backwards
                uint64_t now = bytes_done + written;
                if (now > high_water) {
                    high_water = now;
                    publish(job, unit.display_name, i + 1, files_total, now, bytes_total, started);
                }
            };
        }

        UnitResult r = transfer_unit(job, unit, on_bytes);
        if (!r.ok) {
            if (!handle_failure(job, unit, r.error, report, outcome)) {
                return;
            }
            continue;
        }

        bytes_done += r.bytes;
        report.copied.push_back(unit);
        report.bytes_copied += r.bytes;
        store.update(job.id, [&](JobCounters& c) {
            c.files_done += 1;
            c.bytes_done += r.bytes;
        });
        if (!per_chunk) {
            publish(job, unit.display_name, i + 1, files_total, bytes_done, bytes_total, started);
        }
    }
}

void JobRunner::run_parallel(const Job& job, const std::vector<TransferUnit>& units,
                             RunReport& report, JobOutcome& outcome,
                             Clock::time_point started) {
    JobStore& store = ctx_.store(job.kind);
    const uint64_t files_total = job.counters.files_total;
    const uint64_t bytes_total = job.counters.bytes_total;

    std::atomic<std::size_t> next{0};
    std::atomic<bool> abort{false};

    // Guards report, outcome and the counters below so that store updates
    // and progress events for this job stay in order.
    std::mutex mutex;
    uint64_t bytes_done = 0;
    uint64_t settled = 0;

    auto lane = [&]() {
        while (!abort.load() && !shutdown_.load()) {
            std::size_t i = next.fetch_add(1);
            if (i >= units.size()) break;
            const TransferUnit& unit = units[i];

            UnitResult r;
            try {
                r = transfer_unit(job, unit, nullptr);
            } catch (const std::exception& e) {
                r.ok = false;
                r.error = e.what();
            }

            std::lock_guard<std::mutex> lock(mutex);
            ++settled;
            if (!r.ok) {
                if (!handle_failure(job, unit, r.error, report, outcome)) {
                    abort.store(true);
                }
                continue;
            }
            bytes_done += r.bytes;
            report.copied.push_back(unit);
            report.bytes_copied += r.bytes;
            store.update(job.id, [&](JobCounters& c) {
                c.files_done += 1;
                c.bytes_done += r.bytes;
            });
            publish(job, unit.display_name, settled, files_total, bytes_done, bytes_total, started);
        }
    };

    // The limiter bounds the copies; more lanes than permits would only wait.
    std::size_t lanes = std::min<std::size_t>(
        units.size(), static_cast<std::size_t>(std::max(1, ctx_.limiter().capacity())));

    std::vector<std::thread> threads;
    threads.reserve(lanes);
    for (std::size_t t = 0; t < lanes; ++t) {
        threads.emplace_back(lane);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (outcome.status == JobStatus::Completed && settled < units.size() && shutdown_.load()) {
        outcome = JobOutcome{JobStatus::Failed, std::string(SHUTDOWN_ERROR)};
    }
}

JobRunner::UnitResult JobRunner::transfer_unit(const Job& job, const TransferUnit& unit,
                                               const std::function<void(uint64_t)>& on_bytes) {
    auto permit = ctx_.limiter().acquire();

    auto attempt = [&](int) -> Result<uint64_t> {
        uint64_t written = 0;
        auto copied = ctx_.engine().copy(unit.source, unit.dest, [&](uint64_t chunk) {
            written += chunk;
            if (on_bytes) on_bytes(written);
        });
        if (copied.is_err()) {
            return copied;
        }

        auto same = ctx_.verifier().verify(unit.source, unit.dest);
        if (same.is_err()) {
            return Result<uint64_t>::Err(same);
        }
        if (!same.value) {
            return Result<uint64_t>::Err(ErrorKind::IntegrityMismatch,
                fmt::format("Checksum mismatch for {}", unit.display_name));
        }
        return copied;
    };

    auto result = ctx_.retry().run_with_retry(
        attempt,
        [&] { remove_partial(unit.dest); },
        fmt::format("{} {}", job.id, unit.display_name));

    UnitResult out;
    if (result.is_ok()) {
        out.ok = true;
        out.bytes = result.value;
    } else {
        remove_partial(unit.dest);
        out.error = result.error;
    }
    return out;
}

bool JobRunner::handle_failure(const Job& job, const TransferUnit& unit, const std::string& error,
                               RunReport& report, JobOutcome& outcome) {
    std::string message = fmt::format("{}: {}", unit.display_name, error);
    ctx_.progress().emit_error(job.id, message);

    if (policy_for(job.kind).on_unit_failure() == FailureAction::Skip) {
        JobStore& store = ctx_.store(job.kind);
        store.record_skipped(job.id, unit.display_name);
        store.update(job.id, [](JobCounters& c) { c.files_skipped += 1; });
        report.skipped.push_back(unit);
        append_job_log(job.id, "skipped " + message);
        return true;
    }

    outcome = JobOutcome{JobStatus::Failed, message};
    append_job_log(job.id, "aborting on " + message);
    return false;
}

void JobRunner::publish(const Job& job, const std::string& file_name, uint64_t file_index,
                        uint64_t files_total, uint64_t bytes_done, uint64_t bytes_total,
                        Clock::time_point started) {
    // A source that grew after enumeration must not push past the frozen total
    bytes_done = std::min(bytes_done, bytes_total);
    double elapsed = std::chrono::duration<double>(Clock::now() - started).count();
    ProgressSample sample = compute_sample(bytes_done, bytes_total, elapsed);

    ProgressEvent ev;
    ev.job_id = job.id;
    ev.kind = job.kind;
    ev.current_file_name = file_name;
    ev.current_file_index = file_index;
    ev.files_total = files_total;
    ev.bytes_done = bytes_done;
    ev.bytes_total = bytes_total;
    ev.speed_bytes_per_sec = sample.speed_bytes_per_sec;
    ev.eta_seconds = sample.eta_seconds;
    ctx_.progress().emit(ev);
}

void JobRunner::settle(const Job& job, RunReport& report, JobOutcome outcome) {
    JobStore& store = ctx_.store(job.kind);
    JobPolicy& policy = policy_for(job.kind);

    if (outcome.status == JobStatus::Completed) {
        auto current = store.get(job.id);
        auto finalized = policy.finalize(current.is_ok() ? current.value : job, report);
        if (finalized.is_err()) {
            outcome = JobOutcome{JobStatus::Failed, finalized.error};
            ctx_.progress().emit_error(job.id, finalized.error);
            append_job_log(job.id, "finalization failed: " + finalized.error);
        }
        if (report.manifest_path) {
            store.set_manifest_path(job.id, *report.manifest_path);
        }
    }

    auto finished = store.finish(job.id, outcome);
    if (finished.is_err()) {
        haul_log(fmt::format("runner: finish {} failed: {}", job.id, finished.error));
    }

    auto final_job = store.get(job.id);
    if (final_job.is_err()) {
        return;
    }
    const Job& done = final_job.value;
    append_job_log(job.id, fmt::format("{}: {} copied, {} skipped, {} bytes{}",
                   job_status_name(done.status), done.counters.files_done,
                   done.counters.files_skipped, report.bytes_copied,
                   done.error ? " (" + *done.error + ")" : ""));
    policy.on_finished(done, report);
}
