#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

// Accepts a full id or a unique prefix of one (as shown by 'jobs').
static std::optional<std::string> resolve_id(BaseCLI& cli, const std::string& arg) {
    std::optional<std::string> match;
    for (JobKind kind : {JobKind::Backup, JobKind::Delivery, JobKind::Archive, JobKind::Import}) {
        for (const auto& job : cli.runner->list_jobs(kind)) {
            if (job.id == arg) return job.id;
            if (job.id.compare(0, arg.size(), arg) == 0) {
                if (match) {
                    std::cout << theme::fail("Ambiguous job id: " + arg);
                    return std::nullopt;
                }
                match = job.id;
            }
        }
    }
    if (!match) {
        // Let the runner report NotFound
        return arg;
    }
    return match;
}

static void print_job_row(const Job& job) {
    std::cout << fmt::format("  {:<10} {:<9} {:<21} {:>5}/{:<5} {:>5} {:>10}  {:<6} {}\n",
                             short_id(job.id), job_kind_name(job.kind),
                             theme::status_word(job_status_name(job.status)),
                             job.counters.files_done, job.counters.files_total,
                             job.counters.files_skipped,
                             format_bytes(job.counters.bytes_done),
                             format_timestamp(job.started_at),
                             format_duration(job.started_at, job.completed_at));
}

// ── Commands ─────────────────────────────────────────────────

static void do_submit(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;

    auto words = StringUtils::split_args(arg);
    if (words.size() < 3) {
        std::cout << theme::fail("Usage: submit <backup|delivery|archive|import> <dest> <src...>");
        std::cout << theme::step("Options: --template T  --compress  --project ID:NAME  --start");
        return;
    }

    auto kind = parse_job_kind(words[0]);
    if (!kind) {
        std::cout << theme::fail("Unknown job kind: " + words[0]);
        return;
    }

    JobRequest req;
    req.kind = *kind;
    req.destination = words[1];
    bool start_now = false;

    for (std::size_t i = 2; i < words.size(); ++i) {
        const std::string& w = words[i];
        if (w == "--template" && i + 1 < words.size()) {
            req.options.naming_template = words[++i];
        } else if (w == "--compress") {
            req.options.compress = true;
        } else if (w == "--project" && i + 1 < words.size()) {
            auto parts = StringUtils::split(words[++i], ':');
            req.project_id = parts[0];
            req.project_name = parts.size() > 1 ? parts[1] : parts[0];
        } else if (w == "--start") {
            start_now = true;
        } else if (w.rfind("--", 0) == 0) {
            std::cout << theme::fail("Unknown option: " + w);
            return;
        } else {
            req.sources.push_back(w);
        }
    }

    auto job = cli.runner->submit_job(req);
    if (job.is_err()) {
        std::cout << theme::fail(fmt::format("{} ({})", job.error, error_kind_name(job.kind)));
        return;
    }
    std::cout << theme::ok(fmt::format("Submitted {} job {} ({} files, {})",
                                       job_kind_name(req.kind), job.value.id,
                                       job.value.counters.files_total,
                                       format_bytes(job.value.counters.bytes_total)));

    if (start_now) {
        auto started = cli.runner->start_job(job.value.id);
        if (started.is_err()) {
            std::cout << theme::fail(started.error);
        } else {
            std::cout << theme::step("Started " + short_id(job.value.id));
        }
    }
}

static void do_start(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: start <job-id>");
        return;
    }
    auto id = resolve_id(cli, arg);
    if (!id) return;

    auto result = cli.runner->start_job(*id);
    if (result.is_ok()) {
        std::cout << theme::ok("Started " + short_id(*id));
    } else {
        std::cout << theme::fail(fmt::format("Failed to start: {}", result.error));
    }
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: cancel <job-id>");
        return;
    }
    auto id = resolve_id(cli, arg);
    if (!id) return;

    auto result = cli.runner->cancel_job(*id);
    if (result.is_ok()) {
        std::cout << theme::ok(fmt::format("Cancelled job {}", short_id(*id)));
    } else {
        std::cout << theme::fail(fmt::format("Failed to cancel: {}", result.error));
        if (result.kind == ErrorKind::InvalidState) {
            std::cout << theme::step("Only pending jobs can be cancelled.");
        }
    }
}

static void do_remove(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: remove <job-id>");
        return;
    }
    auto id = resolve_id(cli, arg);
    if (!id) return;

    auto result = cli.runner->remove_job(*id);
    if (result.is_ok()) {
        std::cout << theme::ok(fmt::format("Removed {}", short_id(*id)));
    } else {
        std::cout << theme::fail(result.error);
    }
}

static void do_jobs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;

    std::vector<JobKind> kinds = {JobKind::Backup, JobKind::Delivery, JobKind::Archive, JobKind::Import};
    if (!arg.empty()) {
        auto kind = parse_job_kind(arg);
        if (!kind) {
            std::cout << theme::fail("Unknown job kind: " + arg);
            return;
        }
        kinds = {*kind};
    }

    bool any = false;
    for (JobKind kind : kinds) {
        auto jobs = cli.runner->list_jobs(kind);
        if (jobs.empty()) continue;
        if (!any) {
            std::cout << "\n" << theme::color::DIM
                      << fmt::format("  {:<10} {:<9} {:<12} {:>11} {:>5} {:>10}  {:<6} {}",
                                     "ID", "KIND", "STATUS", "FILES", "SKIP", "COPIED", "START", "TIME")
                      << theme::color::RESET << "\n";
            any = true;
        }
        for (const auto& job : jobs) {
            print_job_row(job);
        }
    }

    if (!any) {
        std::cout << theme::dim("  No jobs found.") << "\n";
    } else {
        std::cout << "\n";
    }
}

static void do_show(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: show <job-id>");
        return;
    }
    auto id = resolve_id(cli, arg);
    if (!id) return;

    auto result = cli.runner->get_job(*id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    const Job& job = result.value;

    std::cout << theme::section(fmt::format("{} job {}", job_kind_name(job.kind), job.id));
    std::cout << theme::kv("Status", theme::status_word(job_status_name(job.status)));
    if (!job.project_id.empty()) {
        std::cout << theme::kv("Project", fmt::format("{} ({})", job.project_name, job.project_id));
    }
    for (const auto& src : job.sources) {
        std::cout << theme::kv("Source", src);
    }
    std::cout << theme::kv("Destination", job.destination);
    std::cout << theme::kv("Files", fmt::format("{} of {} copied, {} skipped",
                           job.counters.files_done, job.counters.files_total,
                           job.counters.files_skipped));
    std::cout << theme::kv("Bytes", fmt::format("{} of {}", format_bytes(job.counters.bytes_done),
                           format_bytes(job.counters.bytes_total)));
    std::cout << theme::kv("Created", job.created_at);
    if (!job.started_at.empty()) {
        std::cout << theme::kv("Duration", format_duration(job.started_at, job.completed_at));
    }
    if (job.manifest_path) {
        std::cout << theme::kv("Manifest", *job.manifest_path);
    }
    if (job.error) {
        std::cout << theme::kv("Error", theme::red(*job.error));
    }
    std::cout << theme::kv("Log", job_log_path(job.id));
    for (const auto& name : job.skipped_files) {
        std::cout << theme::warn("skipped " + name);
    }
    std::cout << "\n";
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("submit", do_submit, "Queue a backup, delivery, archive or import job");
    cli.add_command("start", do_start, "Start a pending job");
    cli.add_command("cancel", do_cancel, "Cancel a pending job");
    cli.add_command("remove", do_remove, "Forget a finished job");
    cli.add_command("jobs", do_jobs, "List jobs, optionally of one kind");
    cli.add_command("show", do_show, "Show one job in detail");
}
