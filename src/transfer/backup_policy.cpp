#include "kind_policies.hpp"
#include <history/history_log.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

std::string join_sources(const std::vector<std::string>& sources) {
    std::string out;
    for (const auto& s : sources) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

Result<std::vector<TransferUnit>> BackupPolicy::enumerate(const Job& job) const {
    std::vector<TransferUnit> units;
    fs::path dest(job.destination);

    for (const auto& src : job.sources) {
        fs::path root(src);
        std::error_code ec;
        fs::path target = fs::is_directory(root, ec) ? dest / folder_name(root) : dest;

        auto added = add_tree_units(root, target, units);
        if (added.is_err()) {
            return Result<std::vector<TransferUnit>>::Err(added);
        }
    }
    return Result<std::vector<TransferUnit>>::Ok(units);
}

void BackupPolicy::on_finished(const Job& job, const RunReport& report) {
    HistoryRecord r;
    r.id = job.id;
    r.kind = "backup";
    r.project_id = job.project_id;
    r.project_name = job.project_name;
    r.source_path = join_sources(job.sources);
    r.destination_name = folder_name(job.destination).string();
    r.destination_path = job.destination;
    r.files_copied = job.counters.files_done;
    r.files_skipped = job.counters.files_skipped;
    r.total_bytes = report.bytes_copied;
    r.started_at = job.started_at;
    r.completed_at = job.completed_at;
    r.status = job_status_name(job.status);
    r.error_message = job.error;

    auto saved = history_.append(r);
    if (saved.is_err()) {
        haul_log(fmt::format("[backup] {}: history not saved: {}", job.id, saved.error));
    }
}
