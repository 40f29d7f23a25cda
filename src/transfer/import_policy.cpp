#include "kind_policies.hpp"
#include <history/history_log.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <set>

namespace {

// Cards number each DCIM folder from scratch, so two files can flatten to the
// same name. Later ones get _1, _2, ... before the extension.
fs::path unique_dest(const fs::path& folder, const fs::path& file_name,
                     std::set<std::string>& taken) {
    fs::path candidate = folder / file_name;
    for (int n = 1; !taken.insert(candidate.string()).second; ++n) {
        candidate = folder / fmt::format("{}_{}{}", file_name.stem().string(), n,
                                         file_name.extension().string());
    }
    return candidate;
}

} // namespace

Result<std::vector<TransferUnit>> ImportPolicy::enumerate(const Job& job) const {
    std::vector<TransferUnit> found;
    for (const auto& src : job.sources) {
        // Destination is fixed up below; only the files matter here
        auto added = add_tree_units(src, fs::path(), found);
        if (added.is_err()) {
            return Result<std::vector<TransferUnit>>::Err(added);
        }
    }

    fs::path dest(job.destination);
    std::set<std::string> taken;
    for (auto& u : found) {
        std::string file_name = u.source.filename().string();
        fs::path folder;
        switch (u.category) {
            case MediaCategory::Photo: folder = dest / "Photos"; break;
            case MediaCategory::Video: folder = dest / "Videos"; break;
            case MediaCategory::Other: folder = dest; break;
        }
        u.dest = unique_dest(folder, u.source.filename(), taken);
        u.display_name = file_name;
    }
    return Result<std::vector<TransferUnit>>::Ok(found);
}

void ImportPolicy::on_finished(const Job& job, const RunReport& report) {
    HistoryRecord r;
    r.id = job.id;
    r.kind = "import";
    r.project_id = job.project_id;
    r.project_name = job.project_name;
    r.source_path = join_sources(job.sources);
    r.destination_name = folder_name(job.destination).string();
    r.destination_path = job.destination;
    r.files_copied = job.counters.files_done;
    r.files_skipped = job.counters.files_skipped;
    r.total_bytes = report.bytes_copied;
    for (const auto& u : report.copied) {
        if (u.category == MediaCategory::Photo) ++r.photos_copied;
        if (u.category == MediaCategory::Video) ++r.videos_copied;
    }
    r.started_at = job.started_at;
    r.completed_at = job.completed_at;
    r.error_message = job.error;

    if (job.status != JobStatus::Completed || r.files_copied == 0) {
        r.status = "failed";
    } else if (r.files_skipped > 0) {
        r.status = "partial";
    } else {
        r.status = "success";
    }

    auto saved = history_.append(r);
    if (saved.is_err()) {
        haul_log(fmt::format("[import] {}: history not saved: {}", job.id, saved.error));
    }
}
