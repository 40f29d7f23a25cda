#include "kind_policies.hpp"
#include <history/project_registry.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

namespace {

// <destination>/<project name>, or the source folder's own name when the
// job has no project.
fs::path archive_target(const fs::path& source, const std::string& destination,
                        const std::string& project_name) {
    fs::path name = project_name.empty() ? folder_name(source) : fs::path(project_name);
    return fs::path(destination) / name;
}

} // namespace

Result<void> ArchivePolicy::validate(const JobRequest& request) const {
    if (request.options.compress) {
        return Result<void>::Err(ErrorKind::Unimplemented,
            "Compressed archives are not supported");
    }
    if (request.sources.size() != 1) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            "Archive takes exactly one source folder");
    }
    fs::path source(request.sources.front());
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            "Archive source is not a folder: " + source.string());
    }
    if (!request.project_name.empty() && !is_plain_file_name(request.project_name)) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            "Project name cannot be used as a folder name: " + request.project_name);
    }

    // The source is deleted after the copy, so the copy must not live in it
    // and must not contain it.
    fs::path target = archive_target(source, request.destination, request.project_name);
    if (is_within(target, source) || is_within(source, target)) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("Archive destination {} overlaps the source folder {}",
                        target.string(), source.string()));
    }
    return Result<void>::Ok();
}

Result<std::vector<TransferUnit>> ArchivePolicy::enumerate(const Job& job) const {
    fs::path root(job.sources.front());

    std::vector<TransferUnit> units;
    auto added = add_tree_units(root, archive_target(root, job.destination, job.project_name), units);
    if (added.is_err()) {
        return Result<std::vector<TransferUnit>>::Err(added);
    }
    return Result<std::vector<TransferUnit>>::Ok(units);
}

Result<void> ArchivePolicy::finalize(const Job& job, RunReport&) {
    fs::path root(job.sources.front());

    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IoFailure,
            fmt::format("Archived copy is complete but {} could not be removed: {}",
                        root.string(), ec.message()));
    }
    haul_log(fmt::format("[archive] {}: removed source {}", job.id, root.string()));

    if (job.project_id.empty()) {
        return Result<void>::Ok();
    }
    auto marked = projects_.set_status(job.project_id, "Archived");
    if (marked.is_err()) {
        return Result<void>::Err(marked.kind,
            fmt::format("Files archived but project {} not updated: {}",
                        job.project_id, marked.error));
    }
    return Result<void>::Ok();
}
