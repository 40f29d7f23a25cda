#include "kind_policies.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

namespace {

// Name the i-th delivered file gets inside the destination folder. Names that
// would leave the folder or clobber the manifest are refused.
Result<std::string> delivered_name(const JobOptions& options, const std::string& file_name,
                                   std::size_t index) {
    std::string name = options.naming_template
        ? apply_naming_template(*options.naming_template, file_name, index)
        : file_name;
    if (!is_plain_file_name(name) || name == DELIVERY_MANIFEST) {
        return Result<std::string>::Err(ErrorKind::InvalidInput,
            fmt::format("Template gives an unusable name for {}: '{}'", file_name, name));
    }
    return Result<std::string>::Ok(name);
}

} // namespace

Result<void> DeliveryPolicy::validate(const JobRequest& request) const {
    for (std::size_t i = 0; i < request.sources.size(); ++i) {
        const auto& src = request.sources[i];
        std::error_code ec;
        if (!fs::is_regular_file(src, ec)) {
            return Result<void>::Err(ErrorKind::InvalidInput,
                "Delivery sources must be files: " + src);
        }
        auto name = delivered_name(request.options, fs::path(src).filename().string(), i);
        if (name.is_err()) {
            return Result<void>::Err(name);
        }
    }
    return Result<void>::Ok();
}

Result<std::vector<TransferUnit>> DeliveryPolicy::enumerate(const Job& job) const {
    std::vector<TransferUnit> units;
    fs::path dest(job.destination);

    for (std::size_t i = 0; i < job.sources.size(); ++i) {
        fs::path src(job.sources[i]);
        std::string file_name = src.filename().string();
        auto dest_name = delivered_name(job.options, file_name, i);
        if (dest_name.is_err()) {
            return Result<std::vector<TransferUnit>>::Err(dest_name);
        }

        std::error_code ec;
        uint64_t size = fs::file_size(src, ec);
        if (ec) {
            return Result<std::vector<TransferUnit>>::Err(ErrorKind::InvalidInput,
                fmt::format("Cannot stat {}: {}", src.string(), ec.message()));
        }

        TransferUnit u;
        u.source = src;
        u.dest = dest / dest_name.value;
        u.size = size;
        u.display_name = file_name;
        u.category = classify_media(src);
        units.push_back(std::move(u));
    }
    return Result<std::vector<TransferUnit>>::Ok(units);
}

Result<void> DeliveryPolicy::finalize(const Job& job, RunReport& report) {
    fs::path manifest = fs::path(job.destination) / DELIVERY_MANIFEST;

    std::string body = fmt::format(
        "Delivery Manifest\n"
        "Project: {}\n"
        "Date: {}\n"
        "Total Files: {}\n"
        "Total Size: {} bytes\n"
        "\n"
        "Files:\n",
        job.project_name, now_iso(), job.counters.files_total, job.counters.bytes_total);
    for (const auto& u : report.copied) {
        body += fmt::format("{} -> {} ({})\n",
                            u.display_name, u.dest.filename().string(), u.size);
    }

    std::error_code ec;
    fs::create_directories(manifest.parent_path(), ec);
    std::ofstream out(manifest.string(), std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailure,
            "Cannot write manifest " + manifest.string());
    }
    out << body;
    if (!out.flush()) {
        return Result<void>::Err(ErrorKind::IoFailure,
            "Cannot write manifest " + manifest.string());
    }

    report.manifest_path = manifest.string();
    haul_log(fmt::format("[delivery] {}: manifest {}", job.id, manifest.string()));
    return Result<void>::Ok();
}
