#include "source_scan.hpp"
#include <fmt/format.h>
#include <algorithm>

Result<std::vector<fs::path>> collect_files(const fs::path& root) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        return Result<std::vector<fs::path>>::Err(ErrorKind::InvalidInput,
            fmt::format("Source not found: {}", root.string()));
    }

    std::vector<fs::path> files;
    if (fs::is_regular_file(st)) {
        files.push_back(root);
        return Result<std::vector<fs::path>>::Ok(files);
    }
    if (!fs::is_directory(st)) {
        return Result<std::vector<fs::path>>::Err(ErrorKind::InvalidInput,
            fmt::format("Source is neither a file nor a directory: {}", root.string()));
    }

    fs::recursive_directory_iterator it(root, ec), end;
    if (ec) {
        return Result<std::vector<fs::path>>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot read {}: {}", root.string(), ec.message()));
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Result<std::vector<fs::path>>::Err(ErrorKind::IoFailure,
                fmt::format("Cannot read {}: {}", root.string(), ec.message()));
        }
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Result<std::vector<fs::path>>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot read {}: {}", root.string(), ec.message()));
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<fs::path>>::Ok(files);
}

Result<JobTotals> count_sources(const std::vector<std::string>& sources) {
    if (sources.empty()) {
        return Result<JobTotals>::Err(ErrorKind::InvalidInput, "No sources given");
    }

    JobTotals totals;
    for (const auto& src : sources) {
        auto files = collect_files(src);
        if (files.is_err()) {
            return Result<JobTotals>::Err(files);
        }
        for (const auto& f : files.value) {
            std::error_code ec;
            auto size = fs::file_size(f, ec);
            // Unreadable sizes count as zero; the copy itself will surface the error
            if (!ec) totals.bytes += size;
            ++totals.files;
        }
    }
    return Result<JobTotals>::Ok(totals);
}
