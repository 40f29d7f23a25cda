#include "job_policy.hpp"
#include "source_scan.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <set>

namespace {

const std::set<std::string>& photo_extensions() {
    static const std::set<std::string> exts = {
        "jpg", "jpeg", "png", "gif", "bmp", "tiff", "tif", "raw", "cr2", "nef",
        "arw", "dng", "orf", "rw2", "pef", "srw", "heic", "heif", "webp",
    };
    return exts;
}

const std::set<std::string>& video_extensions() {
    static const std::set<std::string> exts = {
        "mp4", "mov", "avi", "mkv", "wmv", "flv", "webm", "m4v", "mpg", "mpeg",
        "3gp", "mts", "m2ts",
    };
    return exts;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

fs::path resolved(const fs::path& p) {
    std::error_code ec;
    fs::path out = fs::weakly_canonical(p, ec);
    if (ec) {
        out = fs::absolute(p, ec).lexically_normal();
    }
    if (out.filename().empty()) {
        out = out.parent_path();
    }
    return out;
}

} // namespace

MediaCategory classify_media(const fs::path& path) {
    std::string ext = path.extension().string();
    if (ext.empty()) return MediaCategory::Other;
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (photo_extensions().count(ext)) return MediaCategory::Photo;
    if (video_extensions().count(ext)) return MediaCategory::Video;
    return MediaCategory::Other;
}

Result<void> JobPolicy::validate(const JobRequest&) const {
    return Result<void>::Ok();
}

Result<void> JobPolicy::finalize(const Job&, RunReport&) {
    return Result<void>::Ok();
}

void JobPolicy::on_finished(const Job&, const RunReport&) {}

Result<void> add_tree_units(const fs::path& root, const fs::path& dest_root,
                            std::vector<TransferUnit>& out) {
    auto files = collect_files(root);
    if (files.is_err()) {
        return Result<void>::Err(files);
    }

    std::error_code ec;
    bool single_file = fs::is_regular_file(root, ec);

    for (const auto& f : files.value) {
        fs::path rel = single_file ? f.filename() : f.lexically_relative(root);

        TransferUnit u;
        u.source = f;
        u.dest = dest_root / rel;
        u.display_name = rel.generic_string();
        u.category = classify_media(f);

        std::error_code sec;
        u.size = fs::file_size(f, sec);
        if (sec) {
            return Result<void>::Err(ErrorKind::IoFailure,
                fmt::format("Cannot stat {}: {}", f.string(), sec.message()));
        }
        out.push_back(std::move(u));
    }
    return Result<void>::Ok();
}

fs::path folder_name(const fs::path& dir) {
    fs::path norm = dir.lexically_normal();
    if (norm.filename().empty()) {
        norm = norm.parent_path();
    }
    return norm.filename();
}

bool is_within(const fs::path& path, const fs::path& root) {
    fs::path rel = resolved(path).lexically_relative(resolved(root));
    return !rel.empty() && *rel.begin() != "..";
}

bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::string apply_naming_template(const std::string& tmpl,
                                  const std::string& original_name,
                                  std::size_t index) {
    fs::path p(original_name);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();
    if (!ext.empty()) ext.erase(0, 1);

    std::string out = tmpl;
    replace_all(out, "{index}", fmt::format("{:03}", index + 1));
    replace_all(out, "{name}", stem);
    replace_all(out, "{ext}", ext);
    return out;
}
