#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include "job.hpp"

namespace fs = std::filesystem;

enum class MediaCategory {
    Other,
    Photo,
    Video,
};

// Classifies by extension (case-insensitive).
MediaCategory classify_media(const fs::path& path);

// One file of a job: where it comes from, where it goes, how big it is.
struct TransferUnit {
    fs::path source;
    fs::path dest;
    uint64_t size = 0;
    std::string display_name;   // shown in progress events and logs
    MediaCategory category = MediaCategory::Other;
};

// What a run produced, handed to the policy's finalization hooks.
struct RunReport {
    std::vector<TransferUnit> copied;       // completion order
    std::vector<TransferUnit> skipped;
    uint64_t bytes_copied = 0;
    std::optional<std::string> manifest_path;
};

enum class FailureAction {
    Skip,   // record the file as skipped and carry on
    Abort,  // fail the whole job with the file's error
};

// Everything that differs between job kinds. The runner owns the copy,
// verify, retry and progress loop; a policy only says which files to move,
// what a failed file means, and what to do once the files are in place.
class JobPolicy {
public:
    virtual ~JobPolicy() = default;

    virtual JobKind kind() const = 0;

    // Kind-specific checks at submit time, before anything is enumerated.
    virtual Result<void> validate(const JobRequest& request) const;

    // Resolve every source file to its destination. Runs before start, so
    // its totals become the job's frozen totals.
    virtual Result<std::vector<TransferUnit>> enumerate(const Job& job) const = 0;

    virtual FailureAction on_unit_failure() const = 0;

    // True when files of one job may be copied concurrently.
    virtual bool parallel() const { return false; }

    // Runs only when every unit succeeded or was skipped. An error here
    // fails the job.
    virtual Result<void> finalize(const Job& job, RunReport& report);

    // Runs after the job reached its terminal status through the runner.
    virtual void on_finished(const Job& job, const RunReport& report);
};

// Mirror a file or directory tree under dest_root. A directory keeps its
// relative layout; a single file lands directly in dest_root.
Result<void> add_tree_units(const fs::path& root, const fs::path& dest_root,
                            std::vector<TransferUnit>& out);

// Last path component, ignoring a trailing separator ("a/b/" -> "b").
fs::path folder_name(const fs::path& dir);

// True when path is root itself or lies somewhere beneath it. Both sides
// are resolved with weakly_canonical, so symlinks and ".." are followed and
// neither path has to exist.
bool is_within(const fs::path& path, const fs::path& root);

// A single path component that stays inside its folder: not empty, not
// "." or "..", and free of separators.
bool is_plain_file_name(const std::string& name);

// "{index}_{name}.{ext}" style names. index is 0-based here and rendered
// 1-based, zero-padded to three digits; name is the stem, ext the extension
// without its dot.
std::string apply_naming_template(const std::string& tmpl,
                                  const std::string& original_name,
                                  std::size_t index);
