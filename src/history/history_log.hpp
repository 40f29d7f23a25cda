#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Terminal snapshot of one finished job. Immutable once written.
struct HistoryRecord {
    std::string id;                 // job id
    std::string kind;               // "backup" or "import"
    std::string project_id;
    std::string project_name;
    std::string source_path;        // sources joined with ", "
    std::string destination_name;   // last component of destination_path
    std::string destination_path;
    uint64_t files_copied = 0;
    uint64_t files_skipped = 0;
    uint64_t total_bytes = 0;

    // Import only
    uint64_t photos_copied = 0;
    uint64_t videos_copied = 0;

    std::string started_at;         // ISO timestamp
    std::string completed_at;       // ISO timestamp
    std::string status;             // backup: completed|failed, import: success|partial|failed
    std::optional<std::string> error_message;
};

// Capped, most-recent-first list of HistoryRecords kept as a single YAML
// document. A missing or corrupted file reads as an empty history.
class HistoryLog {
public:
    HistoryLog(const fs::path& path, int max_entries);

    // Prepends the record and prunes the oldest entries beyond the cap.
    Result<void> append(const HistoryRecord& record);

    std::vector<HistoryRecord> list() const;
    std::vector<HistoryRecord> list_for_project(const std::string& project_id) const;

    const fs::path& path() const { return path_; }
    int max_entries() const { return max_entries_; }

private:
    std::vector<HistoryRecord> load() const;
    Result<void> save(const std::vector<HistoryRecord>& records) const;

    fs::path path_;
    int max_entries_;
    mutable std::mutex mutex_;
};
