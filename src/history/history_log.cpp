#include "history_log.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

HistoryLog::HistoryLog(const fs::path& path, int max_entries)
    : path_(path), max_entries_(max_entries > 0 ? max_entries : 1) {}

Result<void> HistoryLog::append(const HistoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto records = load();
    records.insert(records.begin(), record);
    if (records.size() > static_cast<std::size_t>(max_entries_)) {
        records.resize(max_entries_);
    }
    return save(records);
}

std::vector<HistoryRecord> HistoryLog::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load();
}

std::vector<HistoryRecord> HistoryLog::list_for_project(const std::string& project_id) const {
    std::vector<HistoryRecord> out;
    for (auto& r : list()) {
        if (r.project_id == project_id) {
            out.push_back(std::move(r));
        }
    }
    return out;
}

std::vector<HistoryRecord> HistoryLog::load() const {
    std::vector<HistoryRecord> records;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return records;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (!root["entries"] || !root["entries"].IsSequence()) {
            return records;
        }

        for (const auto& n : root["entries"]) {
            HistoryRecord r;
            r.id = n["id"].as<std::string>("");
            r.kind = n["kind"].as<std::string>("");
            r.project_id = n["project_id"].as<std::string>("");
            r.project_name = n["project_name"].as<std::string>("");
            r.source_path = n["source_path"].as<std::string>("");
            r.destination_name = n["destination_name"].as<std::string>("");
            r.destination_path = n["destination_path"].as<std::string>("");
            r.files_copied = n["files_copied"].as<uint64_t>(0);
            r.files_skipped = n["files_skipped"].as<uint64_t>(0);
            r.total_bytes = n["total_bytes"].as<uint64_t>(0);
            r.photos_copied = n["photos_copied"].as<uint64_t>(0);
            r.videos_copied = n["videos_copied"].as<uint64_t>(0);
            r.started_at = n["started_at"].as<std::string>("");
            r.completed_at = n["completed_at"].as<std::string>("");
            r.status = n["status"].as<std::string>("");
            if (n["error_message"] && !n["error_message"].IsNull()) {
                r.error_message = n["error_message"].as<std::string>("");
            }
            records.push_back(r);
        }
    } catch (const std::exception& e) {
        // Corrupted history file, start fresh
        haul_log(fmt::format("history: ignoring unreadable {}: {}", path_.string(), e.what()));
        return {};
    }

    return records;
}

Result<void> HistoryLog::save(const std::vector<HistoryRecord>& records) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot create {}: {}", path_.parent_path().string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : records) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << r.id;
        out << YAML::Key << "kind" << YAML::Value << r.kind;
        out << YAML::Key << "project_id" << YAML::Value << r.project_id;
        out << YAML::Key << "project_name" << YAML::Value << r.project_name;
        out << YAML::Key << "source_path" << YAML::Value << r.source_path;
        out << YAML::Key << "destination_name" << YAML::Value << r.destination_name;
        out << YAML::Key << "destination_path" << YAML::Value << r.destination_path;
        out << YAML::Key << "files_copied" << YAML::Value << r.files_copied;
        out << YAML::Key << "files_skipped" << YAML::Value << r.files_skipped;
        out << YAML::Key << "total_bytes" << YAML::Value << r.total_bytes;
        if (r.kind == "import") {
            out << YAML::Key << "photos_copied" << YAML::Value << r.photos_copied;
            out << YAML::Key << "videos_copied" << YAML::Value << r.videos_copied;
        }
        out << YAML::Key << "started_at" << YAML::Value << r.started_at;
        out << YAML::Key << "completed_at" << YAML::Value << r.completed_at;
        out << YAML::Key << "status" << YAML::Value << r.status;
        if (r.error_message) {
            out << YAML::Key << "error_message" << YAML::Value << *r.error_message;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    // Write beside the target and rename so a crash never leaves half a document
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorKind::IoFailure, "Cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        if (!fout.flush()) {
            return Result<void>::Err(ErrorKind::IoFailure, "Cannot write " + tmp.string());
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot replace {}: {}", path_.string(), ec.message()));
    }
    return Result<void>::Ok();
}
