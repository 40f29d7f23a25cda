#pragma once

#include <gtest/gtest.h>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <history/project_registry.hpp>
#include <transfer/progress_reporter.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <map>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

// Fixture owning a fresh scratch directory per test. Logs are pointed
// inside it so tests never write to the user's home.
class ScratchTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("haul_test_" + generate_uuid());
        fs::create_directories(test_dir);
        set_haul_log_path(test_dir / "debug.log");
        set_job_log_dir(test_dir / "logs");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    fs::path write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
        return full;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// Keeps everything it is sent.
class RecordingSink : public ProgressSink {
public:
    void emit(const ProgressEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void emit_error(const std::string& job_id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.emplace_back(job_id, message);
    }

    std::vector<ProgressEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<ProgressEvent> events_for(const std::string& job_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProgressEvent> out;
        for (const auto& e : events_) {
            if (e.job_id == job_id) out.push_back(e);
        }
        return out;
    }

    std::vector<std::pair<std::string, std::string>> errors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

private:
    std::mutex mutex_;
    std::vector<ProgressEvent> events_;
    std::vector<std::pair<std::string, std::string>> errors_;
};

class MemoryProjectRegistry : public ProjectRegistry {
public:
    Result<void> set_status(const std::string& project_id, const std::string& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[project_id] = status;
        return Result<void>::Ok();
    }

    std::optional<std::string> status(const std::string& project_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = statuses_.find(project_id);
        if (it == statuses_.end()) return std::nullopt;
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> statuses_;
};
