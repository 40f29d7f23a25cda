#pragma once

#include <string>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Project metadata lives outside the engine. Archive jobs only need to
// flip a project's status once its files have moved.
class ProjectRegistry {
public:
    virtual ~ProjectRegistry() = default;
    virtual Result<void> set_status(const std::string& project_id, const std::string& status) = 0;
    virtual std::optional<std::string> status(const std::string& project_id) const = 0;
};

// Keeps project id -> status in a YAML map (projects.yaml in the data dir).
class FileProjectRegistry : public ProjectRegistry {
public:
    explicit FileProjectRegistry(const fs::path& path);

    Result<void> set_status(const std::string& project_id, const std::string& status) override;
    std::optional<std::string> status(const std::string& project_id) const override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    mutable std::mutex mutex_;
};
