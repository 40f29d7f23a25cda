#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.haul/config.yaml; a missing file yields defaults.
    static Result<Config> load();

    // Load a specific config file; a missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const TransferConfig& transfer() const { return transfer_; }
    const ProgressConfig& progress() const { return progress_; }
    const PathsConfig& paths() const { return paths_; }
    const HistoryConfig& history() const { return history_; }

    fs::path data_dir() const { return fs::path(paths_.data_dir); }
    fs::path job_log_dir() const { return data_dir() / "logs"; }

    // Point the debug and per-job logs at the configured locations.
    void apply_logging() const;

    Config();

private:
    TransferConfig transfer_;
    ProgressConfig progress_;
    PathsConfig paths_;
    HistoryConfig history_;

    Result<void> validate() const;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Create default config (no-op if one exists)
Result<void> create_default_config();
