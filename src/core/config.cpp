#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::haul_home();
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    std::error_code ec;
    return fs::exists(get_config_path(), ec);
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (config_exists()) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IoFailure,
            fmt::format("Failed to create {}: {}", config_path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# haul configuration

transfer:
  max_concurrent_copies: 4     # process-wide ceiling on simultaneous file copies
  chunk_size_bytes: 4194304    # 4 MiB streaming block
  max_attempts: 3              # total attempts per file (copy + verify)
  base_delay_ms: 10            # first retry backoff, doubled per attempt
  workers: 4                   # threads driving jobs

progress:
  queue_capacity: 256          # events buffered for slow observers before dropping

paths:
  data_dir: ""                 # default: ~/.haul
  debug_log: ""                # default: <tmp>/haul_debug.log

history:
  max_entries: 100
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailure,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailure,
            "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

Config::Config() {
    transfer_.max_concurrent_copies = MAX_CONCURRENT_COPIES;
    transfer_.chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
    transfer_.max_attempts = MAX_RETRY_ATTEMPTS;
    transfer_.base_delay_ms = RETRY_BASE_DELAY_MS;
    transfer_.workers = DEFAULT_JOB_WORKERS;
    progress_.queue_capacity = PROGRESS_QUEUE_CAPACITY;
    history_.max_entries = HISTORY_MAX_ENTRIES;
    paths_.data_dir = get_config_dir().string();
}

// Absent keys keep the default; present keys must convert or the whole
// load fails (YAML::TypedBadConversion is a YAML::Exception).
template <typename T>
static T read_or(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<T>();
}

static TransferConfig parse_transfer_config(const YAML::Node& node, const TransferConfig& defaults) {
    TransferConfig t = defaults;
    t.max_concurrent_copies = read_or<int>(node, "max_concurrent_copies", defaults.max_concurrent_copies);
    t.chunk_size_bytes = read_or<std::size_t>(node, "chunk_size_bytes", defaults.chunk_size_bytes);
    t.max_attempts = read_or<int>(node, "max_attempts", defaults.max_attempts);
    t.base_delay_ms = read_or<int>(node, "base_delay_ms", defaults.base_delay_ms);
    t.workers = read_or<int>(node, "workers", defaults.workers);
    return t;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::InvalidInput, "Config root must be a mapping");
        }

        if (root["transfer"]) {
            config.transfer_ = parse_transfer_config(root["transfer"], config.transfer_);
        }
        if (root["progress"]) {
            config.progress_.queue_capacity =
                read_or<int>(root["progress"], "queue_capacity", config.progress_.queue_capacity);
        }
        if (root["paths"]) {
            std::string data_dir = root["paths"]["data_dir"].as<std::string>("");
            if (!data_dir.empty()) config.paths_.data_dir = data_dir;
            config.paths_.debug_log = root["paths"]["debug_log"].as<std::string>("");
        }
        if (root["history"]) {
            config.history_.max_entries =
                read_or<int>(root["history"], "max_entries", config.history_.max_entries);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidInput,
                                   std::string("Failed to parse config: ") + e.what());
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(valid);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::IoFailure, "Cannot read config at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}

Result<void> Config::validate() const {
    if (transfer_.max_concurrent_copies < 1) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("transfer.max_concurrent_copies must be >= 1 (got {})",
                        transfer_.max_concurrent_copies));
    }
    if (transfer_.chunk_size_bytes == 0) {
        return Result<void>::Err(ErrorKind::InvalidInput, "transfer.chunk_size_bytes must be > 0");
    }
    if (transfer_.max_attempts < 1) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("transfer.max_attempts must be >= 1 (got {})", transfer_.max_attempts));
    }
    if (transfer_.base_delay_ms < 0) {
        return Result<void>::Err(ErrorKind::InvalidInput, "transfer.base_delay_ms must be >= 0");
    }
    if (transfer_.workers < 1) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("transfer.workers must be >= 1 (got {})", transfer_.workers));
    }
    if (progress_.queue_capacity < 1) {
        return Result<void>::Err(ErrorKind::InvalidInput, "progress.queue_capacity must be >= 1");
    }
    if (history_.max_entries < 1) {
        return Result<void>::Err(ErrorKind::InvalidInput, "history.max_entries must be >= 1");
    }
    return Result<void>::Ok();
}

void Config::apply_logging() const {
    if (!paths_.debug_log.empty()) {
        set_haul_log_path(paths_.debug_log);
    }
    set_job_log_dir(job_log_dir());
}
