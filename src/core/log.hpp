#pragma once

#include <string>
#include <filesystem>

// Debug log: <tmp>/haul_debug.log unless redirected by config.
const std::string& haul_log_path();
void set_haul_log_path(const std::filesystem::path& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log.
void haul_log(const std::string& msg);

// Per-job logs live under <dir>/<job_id>.log (default ~/.haul/logs).
void set_job_log_dir(const std::filesystem::path& dir);
std::string job_log_path(const std::string& job_id);

// Append a timestamped line to a job's persistent log file.
void append_job_log(const std::string& job_id, const std::string& msg);
