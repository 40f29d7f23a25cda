#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& debug_log_path() {
    static std::string path = (platform::temp_dir() / "haul_debug.log").string();
    return path;
}

fs::path& job_log_dir() {
    static fs::path dir = platform::haul_home() / "logs";
    return dir;
}

} // namespace

const std::string& haul_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return debug_log_path();
}

void set_haul_log_path(const fs::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    debug_log_path() = path.string();
}

void haul_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(debug_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void set_job_log_dir(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(log_mutex());
    job_log_dir() = dir;
}

std::string job_log_path(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(log_mutex());
    return (job_log_dir() / (job_id + ".log")).string();
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) return;

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
