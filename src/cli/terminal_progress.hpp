#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <transfer/progress_reporter.hpp>

// Prints progress as dim status lines on stdout. Per-job output is
// throttled to one line every few hundred milliseconds; the last file of a
// job and every error always print.
class TerminalProgressSink : public ProgressSink {
public:
    explicit TerminalProgressSink(int min_interval_ms = 250);

    void emit(const ProgressEvent& event) override;
    void emit_error(const std::string& job_id, const std::string& message) override;

private:
    using Clock = std::chrono::steady_clock;

    std::chrono::milliseconds min_interval_;
    std::mutex mutex_;
    std::map<std::string, Clock::time_point> last_print_;
};
