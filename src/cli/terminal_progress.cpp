#include "terminal_progress.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <iostream>

TerminalProgressSink::TerminalProgressSink(int min_interval_ms)
    : min_interval_(min_interval_ms) {}

void TerminalProgressSink::emit(const ProgressEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    bool last = ev.current_file_index >= ev.files_total && ev.bytes_done >= ev.bytes_total;
    auto it = last_print_.find(ev.job_id);
    if (!last && it != last_print_.end() && now - it->second < min_interval_) {
        return;
    }
    last_print_[ev.job_id] = now;

    std::string short_id = ev.job_id.substr(0, 8);
    std::cout << theme::dim(fmt::format("    {} {} [{}/{}] {}  {} / {}  {}/s  eta {}",
                                        job_kind_name(ev.kind), short_id,
                                        ev.current_file_index, ev.files_total,
                                        ev.current_file_name,
                                        format_bytes(ev.bytes_done), format_bytes(ev.bytes_total),
                                        format_bytes(static_cast<uint64_t>(ev.speed_bytes_per_sec)),
                                        ev.eta_seconds > 0 ? format_seconds(ev.eta_seconds) : "-"))
              << "\n" << std::flush;

    if (last) {
        last_print_.erase(ev.job_id);
    }
}

void TerminalProgressSink::emit_error(const std::string& job_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << theme::warn(fmt::format("{}: {}", job_id.substr(0, 8), message)) << std::flush;
}
