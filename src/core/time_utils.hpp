#pragma once

#include <string>
#include <cstdint>

// "2h15m", "5m30s", "45s". Used for durations and ETAs alike.
std::string format_seconds(uint64_t seconds);

// Duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses the current time (for jobs still running).
// Returns "-" if start is empty, "?" if either side does not parse.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// ISO timestamp to a short 12-hour clock ("2:35pm").
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
