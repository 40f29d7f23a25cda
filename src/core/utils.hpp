#pragma once

#include <string>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Random RFC 4122 version-4 identifier, e.g. "3f1c...-4...".
std::string generate_uuid();

// Human-readable byte count: "512 B", "1.5 KiB", "3.2 GiB".
std::string format_bytes(uint64_t bytes);
