#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory, falling back to /tmp.
std::filesystem::path temp_dir();

// Root for haul's config, history and logs: $HAUL_HOME if set, otherwise
// ~/.haul.
std::filesystem::path haul_home();

} // namespace platform
