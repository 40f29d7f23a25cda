#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "job.hpp"

namespace fs = std::filesystem;

// Regular files under root (root itself if it is a file), sorted by path.
// A missing root is InvalidInput; an unreadable directory is IoFailure.
Result<std::vector<fs::path>> collect_files(const fs::path& root);

// File count and byte total across all sources.
Result<JobTotals> count_sources(const std::vector<std::string>& sources);
