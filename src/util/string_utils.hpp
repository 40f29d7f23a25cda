#pragma once

#include <string>
#include <vector>

namespace StringUtils {

// Split on a single delimiter, keeping empty fields.
std::vector<std::string> split(const std::string& str, char delimiter);

// Whitespace-separated words; double quotes group a word with spaces in it.
std::vector<std::string> split_args(const std::string& line);

}
