#include "string_utils.hpp"
#include <cctype>

namespace StringUtils {

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            out.push_back(str.substr(start));
            break;
        }
        out.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have_word = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_word = true;
        } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (have_word) {
                out.push_back(cur);
                cur.clear();
                have_word = false;
            }
        } else {
            cur += c;
            have_word = true;
        }
    }
    if (have_word) {
        out.push_back(cur);
    }
    return out;
}

}
