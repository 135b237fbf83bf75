/**
 * @file text.hpp
 * @brief String helpers shared by input normalization and parsing
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

namespace PhishLedger {

inline std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

// Split on commas, trimming each item and dropping empty ones
inline std::vector<std::string> split_csv(const std::string& str) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find(',', start);
        if (end == std::string::npos) end = str.size();
        std::string item = trim(str.substr(start, end - start));
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    return items;
}

// Canonical 8-4-4-4-12 hex UUID, either case
inline bool is_uuid(const std::string& str) {
    if (str.size() != 36) return false;
    for (size_t i = 0; i < str.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }
    return true;
}

// Unsigned decimal count: digits only, no sign, no surrounding text
inline bool parse_count(const std::string& str, size_t& out) {
    if (str.empty()) return false;
    size_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace PhishLedger
