/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandprobe/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace sandprobe {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    return it != haystack.end();
}

// Truncate for display
std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t limit,
                                  const std::string& marker) {
    if (str.size() <= limit) {
        return str;
    }
    return str.substr(0, limit) + marker;
}


// POSIX single-quote escaping
std::string StringUtils::ShellQuote(const std::string& str) {
    return "'" + ReplaceAll(str, "'", "'\\''") + "'";
}

// {name} placeholder substitution
std::string StringUtils::Substitute(const std::string& templ,
                                    const std::map<std::string, std::string>& values) {
    std::string result = templ;
    for (const auto& [name, value] : values) {
        result = ReplaceAll(result, "{" + name + "}", value);
    }
    return result;
}

} // namespace utils
} // namespace sandprobe
