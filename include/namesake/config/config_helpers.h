#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace namesake::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() < 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Time parsing. Returns nullopt for anything that is not a non-negative integer.
inline std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::chrono::milliseconds(std::stoll(std::string(s)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Parse a value from TOML config file. Returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Split a comma list or a TOML string array into trimmed, unquoted items.
// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Resolve the config file: explicit override, then NAMESAKE_CONFIG, then the XDG location.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace namesake::config
