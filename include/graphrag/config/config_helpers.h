#pragma once

#include <graphrag/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace graphrag::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Flattened "section.key" -> value map of a TOML-style file
using ConfigMap = std::map<std::string, std::string>;

// Parses [section] headers, key = value lines, # comments (outside quotes) and dotted
// "section.key = value" lines. NotFound if the file cannot be opened.
Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Value of section.key, empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $GRAPHRAG_CONFIG, else $XDG_CONFIG_HOME/graphrag/config.toml, else
// ~/.config/graphrag/config.toml. A non-empty override wins over all of them.
std::filesystem::path get_config_path(const std::string& override_path = "");

// Typed parsing of raw config/env strings; InvalidArgument names the offending key
Result<double> parse_double(std::string_view key, const std::string& raw);
Result<std::size_t> parse_size(std::string_view key, const std::string& raw);
Result<bool> parse_bool(std::string_view key, const std::string& raw);

} // namespace graphrag::config
