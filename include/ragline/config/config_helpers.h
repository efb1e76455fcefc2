#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <ragline/core/types.h>

namespace ragline::config {

// section -> key -> raw value
using ConfigMap = std::map<std::string, std::map<std::string, std::string>>;

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Accepts true/false, yes/no, on/off and 1/0 (case-insensitive).
std::optional<bool> parse_bool(std::string_view value);

// Reads a flat TOML file of [section] headers and key = value lines. Quotes and inline
// comments are stripped; keys before the first header land in the "" section.
Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Single lookup; empty when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/ragline or ~/.config/ragline
std::filesystem::path get_config_dir();

// override_path, else $RAGLINE_CONFIG, else get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace ragline::config
