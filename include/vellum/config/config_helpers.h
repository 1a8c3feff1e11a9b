#pragma once

#include <vellum/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace vellum::config {

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

// Flattened "section.key" -> value map of a TOML-style file. Nested tables,
// arrays and multi-line strings are not supported.
using ConfigMap = std::map<std::string, std::string>;

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Same grammar, from an in-memory string
ConfigMap parse_config_text(const std::string& text);

/// $VELLUM_CONFIG, else $XDG_CONFIG_HOME/vellum/config.toml or ~/.config/vellum/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/vellum or ~/.local/share/vellum
std::filesystem::path get_data_dir();

} // namespace vellum::config
