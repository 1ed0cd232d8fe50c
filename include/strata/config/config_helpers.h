#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <strata/core/types.h>

namespace strata::config {

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
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Supports both "[section] key" and
// "section.key" forms; returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list. Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Get standard config path ($STRATA_CONFIG, then XDG, then ~/.config/strata/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * @brief Settings resolved for an extraction run (env → config file → defaults)
 */
struct ExtractionConfig {
    std::vector<std::string> extraIgnoreDirs;    ///< Added to the detector's default ignore set
    std::size_t maxFileSize = 100 * 1024 * 1024; ///< Files above this are rejected
    bool traverseNotebookCode = true;            ///< Walk Python code cells in notebooks
    std::string logLevel = "info";
};

/**
 * @brief Resolve extraction settings
 *
 * Precedence: STRATA_* environment variables, then the config file, then defaults.
 * A missing config file is not an error; a malformed numeric value is.
 */
Result<ExtractionConfig> loadExtractionConfig(const std::string& override_path = "");

/**
 * @brief Apply a textual log level ("trace", "debug", "info", "warn", "error", "off")
 */
Result<void> applyLogLevel(std::string_view level);

} // namespace strata::config
