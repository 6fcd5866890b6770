#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <chatmine/core/types.h>
#include <chatmine/normalize/normalizer.h>

namespace chatmine::config {

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
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/// Section holding every chatmine setting
inline constexpr const char* kExtractorSection = "extractor";

// Value of @p key in [@p section] of a TOML-style file, or "" when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Standard config path: override, $CHATMINE_CONFIG, $XDG_CONFIG_HOME/chatmine/config.toml,
// then ~/.config/chatmine/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Parse "true"/"false"/"yes"/"no"/"on"/"off"/"1"/"0"
std::optional<bool> parse_bool(std::string value);

/// Parse a non-negative integer; rejects signs, trailing junk and overflow
std::optional<size_t> parse_size(const std::string& value);

/**
 * @brief Settings read from the [extractor] section
 */
struct ExtractorConfig {
    normalize::NormalizerOptions normalizer;
    /// cursor_user_dir; CHATMINE_CURSOR_USER_DIR takes precedence when set
    std::optional<std::filesystem::path> cursorUserDir;
};

/**
 * @brief Load [extractor] settings, starting from the defaults
 *
 * A missing file yields the defaults unless @p mustExist is set.
 * @return FileNotFound for a required file that does not exist, InvalidArgument
 *         for a value that does not parse
 */
Result<ExtractorConfig> loadExtractorConfig(const std::filesystem::path& configPath,
                                            bool mustExist = false);

} // namespace chatmine::config
