#include <chatmine/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>

namespace chatmine::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Dotted keys ("extractor.prefer_composer") work from any section
        const bool matches = (in_target_section && k == key) ||
                             (!section.empty() && k == section + "." + key);
        if (!matches) {
            continue;
        }

        if (v.empty() || (v.front() != '"' && v.front() != '\'')) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }
        return unquote(v);
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CHATMINE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "chatmine" / "config.toml";
    }

    return configHome / "chatmine" / "config.toml";
}

std::optional<bool> parse_bool(std::string value) {
    trim(value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1")
        return true;
    if (value == "false" || value == "no" || value == "off" || value == "0")
        return false;
    return std::nullopt;
}

std::optional<size_t> parse_size(const std::string& value) {
    if (value.empty())
        return std::nullopt;
    size_t out = 0;
    for (char c : value) {
        if (c < '0' || c > '9')
            return std::nullopt;
        const size_t digit = static_cast<size_t>(c - '0');
        if (out > (std::numeric_limits<size_t>::max() - digit) / 10)
            return std::nullopt;
        out = out * 10 + digit;
    }
    return out;
}

namespace {

Result<void> readBool(const std::filesystem::path& path, const char* key, bool& target) {
    auto raw = parse_config_value(path, kExtractorSection, key);
    if (raw.empty())
        return {};
    auto parsed = parse_bool(raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid boolean for ") + key + ": '" + raw + "'"};
    }
    target = *parsed;
    return {};
}

Result<void> readSize(const std::filesystem::path& path, const char* key, size_t& target) {
    auto raw = parse_config_value(path, kExtractorSection, key);
    if (raw.empty())
        return {};
    auto parsed = parse_size(raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid count for ") + key + ": '" + raw + "'"};
    }
    target = *parsed;
    return {};
}

} // namespace

Result<ExtractorConfig> loadExtractorConfig(const std::filesystem::path& configPath,
                                            bool mustExist) {
    ExtractorConfig cfg;

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        if (mustExist) {
            return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
        }
        spdlog::debug("No config at {}, using defaults", configPath.string());
        return cfg;
    }

    auto& opts = cfg.normalizer;
    for (const char* adapter : {"composer", "chatdata"}) {
        bool enabled = true;
        const std::string key = std::string("enable_") + adapter;
        if (auto r = readBool(configPath, key.c_str(), enabled); !r)
            return r.error();
        opts.enabledAdapters[adapter] = enabled;
    }
    if (auto r = readBool(configPath, "prefer_composer", opts.preferModern); !r)
        return r.error();
    if (auto r = readSize(configPath, "max_threads_per_db", opts.maxThreadsPerDb); !r)
        return r.error();
    if (auto r = readSize(configPath, "max_messages_per_thread", opts.maxMessagesPerThread); !r)
        return r.error();
    if (auto r = readBool(configPath, "redact_secrets", opts.redactSecrets); !r)
        return r.error();

    if (auto dir = parse_config_value(configPath, kExtractorSection, "cursor_user_dir");
        !dir.empty()) {
        cfg.cursorUserDir = expand_tilde(dir);
    }

    spdlog::debug("Loaded config from {}", configPath.string());
    return cfg;
}

} // namespace chatmine::config
