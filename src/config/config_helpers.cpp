#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <strata/config/config_helpers.h>

namespace strata::config {

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

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
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

        // Remove inline comments outside of quotes
        bool inQuote = false;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '"' || v[i] == '\'') {
                inQuote = !inQuote;
            } else if (v[i] == '#' && !inQuote) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        std::string item =
            body.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("STRATA_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "strata" / "config.toml";
    }

    return configHome / "strata" / "config.toml";
}

namespace {

Result<std::size_t> parseSize(const std::string& raw, const char* origin) {
    // stoull accepts a sign and wraps negative values around
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw.front()))) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid size in ") + origin + ": " + raw};
    }
    try {
        size_t consumed = 0;
        auto value = std::stoull(raw, &consumed);
        if (consumed != raw.size()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Invalid size in ") + origin + ": " + raw};
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid size in ") + origin + ": " + raw};
    }
}

bool parseBool(std::string raw) {
    std::transform(raw.begin(), raw.end(), raw.begin(), ::tolower);
    return raw == "1" || raw == "true" || raw == "yes" || raw == "on";
}

} // namespace

Result<ExtractionConfig> loadExtractionConfig(const std::string& override_path) {
    ExtractionConfig cfg;
    auto path = get_config_path(override_path);

    if (std::filesystem::exists(path)) {
        spdlog::debug("Loading extraction config from {}", path.string());

        if (auto v = parse_config_value(path, "walk", "ignore_dirs"); !v.empty()) {
            cfg.extraIgnoreDirs = parse_list(v);
        }
        if (auto v = parse_config_value(path, "extraction", "max_file_size"); !v.empty()) {
            auto size = parseSize(v, "config file");
            if (!size) {
                return size.error();
            }
            cfg.maxFileSize = size.value();
        }
        if (auto v = parse_config_value(path, "extraction", "notebook_code"); !v.empty()) {
            cfg.traverseNotebookCode = parseBool(v);
        }
        if (auto v = parse_config_value(path, "logging", "level"); !v.empty()) {
            cfg.logLevel = v;
        }
    } else if (!override_path.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    if (const char* env = std::getenv("STRATA_IGNORE_DIRS"); env && *env) {
        for (auto& dir : parse_list(env)) {
            cfg.extraIgnoreDirs.push_back(std::move(dir));
        }
    }
    if (const char* env = std::getenv("STRATA_MAX_FILE_SIZE"); env && *env) {
        auto size = parseSize(env, "STRATA_MAX_FILE_SIZE");
        if (!size) {
            return size.error();
        }
        cfg.maxFileSize = size.value();
    }
    if (const char* env = std::getenv("STRATA_LOG_LEVEL"); env && *env) {
        cfg.logLevel = env;
    }

    return cfg;
}

Result<void> applyLogLevel(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + std::string(level)};
    }
    spdlog::set_level(parsed);
    return {};
}

} // namespace strata::config
