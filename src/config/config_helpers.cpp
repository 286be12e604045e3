// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fstream>
#include <pgbind/config/config_helpers.h>

namespace pgbind::config {

namespace {

// Drop a trailing # comment that is not inside quotes
void strip_comment(std::string& value) {
    char quote = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            value.erase(i);
            break;
        }
    }
    trim(value);
}

} // namespace

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
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

        // Support both "database.host" at top level and "[database] host"
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_comment(v);

        if (in_target_section) {
            values[k] = unquote(v);
        } else if (currentSection.empty() && !section.empty() &&
                   k.rfind(section + ".", 0) == 0) {
            values[k.substr(section.size() + 1)] = unquote(v);
        }
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_section(config_path, section);
    auto it = values.find(key);
    return it == values.end() ? std::string{} : it->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "pgbind" / "config.toml";
    }

    return configHome / "pgbind" / "config.toml";
}

std::filesystem::path resolve_config_path() {
    if (const char* env = std::getenv("PGBIND_CONFIG"); env && *env) {
        return get_config_path(env);
    }
    return get_config_path();
}

} // namespace pgbind::config
