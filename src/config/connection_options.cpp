// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <pgbind/config/config_helpers.h>
#include <pgbind/config/connection_options.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <vector>

namespace pgbind::config {

namespace {

constexpr std::array<std::string_view, 6> kSSLModes = {"disable", "allow",     "prefer",
                                                       "require", "verify-ca", "verify-full"};

constexpr std::string_view kPoolPrefix = "pool_";

struct HostPort {
    std::string_view host;
    std::string_view port;
};

Result<HostPort> splitHostPort(std::string_view addr) {
    auto fail = [&](std::string_view why) {
        return Error{ErrorCode::BadParameter, fmt::format("address {}: {}", addr, why)};
    };

    if (!addr.empty() && addr.front() == '[') {
        auto close = addr.find(']');
        if (close == std::string_view::npos) {
            return fail("missing ']' in address");
        }
        if (close + 1 == addr.size()) {
            return fail("missing port in address");
        }
        if (addr[close + 1] != ':') {
            return fail("unexpected text after ']'");
        }
        auto host = addr.substr(1, close - 1);
        auto port = addr.substr(close + 2);
        if (port.find(':') != std::string_view::npos) {
            return fail("too many colons in address");
        }
        return HostPort{host, port};
    }

    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos) {
        return fail("missing port in address");
    }
    auto host = addr.substr(0, colon);
    if (host.find(':') != std::string_view::npos) {
        return fail("too many colons in address");
    }
    if (host.find_first_of("[]") != std::string_view::npos) {
        return fail("unexpected bracket in address");
    }
    return HostPort{host, addr.substr(colon + 1)};
}

// libpq conninfo values need quoting when empty or containing spaces, quotes or backslashes
std::string conninfoValue(std::string_view value) {
    if (value.find_first_of(" \t\n'\\") == std::string_view::npos) {
        return std::string(value);
    }
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

ConnectionOptions::ConnectionOptions() {
    set("host", kDefaultHost);
    set("port", kDefaultPort);
    set("pool_max_conns", kDefaultPoolMaxConns);
}

ConnectionOptions& ConnectionOptions::setCredentials(std::string_view user,
                                                     std::string_view password) {
    if (!user.empty()) {
        set("user", user);
    }
    if (!password.empty()) {
        set("password", password);
    }
    if (!has("dbname") && !user.empty()) {
        set("dbname", user);
    }
    return *this;
}

ConnectionOptions& ConnectionOptions::setDatabase(std::string_view name) {
    if (name.empty()) {
        del("dbname");
    } else {
        set("dbname", name);
    }
    if (!has("user") && !name.empty()) {
        set("user", name);
    }
    return *this;
}

Result<void> ConnectionOptions::setAddr(std::string_view addr) {
    if (addr.find(':') == std::string_view::npos) {
        setHostPort(addr, kDefaultPort);
        return {};
    }
    auto parts = splitHostPort(addr);
    if (!parts) {
        return parts.error();
    }
    setHostPort(parts.value().host, parts.value().port);
    return {};
}

ConnectionOptions& ConnectionOptions::setHostPort(std::string_view host, std::string_view port) {
    if (!host.empty()) {
        set("host", host);
    }
    if (!port.empty()) {
        set("port", port);
    }
    return *this;
}

Result<void> ConnectionOptions::setSSLMode(std::string_view mode) {
    if (mode.empty()) {
        return {};
    }
    if (std::find(kSSLModes.begin(), kSSLModes.end(), mode) == kSSLModes.end()) {
        return Error{ErrorCode::BadParameter, fmt::format("invalid sslmode: {}", mode)};
    }
    set("sslmode", mode);
    return {};
}

ConnectionOptions& ConnectionOptions::set(std::string_view key, std::string_view value) {
    if (auto it = values_.find(key); it != values_.end()) {
        it->second = std::string(value);
    } else {
        values_.emplace(std::string(key), std::string(value));
    }
    return *this;
}

std::optional<std::string> ConnectionOptions::get(std::string_view key) const {
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool ConnectionOptions::has(std::string_view key) const {
    return values_.find(key) != values_.end();
}

void ConnectionOptions::del(std::string_view key) {
    if (auto it = values_.find(key); it != values_.end()) {
        values_.erase(it);
    }
}

std::string ConnectionOptions::encode(std::initializer_list<std::string_view> skip) const {
    std::vector<std::string> parts;
    parts.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        if (std::find(skip.begin(), skip.end(), key) != skip.end() || value.empty()) {
            continue;
        }
        parts.push_back(fmt::format("{}={}", key, value));
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

std::string ConnectionOptions::connInfo() const {
    std::vector<std::string> parts;
    parts.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        if (value.empty() || std::string_view(key).substr(0, kPoolPrefix.size()) == kPoolPrefix) {
            continue;
        }
        parts.push_back(fmt::format("{}={}", key, conninfoValue(value)));
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

Result<std::size_t> ConnectionOptions::poolMaxConns() const {
    auto raw = get("pool_max_conns").value_or(std::string(kDefaultPoolMaxConns));
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), n);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || n == 0) {
        return Error{ErrorCode::BadParameter, fmt::format("invalid pool_max_conns: {}", raw)};
    }
    return n;
}

Result<ConnectionOptions> loadConnectionOptions(const std::filesystem::path& path,
                                                const std::string& section) {
    ConnectionOptions options;
    if (!std::filesystem::exists(path)) {
        spdlog::debug("pgbind: no config at {}, using defaults", path.string());
        return options;
    }

    auto values = parse_config_section(path, section);
    auto take = [&](const char* key) {
        auto it = values.find(key);
        if (it == values.end()) {
            return std::string{};
        }
        auto v = std::move(it->second);
        values.erase(it);
        return v;
    };

    auto user = take("user");
    auto password = take("password");
    auto database = take("database");
    if (database.empty()) {
        database = take("dbname");
    }
    auto addr = take("addr");
    auto host = take("host");
    auto port = take("port");
    auto sslmode = take("sslmode");

    options.setCredentials(user, password);
    if (!database.empty()) {
        options.setDatabase(database);
    }
    if (!addr.empty()) {
        if (auto r = options.setAddr(addr); !r) {
            return r.error();
        }
    }
    options.setHostPort(host, port);
    if (auto r = options.setSSLMode(sslmode); !r) {
        return r.error();
    }
    for (const auto& [key, value] : values) {
        options.set(key, value);
    }

    spdlog::debug("pgbind: loaded connection options from {} [{}]", path.string(), section);
    return options;
}

} // namespace pgbind::config
