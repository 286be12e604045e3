// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/core/types.h>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pgbind::config {

inline constexpr std::string_view kDefaultHost = "localhost";
inline constexpr std::string_view kDefaultPort = "5432";
inline constexpr std::string_view kDefaultPoolMaxConns = "10";

/**
 * @brief libpq connection keywords plus pool settings
 *
 * Keys are kept sorted so encode() is deterministic. Keys prefixed with "pool_" configure
 * PgPool and never reach libpq.
 */
class ConnectionOptions {
public:
    ConnectionOptions();

    // Non-empty parts only; dbname follows user when unset
    ConnectionOptions& setCredentials(std::string_view user, std::string_view password);

    // Empty name removes dbname; user follows dbname when unset
    ConnectionOptions& setDatabase(std::string_view name);

    // "host" or "host:port"; IPv6 literals need brackets when a port is given
    Result<void> setAddr(std::string_view addr);

    ConnectionOptions& setHostPort(std::string_view host, std::string_view port);

    Result<void> setSSLMode(std::string_view mode);

    ConnectionOptions& set(std::string_view key, std::string_view value);
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const;
    void del(std::string_view key);

    [[nodiscard]] std::string encode(std::initializer_list<std::string_view> skip = {}) const;

    // Conninfo string for PQconnectStart
    [[nodiscard]] std::string connInfo() const;

    [[nodiscard]] Result<std::size_t> poolMaxConns() const;

    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& values() const {
        return values_;
    }

private:
    std::map<std::string, std::string, std::less<>> values_;
};

/**
 * Read connection options from the [section] of a TOML-style file, layered over the
 * defaults. The keys user, password, database, addr, host, port and sslmode go through the
 * matching setters; any other key is copied as is. A missing file yields the defaults.
 */
Result<ConnectionOptions> loadConnectionOptions(const std::filesystem::path& path,
                                                const std::string& section = "database");

} // namespace pgbind::config
