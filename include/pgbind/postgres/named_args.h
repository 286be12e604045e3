// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>
#include <pgbind/bind/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgbind::postgres {

/**
 * @brief A statement in libpq's positional form
 *
 * params[i] is the text of `$<i+1>`; an empty optional is sent as NULL.
 */
struct PositionalQuery {
    std::string sql;
    std::vector<std::string> names;
    std::vector<std::optional<std::string>> params;
};

/**
 * @brief Rewrite `@name` parameter tokens to `$1..$n`
 *
 * Tokens are numbered in order of first appearance and a repeated name reuses its number.
 * Text inside string literals, quoted identifiers, dollar-quoted bodies and comments is left
 * alone. Names with no binding in query.args are sent as NULL.
 */
PositionalQuery toPositional(const Query& query);

// Text form of a value as a libpq parameter; null yields an empty optional
std::optional<std::string> toParam(const Value& value);

// PostgreSQL array literal for a sequence, e.g. {"a","b"}
std::string arrayLiteral(const Value& value);

} // namespace pgbind::postgres
