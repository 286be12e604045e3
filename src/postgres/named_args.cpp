// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/postgres/named_args.h>

#include <cmath>

#include <fmt/format.h>

namespace pgbind::postgres {

namespace {

bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c) {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

// Length of a dollar-quote tag ($tag$ or $$) starting at pos, or 0 when there is none
std::size_t dollarTag(std::string_view sql, std::size_t pos) {
    std::size_t end = pos + 1;
    if (end < sql.size() && sql[end] == '$') {
        return 2;
    }
    if (end >= sql.size() || !isIdentStart(sql[end])) {
        return 0;
    }
    while (end < sql.size() && isIdentChar(sql[end])) {
        ++end;
    }
    if (end < sql.size() && sql[end] == '$') {
        return end - pos + 1;
    }
    return 0;
}

// Index just past the quoted section that starts at pos
std::size_t skipQuoted(std::string_view sql, std::size_t pos, char quote, bool backslashes) {
    std::size_t i = pos + 1;
    while (i < sql.size()) {
        char c = sql[i];
        if (backslashes && c == '\\') {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < sql.size() && sql[i + 1] == quote) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

std::size_t skipBlockComment(std::string_view sql, std::size_t pos) {
    int depth = 0;
    std::size_t i = pos;
    while (i + 1 < sql.size()) {
        if (sql[i] == '/' && sql[i + 1] == '*') {
            ++depth;
            i += 2;
        } else if (sql[i] == '*' && sql[i + 1] == '/') {
            --depth;
            i += 2;
            if (depth == 0) {
                return i;
            }
        } else {
            ++i;
        }
    }
    return sql.size();
}

std::string scalarParam(const Scalar& scalar) {
    if (const auto* d = std::get_if<double>(&scalar)) {
        if (std::isnan(*d)) {
            return "NaN";
        }
        if (std::isinf(*d)) {
            return *d > 0 ? "Infinity" : "-Infinity";
        }
    }
    return toString(scalar);
}

std::string arrayElement(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

PositionalQuery toPositional(const Query& query) {
    PositionalQuery out;
    std::string_view sql = query.sql;
    out.sql.reserve(sql.size());

    std::size_t i = 0;
    while (i < sql.size()) {
        char c = sql[i];
        std::size_t next = i + 1;

        if (c == '\'') {
            bool escaped = i > 0 && (sql[i - 1] == 'E' || sql[i - 1] == 'e') &&
                           (i < 2 || !isIdentChar(sql[i - 2]));
            next = skipQuoted(sql, i, '\'', escaped);
        } else if (c == '"') {
            next = skipQuoted(sql, i, '"', false);
        } else if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            auto eol = sql.find('\n', i);
            next = eol == std::string_view::npos ? sql.size() : eol;
        } else if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            next = skipBlockComment(sql, i);
        } else if (c == '$' && (i == 0 || !isIdentChar(sql[i - 1]))) {
            if (auto tag = dollarTag(sql, i); tag > 0) {
                auto close = sql.find(sql.substr(i, tag), i + tag);
                next = close == std::string_view::npos ? sql.size() : close + tag;
            }
        } else if (c == '@' && i + 1 < sql.size() && isIdentStart(sql[i + 1])) {
            std::size_t end = i + 1;
            while (end < sql.size() && isIdentChar(sql[end])) {
                ++end;
            }
            std::string name(sql.substr(i + 1, end - i - 1));

            std::size_t number = 0;
            for (std::size_t n = 0; n < out.names.size(); ++n) {
                if (out.names[n] == name) {
                    number = n + 1;
                    break;
                }
            }
            if (number == 0) {
                auto it = query.args.find(name);
                out.params.push_back(it == query.args.end() ? std::nullopt : toParam(it->second));
                out.names.push_back(std::move(name));
                number = out.names.size();
            }
            out.sql += fmt::format("${}", number);
            i = end;
            continue;
        }

        out.sql.append(sql.substr(i, next - i));
        i = next;
    }
    return out;
}

std::optional<std::string> toParam(const Value& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    if (value.isSequence()) {
        return arrayLiteral(value);
    }
    return scalarParam(value.toScalar());
}

std::string arrayLiteral(const Value& value) {
    std::string out = "{";
    bool first = true;
    auto add = [&](const std::string& element) {
        if (!first) {
            out += ',';
        }
        out += element;
        first = false;
    };

    if (value.holds<Value::StringList>()) {
        for (const auto& item : value.get<Value::StringList>()) {
            add(arrayElement(item));
        }
    } else if (value.holds<Value::List>()) {
        for (const auto& item : value.get<Value::List>()) {
            if (std::holds_alternative<std::nullptr_t>(item)) {
                add("NULL");
            } else {
                add(arrayElement(scalarParam(item)));
            }
        }
    } else if (!value.isNull()) {
        add(arrayElement(value.toString()));
    }
    out += '}';
    return out;
}

} // namespace pgbind::postgres
