// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/bind/quote.h>
#include <pgbind/bind/template.h>

namespace pgbind {

namespace {

const Value* lookup(const NamedArgs& vars, std::string_view key) {
    auto it = vars.find(key);
    return it == vars.end() ? nullptr : &it->second;
}

std::string stringForm(const NamedArgs& vars, std::string_view key) {
    const Value* value = lookup(vars, key);
    return value ? value->toString() : std::string{};
}

std::string expandName(std::string_view name, const NamedArgs& vars) {
    if (name == "$") {
        return "$$";
    }
    if (isNumeric(name)) {
        return "$" + std::string(name);
    }
    if (isWrapped(name, '\'')) {
        auto key = name.substr(1, name.size() - 2);
        const Value* value = lookup(vars, key);
        if (value && value->isSequence()) {
            std::string out;
            for (const auto& item : value->elements()) {
                if (!out.empty()) {
                    out += ',';
                }
                out += quote(item);
            }
            return out;
        }
        return quote(value ? value->toString() : std::string{});
    }
    if (isWrapped(name, '"')) {
        return doubleQuote(stringForm(vars, name.substr(1, name.size() - 2)));
    }
    return stringForm(vars, name);
}

} // namespace

std::string substitute(std::string_view query, const NamedArgs& vars) {
    std::string out;
    out.reserve(query.size());

    std::size_t i = 0;
    while (i < query.size()) {
        auto dollar = query.find('$', i);
        if (dollar == std::string_view::npos || dollar + 1 >= query.size()) {
            out.append(query.substr(i));
            break;
        }
        out.append(query.substr(i, dollar - i));

        char next = query[dollar + 1];
        if (next == '$') {
            out += "$$";
            i = dollar + 2;
        } else if (next >= '0' && next <= '9') {
            auto end = dollar + 1;
            while (end < query.size() && query[end] >= '0' && query[end] <= '9') {
                ++end;
            }
            out.append(query.substr(dollar, end - dollar));
            i = end;
        } else if (next == '{') {
            auto close = query.find('}', dollar + 2);
            if (close == std::string_view::npos || close == dollar + 2) {
                // Unterminated or empty braces
                out += '$';
                i = dollar + 1;
                continue;
            }
            out += expandName(query.substr(dollar + 2, close - dollar - 2), vars);
            i = close + 1;
        } else {
            out += '$';
            i = dollar + 1;
        }
    }
    return out;
}

} // namespace pgbind
