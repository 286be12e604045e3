// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/bind/quote.h>

#include <algorithm>

namespace pgbind {

namespace {

std::string wrap(std::string_view value, char ch) {
    std::string out;
    out.reserve(value.size() + 2);
    out += ch;
    for (char c : value) {
        if (c == ch) {
            out += ch;
        }
        out += c;
    }
    out += ch;
    return out;
}

} // namespace

std::string quote(std::string_view value) {
    return wrap(value, '\'');
}

std::string doubleQuote(std::string_view value) {
    return wrap(value, '"');
}

bool isNumeric(std::string_view value) noexcept {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool isWrapped(std::string_view value, char ch) noexcept {
    return value.size() >= 2 && value.front() == ch && value.back() == ch;
}

} // namespace pgbind
