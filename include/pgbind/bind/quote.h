// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <string_view>

namespace pgbind {

// SQL string literal: 'value' with embedded single quotes doubled
std::string quote(std::string_view value);

// SQL quoted identifier: "value" with embedded double quotes doubled
std::string doubleQuote(std::string_view value);

// True when value is non-empty and every character is an ASCII digit
bool isNumeric(std::string_view value) noexcept;

// True when value is at least two characters long and starts and ends with ch
bool isWrapped(std::string_view value, char ch) noexcept;

} // namespace pgbind
