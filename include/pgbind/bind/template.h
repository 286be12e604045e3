// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/value.h>

#include <string>
#include <string_view>

namespace pgbind {

/**
 * @brief Expand `${...}` placeholders in a query template
 *
 * | marker        | output                                                        |
 * |---------------|---------------------------------------------------------------|
 * | `$$`, `${$}`  | `$$`                                                          |
 * | `$1`, `${1}`  | `$1` (left for the driver's positional parameters)            |
 * | `${key}`      | default string form of the value, unquoted                    |
 * | `${'key'}`    | quoted string; a sequence becomes a list of quoted elements   |
 * | `${"key"}`    | quoted identifier                                             |
 *
 * `${'key'}` quotes each element of any sequence, generic sequences included, so a list of
 * numbers renders as `'1','2'` rather than as one quoted `'1,2'`.
 *
 * Any other `$` is copied unchanged and a key with no binding renders as an empty string, so
 * substitution never fails. `${key}` applies no escaping and must only carry SQL fragments the
 * caller controls.
 */
std::string substitute(std::string_view query, const NamedArgs& vars);

} // namespace pgbind
