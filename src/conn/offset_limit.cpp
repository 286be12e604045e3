// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/conn/offset_limit.h>

#include <algorithm>

#include <fmt/format.h>

namespace pgbind {

void OffsetLimit::bind(Bind& vars, uint64_t max) {
    if (!limit || *limit > max) {
        limit = max;
    }
    vars.set(kOffsetLimitKey, fragment());
}

void OffsetLimit::clamp(uint64_t len) {
    if (limit) {
        limit = std::min(*limit, len);
    }
}

std::string OffsetLimit::fragment() const {
    if (offset != 0 && limit) {
        return fmt::format("LIMIT {} OFFSET {}", *limit, offset);
    }
    if (limit) {
        return fmt::format("LIMIT {}", *limit);
    }
    if (offset != 0) {
        return fmt::format("OFFSET {}", offset);
    }
    return {};
}

} // namespace pgbind
