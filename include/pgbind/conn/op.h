// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>

#include <fmt/format.h>

namespace pgbind {

// Statement variant a Selector is asked for
enum class Op : uint8_t { None = 0, Get, Insert, Patch, Delete, List };

constexpr const char* opToString(Op op) {
    switch (op) {
        case Op::Get: return "GET";
        case Op::Insert: return "INSERT";
        case Op::Patch: return "PATCH";
        case Op::Delete: return "DELETE";
        case Op::List: return "LIST";
        case Op::None: break;
    }
    return "UNKNOWN";
}

} // namespace pgbind

template <> struct fmt::formatter<pgbind::Op> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(pgbind::Op op, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", pgbind::opToString(op));
    }
};
