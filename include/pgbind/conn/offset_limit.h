// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>

#include <cstdint>
#include <optional>

namespace pgbind {

/**
 * @brief Pagination request
 *
 * An unset limit means "as many as the server allows"; bind() always resolves it to an
 * explicit bound.
 */
struct OffsetLimit {
    uint64_t offset = 0;
    std::optional<uint64_t> limit;

    /**
     * @brief Clamp the limit to max and store the LIMIT/OFFSET fragment under `offsetlimit`
     */
    void bind(Bind& vars, uint64_t max);

    // Reduce a set limit to at most len
    void clamp(uint64_t len);

    // The fragment bind() stores, without touching the limit
    [[nodiscard]] std::string fragment() const;
};

} // namespace pgbind
