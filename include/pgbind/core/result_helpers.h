// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file result_helpers.h
 * @brief Early-return macros and a scope guard for Result<T>
 */

#include <pgbind/core/types.h>

#include <utility>

/**
 * @def PGBIND_TRY(expr)
 * @brief Evaluate an expression returning a Result and return its error early
 *
 * @code
 * Result<void> step() {
 *     PGBIND_TRY(handle.exec(query, stop));
 *     return {};
 * }
 * @endcode
 */
#define PGBIND_TRY(expr)                                                                           \
    do {                                                                                           \
        auto _pgbind_try_result = (expr);                                                          \
        if (!_pgbind_try_result.has_value()) {                                                     \
            return _pgbind_try_result.error();                                                     \
        }                                                                                          \
    } while (0)

/**
 * @def PGBIND_TRY_UNWRAP(var, expr)
 * @brief Declare var from the value of a Result, returning its error early
 *
 * @note Introduces a variable in the current scope; not usable as a single-statement body.
 */
#define PGBIND_TRY_UNWRAP(var, expr)                                                               \
    auto _pgbind_res_##var = (expr);                                                               \
    if (!_pgbind_res_##var.has_value()) {                                                          \
        return _pgbind_res_##var.error();                                                          \
    }                                                                                              \
    auto var = std::move(_pgbind_res_##var).value()

namespace pgbind {

/**
 * @brief Run cleanup code on scope exit unless dismissed
 *
 * @code
 * auto rollback = scope_exit([&] { (void)tx->rollback({}); });
 * PGBIND_TRY(step1());
 * rollback.dismiss();
 * @endcode
 */
template <typename Func> class ScopeGuard {
public:
    explicit ScopeGuard(Func func) : func_(std::move(func)) {}

    ~ScopeGuard() {
        if (active_) {
            func_();
        }
    }

    // Move-only
    ScopeGuard(ScopeGuard&& other) noexcept
        : func_(std::move(other.func_)), active_(other.active_) {
        other.active_ = false;
    }
    ScopeGuard& operator=(ScopeGuard&&) = delete;
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { active_ = false; }

private:
    Func func_;
    bool active_ = true;
};

template <typename Func> ScopeGuard<Func> scope_exit(Func func) {
    return ScopeGuard<Func>(std::move(func));
}

} // namespace pgbind
