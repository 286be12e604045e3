// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/value.h>

#include <initializer_list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json_fwd.hpp>

namespace pgbind {

// Reserved keys reset by Connection::list before the selector runs
constexpr std::string_view kGroupByKey = "groupby";
constexpr std::string_view kOrderByKey = "orderby";
constexpr std::string_view kOffsetLimitKey = "offsetlimit";

using BindPair = std::pair<std::string, Value>;

/**
 * @brief A statement ready for the driver
 *
 * `sql` has every `${...}` placeholder expanded; `@key` parameter tokens are left for the
 * driver to bind from `args`.
 */
struct Query {
    std::string sql;
    NamedArgs args;
};

/**
 * @brief Thread-safe store of named query variables
 *
 * Variables reach a statement two ways: textually through `${key}` placeholders, or as driver
 * parameters through the `@key` token returned by set(). Mutations take an exclusive lock and
 * reads a shared lock; a sequence of calls is not atomic as a whole.
 */
class Bind {
public:
    Bind() = default;
    Bind(std::initializer_list<BindPair> pairs);
    explicit Bind(NamedArgs vars);

    // Non-copyable, non-movable; use copy() to fork
    Bind(const Bind&) = delete;
    Bind& operator=(const Bind&) = delete;
    Bind(Bind&&) = delete;
    Bind& operator=(Bind&&) = delete;

    /**
     * @brief Independent clone seeded with the current variables plus overrides
     *
     * Empty override keys are skipped. Later changes to either store are not visible in the
     * other.
     */
    [[nodiscard]] std::unique_ptr<Bind> copy(std::initializer_list<BindPair> overrides = {}) const;

    /**
     * @brief Store a variable and return its parameter token (`@key`)
     *
     * Returns an empty string, and stores nothing, when the key is empty.
     */
    std::string set(std::string_view key, Value value);

    // Stored value, or nullopt when the key is unset
    [[nodiscard]] std::optional<Value> get(std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    void del(std::string_view key);

    /**
     * @brief String form of a variable with sequence elements joined by sep
     *
     * An unset key yields an empty string and a scalar yields its default string form.
     */
    [[nodiscard]] std::string join(std::string_view key, std::string_view sep) const;

    /**
     * @brief Append a value to the sequence stored at key
     *
     * An unset key starts a new sequence. A sequence value is appended as a single element
     * holding its default string form. Returns false, leaving the store unchanged, when key is
     * empty or the stored value is not a sequence.
     */
    bool append(std::string_view key, Value value);

    // Expand placeholders and snapshot the variables under one lock
    [[nodiscard]] Query render(std::string_view query) const;

    // Expand placeholders only
    [[nodiscard]] std::string replace(std::string_view query) const;

    [[nodiscard]] NamedArgs snapshot() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] nlohmann::json toJson() const;

    // Indented JSON
    [[nodiscard]] std::string str() const;

private:
    mutable std::shared_mutex mutex_;
    NamedArgs vars_;
};

} // namespace pgbind
