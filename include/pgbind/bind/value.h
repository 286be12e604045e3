// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

namespace pgbind {

/**
 * @brief One element of a generic sequence
 *
 * Scalars never nest, so a sequence element is always one of these.
 */
using Scalar = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string>;

/**
 * @brief A bound variable
 *
 * Holds null, a scalar, a sequence of strings, or a generic sequence of scalars. The default
 * string form is what `${key}` substitution renders.
 */
class Value {
public:
    using StringList = std::vector<std::string>;
    using List = std::vector<Scalar>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string,
                                 StringList, List>;

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool value) : data_(value) {}

    template <std::signed_integral T>
    requires(!std::same_as<T, bool>) Value(T value) : data_(static_cast<int64_t>(value)) {}

    template <std::unsigned_integral T>
    requires(!std::same_as<T, bool>) Value(T value) : data_(static_cast<uint64_t>(value)) {}

    template <std::floating_point T> Value(T value) : data_(static_cast<double>(value)) {}

    Value(const char* value) : data_(std::string(value ? value : "")) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(StringList values) : data_(std::move(values)) {}
    Value(List values) : data_(std::move(values)) {}
    Value(Scalar scalar);

    bool isNull() const noexcept { return std::holds_alternative<std::nullptr_t>(data_); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool isStringList() const noexcept { return std::holds_alternative<StringList>(data_); }

    // True for either sequence kind
    bool isSequence() const noexcept {
        return std::holds_alternative<StringList>(data_) || std::holds_alternative<List>(data_);
    }

    template <typename T> bool holds() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    // Precondition: holds<T>()
    template <typename T> const T& get() const { return std::get<T>(data_); }

    const Storage& storage() const noexcept { return data_; }

    // Number of elements for a sequence, zero otherwise
    std::size_t size() const noexcept;

    // String forms of each element; a scalar yields one element, null yields none
    std::vector<std::string> elements() const;

    // Default string form
    std::string toString() const;

    // Scalar form of a non-sequence value
    Scalar toScalar() const;

    nlohmann::json toJson() const;

    bool operator==(const Value& other) const = default;

private:
    Storage data_;
};

// Default string form of one scalar
std::string toString(const Scalar& scalar);

// Snapshot of bound variables, ordered by key
using NamedArgs = std::map<std::string, Value, std::less<>>;

} // namespace pgbind

template <> struct fmt::formatter<pgbind::Value> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pgbind::Value& value, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(value.toString(), ctx);
    }
};
