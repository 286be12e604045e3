// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/core/types.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

namespace pgbind {

namespace detail {
template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
} // namespace detail

/**
 * @brief One result row, decoded from the driver's text representation
 *
 * A NULL column is an empty optional. Getters return InvalidData when a column cannot be
 * decoded to the requested type.
 */
class Row {
public:
    using Columns = std::shared_ptr<const std::vector<std::string>>;
    using Cell = std::optional<std::string>;

    Row(Columns columns, std::vector<Cell> cells)
        : columns_(std::move(columns)), cells_(std::move(cells)) {}

    [[nodiscard]] std::size_t columnCount() const noexcept { return cells_.size(); }
    [[nodiscard]] std::string_view columnName(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> columnIndex(std::string_view name) const;

    [[nodiscard]] bool isNull(std::size_t index) const;

    Result<int64_t> getInt64(std::size_t index) const;
    Result<uint64_t> getUint64(std::size_t index) const;
    Result<double> getDouble(std::size_t index) const;
    Result<std::string> getString(std::size_t index) const;
    Result<bool> getBool(std::size_t index) const;

    /**
     * @brief Decode the leading columns into the given outputs, in order
     *
     * Supported outputs are bool, integral types, floating point types, std::string and
     * std::optional of those. Fails with InvalidData when there are fewer columns than outputs,
     * on NULL into a non-optional, or when a value does not fit.
     */
    template <typename... Ts> Result<void> scan(Ts&... out) const {
        if (sizeof...(Ts) > columnCount()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("scan: {} destinations but row has {} columns",
                                     sizeof...(Ts), columnCount())};
        }
        std::size_t index = 0;
        Result<void> result;
        ((result = decode(index++, out), result.has_value()) && ...);
        return result;
    }

private:
    Columns columns_;
    std::vector<Cell> cells_;

    Result<void> checkIndex(std::size_t index) const;

    template <typename T> Result<void> decode(std::size_t index, T& out) const {
        if constexpr (detail::is_optional<T>::value) {
            if (isNull(index)) {
                out.reset();
                return {};
            }
            typename T::value_type value{};
            auto result = decode(index, value);
            if (result) {
                out = std::move(value);
            }
            return result;
        } else if constexpr (std::is_same_v<T, bool>) {
            auto value = getBool(index);
            if (!value) {
                return value.error();
            }
            out = value.value();
            return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
            auto value = getString(index);
            if (!value) {
                return value.error();
            }
            out = std::move(value).value();
            return {};
        } else if constexpr (std::is_floating_point_v<T>) {
            auto value = getDouble(index);
            if (!value) {
                return value.error();
            }
            out = static_cast<T>(value.value());
            return {};
        } else if constexpr (std::signed_integral<T>) {
            auto value = getInt64(index);
            if (!value) {
                return value.error();
            }
            if (value.value() < std::numeric_limits<T>::min() ||
                value.value() > std::numeric_limits<T>::max()) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("column {}: value {} out of range", index, value.value())};
            }
            out = static_cast<T>(value.value());
            return {};
        } else if constexpr (std::unsigned_integral<T>) {
            auto value = getUint64(index);
            if (!value) {
                return value.error();
            }
            if (value.value() > std::numeric_limits<T>::max()) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("column {}: value {} out of range", index, value.value())};
            }
            out = static_cast<T>(value.value());
            return {};
        } else {
            static_assert(sizeof(T) == 0, "Row::scan: unsupported destination type");
        }
    }
};

/**
 * @brief Forward-only cursor over a result
 *
 * next() returns true while a row is available, false at the end, and an error when the
 * driver failed part way through the result.
 */
class RowSet {
public:
    RowSet() = default;
    RowSet(std::vector<Row> rows, Error trailing = {})
        : rows_(std::move(rows)), trailing_(std::move(trailing)) {}

    Result<bool> next();

    // Precondition: the last call to next() returned true
    [[nodiscard]] const Row& row() const { return rows_[position_ - 1]; }

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

private:
    std::vector<Row> rows_;
    Error trailing_;
    std::size_t position_ = 0;
};

/**
 * @brief The first row of a result, or NoRows when it is empty
 */
Result<Row> firstRow(RowSet& rows);

} // namespace pgbind
