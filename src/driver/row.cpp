// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/driver/row.h>

#include <charconv>
#include <cmath>
#include <system_error>

namespace pgbind {

namespace {

template <typename T> Result<T> parseNumber(std::string_view text, std::size_t index) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("column {}: value '{}' out of range", index, text)};
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("column {}: cannot decode '{}' as a number", index, text)};
    }
    return value;
}

} // namespace

std::string_view Row::columnName(std::size_t index) const {
    if (!columns_ || index >= columns_->size()) {
        return {};
    }
    return (*columns_)[index];
}

std::optional<std::size_t> Row::columnIndex(std::string_view name) const {
    if (!columns_) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < columns_->size(); ++i) {
        if ((*columns_)[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool Row::isNull(std::size_t index) const {
    return index >= cells_.size() || !cells_[index].has_value();
}

Result<void> Row::checkIndex(std::size_t index) const {
    if (index >= cells_.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("column {} out of range ({} columns)", index, cells_.size())};
    }
    if (!cells_[index].has_value()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("column {} ({}) is NULL", index, columnName(index))};
    }
    return {};
}

Result<int64_t> Row::getInt64(std::size_t index) const {
    auto check = checkIndex(index);
    if (!check) {
        return check.error();
    }
    return parseNumber<int64_t>(*cells_[index], index);
}

Result<uint64_t> Row::getUint64(std::size_t index) const {
    auto check = checkIndex(index);
    if (!check) {
        return check.error();
    }
    return parseNumber<uint64_t>(*cells_[index], index);
}

Result<double> Row::getDouble(std::size_t index) const {
    auto check = checkIndex(index);
    if (!check) {
        return check.error();
    }
    const std::string& text = *cells_[index];
    if (text == "NaN") {
        return std::nan("");
    }
    if (text == "Infinity") {
        return HUGE_VAL;
    }
    if (text == "-Infinity") {
        return -HUGE_VAL;
    }
    return parseNumber<double>(text, index);
}

Result<std::string> Row::getString(std::size_t index) const {
    auto check = checkIndex(index);
    if (!check) {
        return check.error();
    }
    return *cells_[index];
}

Result<bool> Row::getBool(std::size_t index) const {
    auto check = checkIndex(index);
    if (!check) {
        return check.error();
    }
    const std::string& text = *cells_[index];
    if (text == "t" || text == "true" || text == "1") {
        return true;
    }
    if (text == "f" || text == "false" || text == "0") {
        return false;
    }
    return Error{ErrorCode::InvalidData,
                 fmt::format("column {}: cannot decode '{}' as a boolean", index, text)};
}

Result<bool> RowSet::next() {
    if (position_ < rows_.size()) {
        ++position_;
        return true;
    }
    if (!trailing_.ok()) {
        return trailing_;
    }
    return false;
}

Result<Row> firstRow(RowSet& rows) {
    auto hasRow = rows.next();
    if (!hasRow) {
        return hasRow.error();
    }
    if (!hasRow.value()) {
        return Error{ErrorCode::NoRows};
    }
    return rows.row();
}

} // namespace pgbind
