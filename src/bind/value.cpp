// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/bind/value.h>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

namespace pgbind {

namespace {

struct ScalarToString {
    std::string operator()(std::nullptr_t) const { return {}; }
    std::string operator()(bool value) const { return value ? "true" : "false"; }
    std::string operator()(int64_t value) const { return std::to_string(value); }
    std::string operator()(uint64_t value) const { return std::to_string(value); }
    std::string operator()(double value) const { return fmt::format("{}", value); }
    std::string operator()(const std::string& value) const { return value; }
};

nlohmann::json scalarToJson(const Scalar& scalar) {
    return std::visit(
        [](const auto& value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return nullptr;
            } else {
                return value;
            }
        },
        scalar);
}

} // namespace

std::string toString(const Scalar& scalar) {
    return std::visit(ScalarToString{}, scalar);
}

Value::Value(Scalar scalar) : data_(nullptr) {
    std::visit([this](auto&& value) { data_ = std::move(value); }, std::move(scalar));
}

std::size_t Value::size() const noexcept {
    if (const auto* list = std::get_if<StringList>(&data_)) {
        return list->size();
    }
    if (const auto* list = std::get_if<List>(&data_)) {
        return list->size();
    }
    return 0;
}

std::vector<std::string> Value::elements() const {
    if (const auto* list = std::get_if<StringList>(&data_)) {
        return *list;
    }
    if (const auto* list = std::get_if<List>(&data_)) {
        std::vector<std::string> out;
        out.reserve(list->size());
        for (const auto& item : *list) {
            out.push_back(pgbind::toString(item));
        }
        return out;
    }
    if (isNull()) {
        return {};
    }
    return {toString()};
}

std::string Value::toString() const {
    if (isSequence()) {
        std::string out;
        bool first = true;
        for (const auto& item : elements()) {
            if (!first) {
                out += ',';
            }
            out += item;
            first = false;
        }
        return out;
    }
    return pgbind::toString(toScalar());
}

Scalar Value::toScalar() const {
    return std::visit(
        [](const auto& value) -> Scalar {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, StringList> || std::is_same_v<T, List>) {
                return nullptr;
            } else {
                return value;
            }
        },
        data_);
}

nlohmann::json Value::toJson() const {
    if (const auto* list = std::get_if<StringList>(&data_)) {
        return *list;
    }
    if (const auto* list = std::get_if<List>(&data_)) {
        auto out = nlohmann::json::array();
        for (const auto& item : *list) {
            out.push_back(scalarToJson(item));
        }
        return out;
    }
    return scalarToJson(toScalar());
}

} // namespace pgbind
