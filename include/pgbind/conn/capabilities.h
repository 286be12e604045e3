// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>
#include <pgbind/conn/op.h>
#include <pgbind/core/types.h>
#include <pgbind/driver/row.h>

#include <concepts>
#include <string>

namespace pgbind {

// Decodes one result row into itself
template <typename T>
concept Reader = requires(T& reader, const Row& row) {
    { reader.scan(row) } -> std::same_as<Result<void>>;
};

// A Reader that also takes the row count of a list
template <typename T>
concept ListReader = Reader<T> && requires(T& reader, const Row& row) {
    { reader.scanCount(row) } -> std::same_as<Result<void>>;
};

// Binds its fields for an insert (returning the statement) or a patch
template <typename T>
concept Writer = requires(const T& writer, Bind& bind) {
    { writer.insert(bind) } -> std::same_as<Result<std::string>>;
    { writer.patch(bind) } -> std::same_as<Result<void>>;
};

// Binds selection variables and returns the statement for an operation
template <typename T>
concept Selector = requires(const T& selector, Bind& bind, Op op) {
    { selector.select(bind, op) } -> std::same_as<Result<std::string>>;
};

} // namespace pgbind
