// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pgbind {

// Error types
enum class ErrorCode {
    Success = 0,
    NotFound,
    NotImplemented,
    BadParameter,
    NoRows,
    InvalidArgument,
    InvalidState,
    InvalidData,
    DatabaseError,
    ConnectionFailed,
    TransactionFailed,
    OperationCancelled,
    Timeout,
    ResourceExhausted,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotImplemented: return "Not implemented";
        case ErrorCode::BadParameter: return "Bad parameter";
        case ErrorCode::NoRows: return "No rows in result set";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::Success; }

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

    // Success or failure as an Error (code Success when the result holds no error)
    [[nodiscard]] const Error& status() const noexcept { return error_; }

private:
    Error error_{ErrorCode::Success, ""};
};

/**
 * @brief Combine two errors so that neither masks the other
 *
 * A successful side yields the other side unchanged. When both failed the first code is kept
 * and the messages are joined by a newline.
 */
inline Error joinErrors(Error first, const Error& second) {
    if (second.ok()) {
        return first;
    }
    if (first.ok()) {
        return second;
    }
    first.message += "\n";
    first.message += second.message;
    return first;
}

inline Result<void> joinErrors(const Result<void>& first, const Result<void>& second) {
    Error joined = joinErrors(first.status(), second.status());
    if (joined.ok()) {
        return {};
    }
    return joined;
}

// Translate the driver-level "zero rows" error into NotFound
inline Error notFound(Error error) {
    if (error.code == ErrorCode::NoRows) {
        return Error{ErrorCode::NotFound};
    }
    return error;
}

inline Result<void> notFound(const Result<void>& result) {
    if (result) {
        return {};
    }
    return notFound(result.error());
}

} // namespace pgbind

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<pgbind::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(pgbind::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", pgbind::errorToString(error));
    }
};
