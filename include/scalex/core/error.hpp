#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace scalex {

/// Error categories surfaced by construction, evaluation and rewriting.
enum class ErrorCode : std::uint8_t {
    InvalidReturnType,
    FunctionNotFound,
    IncorrectParameterCount,
    InvalidArgumentType,
    UnsupportedEvalType,
    Overflow,
    DivisionByZero,
    ColumnNotFound,
    EmptyRow,
    TypeMismatch,
};

/// Error with a category and a human-readable message.
struct Error {
    ErrorCode code = ErrorCode::TypeMismatch;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto error_code_name(ErrorCode code) noexcept -> std::string_view;

/// Result type for fallible operations.
template <typename T>
using Result = std::expected<T, Error>;

/// Result type for fallible operations without a value.
using Status = std::expected<void, Error>;

template <typename... Args>
[[nodiscard]] auto make_error(ErrorCode code, fmt::format_string<Args...> format, Args&&... args)
    -> std::unexpected<Error> {
    return std::unexpected(
        Error{.code = code, .message = fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace scalex
