#include <scalex/core/error.hpp>

namespace scalex {

auto error_code_name(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidReturnType:
            return "InvalidReturnType";
        case ErrorCode::FunctionNotFound:
            return "FunctionNotFound";
        case ErrorCode::IncorrectParameterCount:
            return "IncorrectParameterCount";
        case ErrorCode::InvalidArgumentType:
            return "InvalidArgumentType";
        case ErrorCode::UnsupportedEvalType:
            return "UnsupportedEvalType";
        case ErrorCode::Overflow:
            return "Overflow";
        case ErrorCode::DivisionByZero:
            return "DivisionByZero";
        case ErrorCode::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorCode::EmptyRow:
            return "EmptyRow";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("[{}] {}", error_code_name(code), message);
}

}  // namespace scalex
