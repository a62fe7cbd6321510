#include <scalex/core/field_type.hpp>

#include <fmt/format.h>

namespace scalex {

auto FieldType::eval_type() const noexcept -> EvalType {
    switch (tp) {
        case TypeCode::Tiny:
        case TypeCode::Short:
        case TypeCode::Int24:
        case TypeCode::Long:
        case TypeCode::LongLong:
        case TypeCode::Year:
            return EvalType::Int;
        case TypeCode::Float:
        case TypeCode::Double:
            return EvalType::Real;
        case TypeCode::NewDecimal:
            return EvalType::Decimal;
        case TypeCode::Date:
        case TypeCode::Datetime:
        case TypeCode::Timestamp:
            return EvalType::Datetime;
        case TypeCode::Duration:
            return EvalType::Duration;
        default:
            return EvalType::String;
    }
}

auto FieldType::to_string() const -> std::string {
    std::string out{type_code_name(tp)};
    if (flen != kUnspecifiedLength) {
        if (decimal != kUnspecifiedLength && decimal > 0) {
            out += fmt::format("({},{})", flen, decimal);
        } else {
            out += fmt::format("({})", flen);
        }
    }
    if (is_unsigned()) {
        out += " unsigned";
    }
    if ((flag & type_flag::kNotNull) != 0) {
        out += " not null";
    }
    return out;
}

auto new_field_type(TypeCode tp) -> FieldType {
    FieldType ft{.tp = tp};
    switch (tp) {
        case TypeCode::Tiny:
            ft.flen = 4;
            break;
        case TypeCode::Short:
            ft.flen = 6;
            break;
        case TypeCode::Int24:
            ft.flen = 9;
            break;
        case TypeCode::Long:
            ft.flen = 11;
            break;
        case TypeCode::LongLong:
            ft.flen = 20;
            break;
        case TypeCode::Year:
            ft.flen = 4;
            break;
        case TypeCode::Float:
            ft.flen = 12;
            break;
        case TypeCode::Double:
            ft.flen = 22;
            break;
        case TypeCode::NewDecimal:
            ft.flen = 19;
            ft.decimal = 0;
            break;
        case TypeCode::Date:
            ft.flen = 10;
            ft.decimal = 0;
            break;
        case TypeCode::Datetime:
        case TypeCode::Timestamp:
            ft.flen = 26;
            ft.decimal = 6;
            break;
        case TypeCode::Duration:
            ft.flen = 17;
            ft.decimal = 6;
            break;
        default:
            break;
    }
    return ft;
}

auto field_type_for(EvalType et) -> FieldType {
    switch (et) {
        case EvalType::Int:
            return new_field_type(TypeCode::LongLong);
        case EvalType::Real:
            return new_field_type(TypeCode::Double);
        case EvalType::Decimal:
            return new_field_type(TypeCode::NewDecimal);
        case EvalType::String:
            return new_field_type(TypeCode::Varchar);
        case EvalType::Datetime:
            return new_field_type(TypeCode::Datetime);
        case EvalType::Duration:
            return new_field_type(TypeCode::Duration);
    }
    return new_field_type(TypeCode::Unspecified);
}

auto type_code_name(TypeCode tp) noexcept -> std::string_view {
    switch (tp) {
        case TypeCode::Unspecified:
            return "unspecified";
        case TypeCode::Tiny:
            return "tinyint";
        case TypeCode::Short:
            return "smallint";
        case TypeCode::Int24:
            return "mediumint";
        case TypeCode::Long:
            return "int";
        case TypeCode::LongLong:
            return "bigint";
        case TypeCode::Year:
            return "year";
        case TypeCode::Float:
            return "float";
        case TypeCode::Double:
            return "double";
        case TypeCode::NewDecimal:
            return "decimal";
        case TypeCode::Varchar:
            return "varchar";
        case TypeCode::String:
            return "char";
        case TypeCode::Blob:
            return "blob";
        case TypeCode::Date:
            return "date";
        case TypeCode::Datetime:
            return "datetime";
        case TypeCode::Timestamp:
            return "timestamp";
        case TypeCode::Duration:
            return "time";
    }
    return "unknown";
}

auto eval_type_name(EvalType et) noexcept -> std::string_view {
    switch (et) {
        case EvalType::Int:
            return "int";
        case EvalType::Real:
            return "real";
        case EvalType::Decimal:
            return "decimal";
        case EvalType::String:
            return "string";
        case EvalType::Datetime:
            return "datetime";
        case EvalType::Duration:
            return "duration";
    }
    return "unknown";
}

}  // namespace scalex
