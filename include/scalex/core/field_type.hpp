#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace scalex {

/// Column/expression storage types.
enum class TypeCode : std::uint8_t {
    Unspecified,
    Tiny,
    Short,
    Int24,
    Long,
    LongLong,
    Year,
    Float,
    Double,
    NewDecimal,
    Varchar,
    String,
    Blob,
    Date,
    Datetime,
    Timestamp,
    Duration,
};

/// Evaluation category: selects which typed evaluator produces a node's value.
enum class EvalType : std::uint8_t {
    Int,
    Real,
    Decimal,
    String,
    Datetime,
    Duration,
};

namespace type_flag {

inline constexpr std::uint32_t kNotNull = 1U;
inline constexpr std::uint32_t kUnsigned = 1U << 5U;
inline constexpr std::uint32_t kBinary = 1U << 7U;

}  // namespace type_flag

inline constexpr int kUnspecifiedLength = -1;

/// Declared SQL type of an expression.
struct FieldType {
    TypeCode tp = TypeCode::Unspecified;
    std::uint32_t flag = 0;
    int flen = kUnspecifiedLength;
    int decimal = kUnspecifiedLength;

    [[nodiscard]] auto eval_type() const noexcept -> EvalType;
    [[nodiscard]] auto is_unsigned() const noexcept -> bool {
        return (flag & type_flag::kUnsigned) != 0;
    }
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const FieldType&) const -> bool = default;
};

/// Field type with the default display length and fraction for `tp`.
[[nodiscard]] auto new_field_type(TypeCode tp) -> FieldType;

/// Canonical result type for an evaluation category.
[[nodiscard]] auto field_type_for(EvalType et) -> FieldType;

[[nodiscard]] auto type_code_name(TypeCode tp) noexcept -> std::string_view;
[[nodiscard]] auto eval_type_name(EvalType et) noexcept -> std::string_view;

}  // namespace scalex
