#pragma once

#include <scalex/core/decimal.hpp>
#include <scalex/core/error.hpp>
#include <scalex/core/time.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace scalex {

/// Generic boxed value produced by row-at-a-time evaluation.
///
/// std::monostate is SQL NULL. Unsigned integers are boxed as std::uint64_t.
using Datum = std::variant<std::monostate, std::int64_t, std::uint64_t, double, std::string,
                           Decimal, Timestamp, Duration>;

/// Fraction digits kept when a double is converted to a decimal.
inline constexpr std::int32_t kDoubleToDecimalScale = 6;

[[nodiscard]] inline auto is_null(const Datum& datum) noexcept -> bool {
    return std::holds_alternative<std::monostate>(datum);
}

[[nodiscard]] auto datum_kind_name(const Datum& datum) noexcept -> std::string_view;

/// Display form; NULL renders as `NULL`.
[[nodiscard]] auto datum_to_string(const Datum& datum) -> std::string;

// ─── Category conversions ─────────────────────────────────────────────────────
//  Each conversion expects a non-null datum and fails with TypeMismatch (or
//  InvalidArgumentType / Overflow for unconvertible text and out-of-range values).

[[nodiscard]] auto datum_as_int(const Datum& datum) -> Result<std::int64_t>;
[[nodiscard]] auto datum_as_real(const Datum& datum) -> Result<double>;
[[nodiscard]] auto datum_as_string(const Datum& datum) -> Result<std::string>;
[[nodiscard]] auto datum_as_decimal(const Datum& datum) -> Result<Decimal>;
[[nodiscard]] auto datum_as_timestamp(const Datum& datum) -> Result<Timestamp>;
[[nodiscard]] auto datum_as_duration(const Datum& datum) -> Result<Duration>;

/// Dispatches to the datum_as_* conversion producing T.
template <typename T>
[[nodiscard]] auto datum_as(const Datum& datum) -> Result<T> {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return datum_as_int(datum);
    } else if constexpr (std::is_same_v<T, double>) {
        return datum_as_real(datum);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return datum_as_string(datum);
    } else if constexpr (std::is_same_v<T, Decimal>) {
        return datum_as_decimal(datum);
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return datum_as_timestamp(datum);
    } else {
        static_assert(std::is_same_v<T, Duration>, "unsupported datum conversion");
        return datum_as_duration(datum);
    }
}

}  // namespace scalex
