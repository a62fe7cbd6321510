#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scalex {

/// Fixed-point decimal: a 64-bit unscaled integer and a base-10 scale in [0, kMaxScale].
///
/// Arithmetic is checked; every operation that could leave the 64-bit range returns
/// std::nullopt instead of wrapping.
class Decimal {
   public:
    static constexpr std::int32_t kMaxScale = 18;

    Decimal() = default;

    /// `scale` must be within [0, kMaxScale].
    Decimal(std::int64_t unscaled, std::int32_t scale) : unscaled_(unscaled), scale_(scale) {}

    [[nodiscard]] static auto from_int(std::int64_t value) noexcept -> Decimal {
        return Decimal{value, 0};
    }

    /// Rounds half away from zero to `scale` fractional digits.
    [[nodiscard]] static auto from_double(double value, std::int32_t scale)
        -> std::optional<Decimal>;

    /// Parses `[+-]digits[.digits]`.
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Decimal>;

    [[nodiscard]] auto unscaled() const noexcept -> std::int64_t { return unscaled_; }
    [[nodiscard]] auto scale() const noexcept -> std::int32_t { return scale_; }

    /// Changes the scale, rounding half away from zero when digits are dropped.
    [[nodiscard]] auto rescale(std::int32_t scale) const -> std::optional<Decimal>;

    /// Same value with trailing fractional zeros removed.
    [[nodiscard]] auto normalized() const -> Decimal;

    [[nodiscard]] auto to_double() const noexcept -> double;

    /// Rounds half away from zero.
    [[nodiscard]] auto to_int() const noexcept -> std::int64_t;

    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept -> bool;
    friend auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
        -> std::strong_ordering;

   private:
    std::int64_t unscaled_ = 0;
    std::int32_t scale_ = 0;
};

[[nodiscard]] auto decimal_add(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal>;
[[nodiscard]] auto decimal_sub(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal>;
[[nodiscard]] auto decimal_mul(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal>;

}  // namespace scalex
