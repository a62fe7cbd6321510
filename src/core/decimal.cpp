#include <scalex/core/decimal.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace scalex {

namespace {

using Wide = __int128;

constexpr auto pow10(std::int32_t exp) -> Wide {
    Wide result = 1;
    for (std::int32_t i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

auto fits_int64(Wide value) -> bool {
    return value >= std::numeric_limits<std::int64_t>::min() &&
           value <= std::numeric_limits<std::int64_t>::max();
}

// Divides by 10^exp, rounding half away from zero.
auto shift_down(Wide value, std::int32_t exp) -> Wide {
    Wide divisor = pow10(exp);
    Wide quotient = value / divisor;
    Wide remainder = value % divisor;
    Wide twice = remainder < 0 ? -remainder * 2 : remainder * 2;
    if (twice >= divisor) {
        quotient += value < 0 ? -1 : 1;
    }
    return quotient;
}

auto make_checked(Wide unscaled, std::int32_t scale) -> std::optional<Decimal> {
    while (scale > Decimal::kMaxScale) {
        unscaled = shift_down(unscaled, 1);
        --scale;
    }
    if (!fits_int64(unscaled)) {
        return std::nullopt;
    }
    return Decimal{static_cast<std::int64_t>(unscaled), scale};
}

auto aligned(const Decimal& value, std::int32_t scale) -> Wide {
    return static_cast<Wide>(value.unscaled()) * pow10(scale - value.scale());
}

}  // namespace

auto Decimal::from_double(double value, std::int32_t scale) -> std::optional<Decimal> {
    if (!std::isfinite(value) || scale < 0 || scale > kMaxScale) {
        return std::nullopt;
    }
    double scaled = std::round(value * static_cast<double>(pow10(scale)));
    if (scaled < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
        scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return Decimal{static_cast<std::int64_t>(scaled), scale};
}

auto Decimal::parse(std::string_view text) -> std::optional<Decimal> {
    if (text.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    std::size_t pos = 0;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }
    Wide unscaled = 0;
    std::int32_t scale = 0;
    bool seen_point = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char ch = text[pos];
        if (ch == '.') {
            if (seen_point) {
                return std::nullopt;
            }
            seen_point = true;
            continue;
        }
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        seen_digit = true;
        if (seen_point) {
            if (scale == kMaxScale) {
                return std::nullopt;
            }
            ++scale;
        }
        unscaled = unscaled * 10 + (ch - '0');
        if (!fits_int64(unscaled)) {
            return std::nullopt;
        }
    }
    if (!seen_digit) {
        return std::nullopt;
    }
    return Decimal{static_cast<std::int64_t>(negative ? -unscaled : unscaled), scale};
}

auto Decimal::rescale(std::int32_t scale) const -> std::optional<Decimal> {
    if (scale < 0 || scale > kMaxScale) {
        return std::nullopt;
    }
    if (scale >= scale_) {
        return make_checked(aligned(*this, scale), scale);
    }
    return make_checked(shift_down(unscaled_, scale_ - scale), scale);
}

auto Decimal::normalized() const -> Decimal {
    std::int64_t unscaled = unscaled_;
    std::int32_t scale = scale_;
    while (scale > 0 && unscaled % 10 == 0) {
        unscaled /= 10;
        --scale;
    }
    return Decimal{unscaled, scale};
}

auto Decimal::to_double() const noexcept -> double {
    return static_cast<double>(unscaled_) / static_cast<double>(pow10(scale_));
}

auto Decimal::to_int() const noexcept -> std::int64_t {
    return static_cast<std::int64_t>(shift_down(unscaled_, scale_));
}

auto Decimal::to_string() const -> std::string {
    Wide magnitude = unscaled_ < 0 ? -static_cast<Wide>(unscaled_) : static_cast<Wide>(unscaled_);
    Wide divisor = pow10(scale_);
    auto int_part = static_cast<std::uint64_t>(magnitude / divisor);
    auto frac_part = static_cast<std::uint64_t>(magnitude % divisor);
    const char* sign = unscaled_ < 0 ? "-" : "";
    if (scale_ == 0) {
        return fmt::format("{}{}", sign, int_part);
    }
    return fmt::format("{}{}.{:0>{}}", sign, int_part, frac_part, scale_);
}

auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept -> bool {
    return (lhs <=> rhs) == std::strong_ordering::equal;
}

auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept -> std::strong_ordering {
    std::int32_t scale = std::max(lhs.scale(), rhs.scale());
    Wide l = aligned(lhs, scale);
    Wide r = aligned(rhs, scale);
    if (l < r) {
        return std::strong_ordering::less;
    }
    if (l > r) {
        return std::strong_ordering::greater;
    }
    return std::strong_ordering::equal;
}

auto decimal_add(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal> {
    std::int32_t scale = std::max(lhs.scale(), rhs.scale());
    return make_checked(aligned(lhs, scale) + aligned(rhs, scale), scale);
}

auto decimal_sub(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal> {
    std::int32_t scale = std::max(lhs.scale(), rhs.scale());
    return make_checked(aligned(lhs, scale) - aligned(rhs, scale), scale);
}

auto decimal_mul(const Decimal& lhs, const Decimal& rhs) -> std::optional<Decimal> {
    Wide product = static_cast<Wide>(lhs.unscaled()) * static_cast<Wide>(rhs.unscaled());
    return make_checked(product, lhs.scale() + rhs.scale());
}

}  // namespace scalex
