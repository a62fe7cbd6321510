#include <scalex/core/datum.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

namespace scalex {

namespace {

template <typename T>
auto parse_number(std::string_view text, T& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto mismatch(const Datum& datum, std::string_view target) -> std::unexpected<Error> {
    return make_error(ErrorCode::TypeMismatch, "cannot convert {} value '{}' to {}",
                      datum_kind_name(datum), datum_to_string(datum), target);
}

}  // namespace

auto datum_kind_name(const Datum& datum) noexcept -> std::string_view {
    switch (datum.index()) {
        case 0:
            return "null";
        case 1:
            return "int";
        case 2:
            return "uint";
        case 3:
            return "real";
        case 4:
            return "string";
        case 5:
            return "decimal";
        case 6:
            return "datetime";
        case 7:
            return "duration";
        default:
            return "unknown";
    }
}

auto datum_to_string(const Datum& datum) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, Duration>) {
                return format_duration(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        datum);
}

auto datum_as_int(const Datum& datum) -> Result<std::int64_t> {
    if (const auto* v = std::get_if<std::int64_t>(&datum)) {
        return *v;
    }
    if (const auto* v = std::get_if<std::uint64_t>(&datum)) {
        return static_cast<std::int64_t>(*v);
    }
    if (const auto* v = std::get_if<double>(&datum)) {
        double rounded = std::round(*v);
        if (!std::isfinite(rounded) ||
            rounded < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
            rounded >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return make_error(ErrorCode::Overflow, "BIGINT value is out of range in '{}'", *v);
        }
        return static_cast<std::int64_t>(rounded);
    }
    if (const auto* v = std::get_if<Decimal>(&datum)) {
        return v->to_int();
    }
    if (const auto* v = std::get_if<std::string>(&datum)) {
        std::int64_t out = 0;
        if (!parse_number(*v, out)) {
            return make_error(ErrorCode::InvalidArgumentType,
                              "Truncated incorrect INTEGER value: '{}'", *v);
        }
        return out;
    }
    return mismatch(datum, "int");
}

auto datum_as_real(const Datum& datum) -> Result<double> {
    if (const auto* v = std::get_if<double>(&datum)) {
        return *v;
    }
    if (const auto* v = std::get_if<std::int64_t>(&datum)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<std::uint64_t>(&datum)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<Decimal>(&datum)) {
        return v->to_double();
    }
    if (const auto* v = std::get_if<std::string>(&datum)) {
        double out = 0.0;
        if (!parse_number(*v, out)) {
            return make_error(ErrorCode::InvalidArgumentType,
                              "Truncated incorrect DOUBLE value: '{}'", *v);
        }
        return out;
    }
    return mismatch(datum, "real");
}

auto datum_as_string(const Datum& datum) -> Result<std::string> {
    if (is_null(datum)) {
        return mismatch(datum, "string");
    }
    return datum_to_string(datum);
}

auto datum_as_decimal(const Datum& datum) -> Result<Decimal> {
    if (const auto* v = std::get_if<Decimal>(&datum)) {
        return *v;
    }
    if (const auto* v = std::get_if<std::int64_t>(&datum)) {
        return Decimal::from_int(*v);
    }
    if (const auto* v = std::get_if<std::uint64_t>(&datum)) {
        if (*v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return make_error(ErrorCode::Overflow, "DECIMAL value is out of range in '{}'", *v);
        }
        return Decimal::from_int(static_cast<std::int64_t>(*v));
    }
    if (const auto* v = std::get_if<double>(&datum)) {
        auto dec = Decimal::from_double(*v, kDoubleToDecimalScale);
        if (!dec) {
            return make_error(ErrorCode::Overflow, "DECIMAL value is out of range in '{}'", *v);
        }
        return *dec;
    }
    if (const auto* v = std::get_if<std::string>(&datum)) {
        auto dec = Decimal::parse(*v);
        if (!dec) {
            return make_error(ErrorCode::InvalidArgumentType,
                              "Truncated incorrect DECIMAL value: '{}'", *v);
        }
        return *dec;
    }
    return mismatch(datum, "decimal");
}

auto datum_as_timestamp(const Datum& datum) -> Result<Timestamp> {
    if (const auto* v = std::get_if<Timestamp>(&datum)) {
        return *v;
    }
    return mismatch(datum, "datetime");
}

auto datum_as_duration(const Datum& datum) -> Result<Duration> {
    if (const auto* v = std::get_if<Duration>(&datum)) {
        return *v;
    }
    return mismatch(datum, "duration");
}

}  // namespace scalex
