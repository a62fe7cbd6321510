#include <scalex/expression/builtins.hpp>

#include "builtin_util.hpp"

#include <chrono>

namespace scalex::expression {

namespace {

constexpr std::int32_t kNanosScale = 9;
constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
/// Largest TIME magnitude, 838:59:59.
constexpr std::int64_t kMaxDurationNanos = (838LL * 3600 + 59 * 60 + 59) * kNanosPerSecond;

/// Current instant in the session time zone, truncated to whole seconds.
auto session_now(const session::SessionContext& ctx) -> Timestamp {
    using namespace std::chrono;
    const auto now = floor<seconds>(system_clock::now()) + ctx.vars().time_zone_offset;
    return Timestamp{duration_cast<nanoseconds>(now.time_since_epoch()).count()};
}

/// Seconds expressed as a decimal, converted to nanoseconds.
auto seconds_to_nanos(const Decimal& seconds) -> std::optional<std::int64_t> {
    auto scaled = seconds.rescale(kNanosScale);
    if (!scaled) {
        return std::nullopt;
    }
    return scaled->unscaled();
}

/// Statement-level current time; folded once per construction.
class Now final : public TypedFunction<Now, Timestamp> {
   public:
    static constexpr Signature kSig = Signature::Now;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& /*row*/) const -> EvalResult<Timestamp> {
        return session_now(context());
    }
};

/// Current time at the moment of evaluation.
class Sysdate final : public TypedFunction<Sysdate, Timestamp> {
   public:
    static constexpr Signature kSig = Signature::Sysdate;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& /*row*/) const -> EvalResult<Timestamp> {
        return session_now(context());
    }
};

/// Unix seconds to a session-local timestamp; negative input yields NULL.
class FromUnixTime final : public detail::UnaryFunction<FromUnixTime, Timestamp, Decimal> {
   public:
    static constexpr Signature kSig = Signature::FromUnixTime;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const Decimal& seconds) const -> EvalResult<Timestamp> {
        if (seconds.unscaled() < 0) {
            return std::optional<Timestamp>{};
        }
        auto nanos = seconds_to_nanos(seconds);
        const auto offset =
            std::chrono::duration_cast<std::chrono::nanoseconds>(context().vars().time_zone_offset)
                .count();
        std::int64_t local = 0;
        if (!nanos || __builtin_add_overflow(*nanos, offset, &local)) {
            return make_error(ErrorCode::Overflow, "DATETIME value is out of range in '{}'",
                              seconds.to_string());
        }
        return Timestamp{local};
    }
};

class TimeDiff final : public detail::BinaryFunction<TimeDiff, Duration, Timestamp> {
   public:
    static constexpr Signature kSig = Signature::TimeDiff;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(const Timestamp& a, const Timestamp& b) const
        -> EvalResult<Duration> {
        std::int64_t diff = 0;
        if (__builtin_sub_overflow(a.nanos, b.nanos, &diff)) {
            return make_error(ErrorCode::Overflow, "TIME value is out of range in 'timediff'");
        }
        return Duration{diff};
    }
};

/// Seconds to a TIME value, clamped to +/-838:59:59 with a warning.
class SecToTime final : public detail::UnaryFunction<SecToTime, Duration, Decimal> {
   public:
    static constexpr Signature kSig = Signature::SecToTime;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const Decimal& seconds) const -> EvalResult<Duration> {
        auto nanos = seconds_to_nanos(seconds);
        std::int64_t value = 0;
        if (!nanos || *nanos > kMaxDurationNanos || *nanos < -kMaxDurationNanos) {
            value = seconds.unscaled() < 0 ? -kMaxDurationNanos : kMaxDurationNanos;
            context().stmt().append_warning(
                Error{.code = ErrorCode::Overflow,
                      .message = fmt::format("Truncated incorrect time value: '{}'",
                                             seconds.to_string())});
        } else {
            value = *nanos;
        }
        return Duration{value};
    }
};

auto make_now(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    return detail::make_builtin<Now>(ctx, std::move(args), new_field_type(TypeCode::Datetime));
}

auto make_sysdate(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    return detail::make_builtin<Sysdate>(ctx, std::move(args), new_field_type(TypeCode::Datetime));
}

auto make_from_unixtime(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("from_unixtime", args); !category) {
        return std::unexpected(category.error());
    }
    return detail::make_builtin<FromUnixTime>(ctx, std::move(args),
                                              new_field_type(TypeCode::Datetime));
}

auto make_timediff(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    for (const auto& arg : args) {
        if (detail::arg_category(arg) != EvalType::Datetime) {
            return make_error(ErrorCode::InvalidArgumentType,
                              "timediff: {} argument {} is not a datetime",
                              eval_type_name(detail::arg_category(arg)), arg->to_string());
        }
    }
    return detail::make_builtin<TimeDiff>(ctx, std::move(args), new_field_type(TypeCode::Duration));
}

auto make_sec_to_time(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("sec_to_time", args); !category) {
        return std::unexpected(category.error());
    }
    return detail::make_builtin<SecToTime>(ctx, std::move(args),
                                           new_field_type(TypeCode::Duration));
}

}  // namespace

void register_time_functions(FunctionRegistry& registry) {
    registry.register_function("now", 0, 0, make_now);
    registry.register_function("sysdate", 0, 0, make_sysdate);
    registry.register_function("from_unixtime", 1, 1, make_from_unixtime);
    registry.register_function("timediff", 2, 2, make_timediff);
    registry.register_function("sec_to_time", 1, 1, make_sec_to_time);
}

}  // namespace scalex::expression
