#include <scalex/expression/builtins.hpp>

#include "builtin_util.hpp"

#include <cmath>
#include <limits>

namespace scalex::expression {

namespace {

using detail::BinaryFunction;
using detail::UnaryFunction;

constexpr auto kInt64Min = std::numeric_limits<std::int64_t>::min();

auto bigint_out_of_range(std::string_view op, auto lhs, auto rhs) -> std::unexpected<Error> {
    return make_error(ErrorCode::Overflow, "BIGINT value is out of range in '({} {} {})'", lhs, op,
                      rhs);
}

auto decimal_out_of_range(std::string_view op, const Decimal& lhs, const Decimal& rhs)
    -> std::unexpected<Error> {
    return make_error(ErrorCode::Overflow, "DECIMAL value is out of range in '({} {} {})'",
                      lhs.to_string(), op, rhs.to_string());
}

auto int_type(bool is_unsigned) -> FieldType {
    auto type = new_field_type(TypeCode::LongLong);
    if (is_unsigned) {
        type.flag |= type_flag::kUnsigned;
    }
    return type;
}

auto decimal_type(int scale) -> FieldType {
    auto type = new_field_type(TypeCode::NewDecimal);
    type.decimal = std::min(scale, static_cast<int>(Decimal::kMaxScale));
    return type;
}

auto arg_scale(const ExprPtr& arg) -> int {
    const auto& type = arg->type();
    if (type.eval_type() != EvalType::Decimal || type.decimal < 0) {
        return 0;
    }
    return type.decimal;
}

// ─── plus / minus / mul ───────────────────────────────────────────────────────
//  Integer signatures compute in uint64 when the result type is unsigned.

class PlusInt final : public BinaryFunction<PlusInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::PlusInt;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(std::int64_t a, std::int64_t b) const -> EvalResult<std::int64_t> {
        if (ret_type().is_unsigned()) {
            std::uint64_t out = 0;
            const auto ua = static_cast<std::uint64_t>(a);
            const auto ub = static_cast<std::uint64_t>(b);
            if (__builtin_add_overflow(ua, ub, &out)) {
                return bigint_out_of_range("+", ua, ub);
            }
            return static_cast<std::int64_t>(out);
        }
        std::int64_t out = 0;
        if (__builtin_add_overflow(a, b, &out)) {
            return bigint_out_of_range("+", a, b);
        }
        return out;
    }
};

class PlusReal final : public BinaryFunction<PlusReal, double> {
   public:
    static constexpr Signature kSig = Signature::PlusReal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(double a, double b) const -> EvalResult<double> {
        const double out = a + b;
        if (std::isinf(out)) {
            return make_error(ErrorCode::Overflow, "DOUBLE value is out of range in '({} + {})'",
                              a, b);
        }
        return out;
    }
};

class PlusDecimal final : public BinaryFunction<PlusDecimal, Decimal> {
   public:
    static constexpr Signature kSig = Signature::PlusDecimal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(const Decimal& a, const Decimal& b) const -> EvalResult<Decimal> {
        auto out = decimal_add(a, b);
        if (!out) {
            return decimal_out_of_range("+", a, b);
        }
        return out;
    }
};

class MinusInt final : public BinaryFunction<MinusInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::MinusInt;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(std::int64_t a, std::int64_t b) const -> EvalResult<std::int64_t> {
        if (ret_type().is_unsigned()) {
            std::uint64_t out = 0;
            const auto ua = static_cast<std::uint64_t>(a);
            const auto ub = static_cast<std::uint64_t>(b);
            if (__builtin_sub_overflow(ua, ub, &out)) {
                return bigint_out_of_range("-", ua, ub);
            }
            return static_cast<std::int64_t>(out);
        }
        std::int64_t out = 0;
        if (__builtin_sub_overflow(a, b, &out)) {
            return bigint_out_of_range("-", a, b);
        }
        return out;
    }
};

class MinusReal final : public BinaryFunction<MinusReal, double> {
   public:
    static constexpr Signature kSig = Signature::MinusReal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(double a, double b) const -> EvalResult<double> {
        const double out = a - b;
        if (std::isinf(out)) {
            return make_error(ErrorCode::Overflow, "DOUBLE value is out of range in '({} - {})'",
                              a, b);
        }
        return out;
    }
};

class MinusDecimal final : public BinaryFunction<MinusDecimal, Decimal> {
   public:
    static constexpr Signature kSig = Signature::MinusDecimal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(const Decimal& a, const Decimal& b) const -> EvalResult<Decimal> {
        auto out = decimal_sub(a, b);
        if (!out) {
            return decimal_out_of_range("-", a, b);
        }
        return out;
    }
};

class MulInt final : public BinaryFunction<MulInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::MulInt;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(std::int64_t a, std::int64_t b) const -> EvalResult<std::int64_t> {
        if (ret_type().is_unsigned()) {
            std::uint64_t out = 0;
            const auto ua = static_cast<std::uint64_t>(a);
            const auto ub = static_cast<std::uint64_t>(b);
            if (__builtin_mul_overflow(ua, ub, &out)) {
                return bigint_out_of_range("*", ua, ub);
            }
            return static_cast<std::int64_t>(out);
        }
        std::int64_t out = 0;
        if (__builtin_mul_overflow(a, b, &out)) {
            return bigint_out_of_range("*", a, b);
        }
        return out;
    }
};

class MulReal final : public BinaryFunction<MulReal, double> {
   public:
    static constexpr Signature kSig = Signature::MulReal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(double a, double b) const -> EvalResult<double> {
        const double out = a * b;
        if (std::isinf(out)) {
            return make_error(ErrorCode::Overflow, "DOUBLE value is out of range in '({} * {})'",
                              a, b);
        }
        return out;
    }
};

class MulDecimal final : public BinaryFunction<MulDecimal, Decimal> {
   public:
    static constexpr Signature kSig = Signature::MulDecimal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(const Decimal& a, const Decimal& b) const -> EvalResult<Decimal> {
        auto out = decimal_mul(a, b);
        if (!out) {
            return decimal_out_of_range("*", a, b);
        }
        return out;
    }
};

// ─── div / intdiv / mod ───────────────────────────────────────────────────────

class DivReal final : public BinaryFunction<DivReal, double> {
   public:
    static constexpr Signature kSig = Signature::DivReal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(double a, double b) const -> EvalResult<double> {
        if (b == 0.0) {
            return detail::division_by_zero<double>(*this);
        }
        return a / b;
    }
};

class IntDivInt final : public BinaryFunction<IntDivInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::IntDivInt;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(std::int64_t a, std::int64_t b) const -> EvalResult<std::int64_t> {
        if (b == 0) {
            return detail::division_by_zero<std::int64_t>(*this);
        }
        if (ret_type().is_unsigned()) {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) /
                                             static_cast<std::uint64_t>(b));
        }
        if (a == kInt64Min && b == -1) {
            return bigint_out_of_range("DIV", a, b);
        }
        return a / b;
    }
};

class ModInt final : public BinaryFunction<ModInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::ModInt;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(std::int64_t a, std::int64_t b) const -> EvalResult<std::int64_t> {
        if (b == 0) {
            return detail::division_by_zero<std::int64_t>(*this);
        }
        if (ret_type().is_unsigned()) {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) %
                                             static_cast<std::uint64_t>(b));
        }
        if (b == -1) {
            return std::int64_t{0};
        }
        return a % b;
    }
};

class ModReal final : public BinaryFunction<ModReal, double> {
   public:
    static constexpr Signature kSig = Signature::ModReal;
    using BinaryFunction::BinaryFunction;

    [[nodiscard]] auto compute(double a, double b) const -> EvalResult<double> {
        if (b == 0.0) {
            return detail::division_by_zero<double>(*this);
        }
        return std::fmod(a, b);
    }
};

// ─── abs / bitneg ─────────────────────────────────────────────────────────────

class AbsInt final : public UnaryFunction<AbsInt, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::AbsInt;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(std::int64_t a) const -> EvalResult<std::int64_t> {
        if (ret_type().is_unsigned() || a >= 0) {
            return a;
        }
        if (a == kInt64Min) {
            return make_error(ErrorCode::Overflow, "BIGINT value is out of range in 'abs({})'", a);
        }
        return -a;
    }
};

class AbsReal final : public UnaryFunction<AbsReal, double> {
   public:
    static constexpr Signature kSig = Signature::AbsReal;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(double a) const -> EvalResult<double> { return std::fabs(a); }
};

class AbsDecimal final : public UnaryFunction<AbsDecimal, Decimal> {
   public:
    static constexpr Signature kSig = Signature::AbsDecimal;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const Decimal& a) const -> EvalResult<Decimal> {
        if (a.unscaled() >= 0) {
            return a;
        }
        if (a.unscaled() == kInt64Min) {
            return make_error(ErrorCode::Overflow, "DECIMAL value is out of range in 'abs({})'",
                              a.to_string());
        }
        return Decimal(-a.unscaled(), a.scale());
    }
};

/// Bitwise NOT; the result is always unsigned.
class BitNeg final : public UnaryFunction<BitNeg, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::BitNeg;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(std::int64_t a) const -> EvalResult<std::int64_t> { return ~a; }
};

// ─── Constructors ─────────────────────────────────────────────────────────────

template <typename IntFn, typename RealFn, typename DecimalFn>
auto make_additive(std::string_view name) -> BuiltinConstructor {
    return [name](session::SessionContext& ctx,
                  std::vector<ExprPtr> args) -> Result<std::unique_ptr<BuiltinFunction>> {
        auto category = detail::numeric_category(name, args);
        if (!category) {
            return std::unexpected(category.error());
        }
        switch (*category) {
            case EvalType::Int: {
                const bool is_unsigned = detail::all_unsigned(args);
                return detail::make_builtin<IntFn>(ctx, std::move(args), int_type(is_unsigned));
            }
            case EvalType::Decimal: {
                int scale = 0;
                if constexpr (std::is_same_v<DecimalFn, MulDecimal>) {
                    scale = arg_scale(args[0]) + arg_scale(args[1]);
                } else {
                    scale = std::max(arg_scale(args[0]), arg_scale(args[1]));
                }
                return detail::make_builtin<DecimalFn>(ctx, std::move(args), decimal_type(scale));
            }
            default:
                return detail::make_builtin<RealFn>(ctx, std::move(args),
                                                    new_field_type(TypeCode::Double));
        }
    };
}

template <typename IntFn, typename RealFn>
auto make_modular(std::string_view name) -> BuiltinConstructor {
    return [name](session::SessionContext& ctx,
                  std::vector<ExprPtr> args) -> Result<std::unique_ptr<BuiltinFunction>> {
        auto category = detail::numeric_category(name, args);
        if (!category) {
            return std::unexpected(category.error());
        }
        if (*category == EvalType::Int) {
            const bool is_unsigned = detail::all_unsigned(args);
            return detail::make_builtin<IntFn>(ctx, std::move(args), int_type(is_unsigned));
        }
        return detail::make_builtin<RealFn>(ctx, std::move(args),
                                            new_field_type(TypeCode::Double));
    };
}

auto make_div(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("div", args); !category) {
        return std::unexpected(category.error());
    }
    return detail::make_builtin<DivReal>(ctx, std::move(args), new_field_type(TypeCode::Double));
}

auto make_intdiv(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("intdiv", args); !category) {
        return std::unexpected(category.error());
    }
    const bool is_unsigned = detail::all_unsigned(args);
    return detail::make_builtin<IntDivInt>(ctx, std::move(args), int_type(is_unsigned));
}

auto make_abs(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    auto category = detail::numeric_category("abs", args);
    if (!category) {
        return std::unexpected(category.error());
    }
    switch (*category) {
        case EvalType::Int: {
            const bool is_unsigned = detail::all_unsigned(args);
            return detail::make_builtin<AbsInt>(ctx, std::move(args), int_type(is_unsigned));
        }
        case EvalType::Decimal: {
            const int scale = arg_scale(args[0]);
            return detail::make_builtin<AbsDecimal>(ctx, std::move(args), decimal_type(scale));
        }
        default:
            return detail::make_builtin<AbsReal>(ctx, std::move(args),
                                                 new_field_type(TypeCode::Double));
    }
}

auto make_bitneg(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("bitneg", args); !category) {
        return std::unexpected(category.error());
    }
    return detail::make_builtin<BitNeg>(ctx, std::move(args), int_type(true));
}

}  // namespace

void register_arithmetic_functions(FunctionRegistry& registry) {
    registry.register_function("plus", 2, 2, make_additive<PlusInt, PlusReal, PlusDecimal>("plus"));
    registry.register_function("minus", 2, 2,
                               make_additive<MinusInt, MinusReal, MinusDecimal>("minus"));
    registry.register_function("mul", 2, 2, make_additive<MulInt, MulReal, MulDecimal>("mul"));
    registry.register_function("div", 2, 2, make_div);
    registry.register_function("intdiv", 2, 2, make_intdiv);
    registry.register_function("mod", 2, 2, make_modular<ModInt, ModReal>("mod"));
    registry.register_function("abs", 1, 1, make_abs);
    registry.register_function("bitneg", 1, 1, make_bitneg);
}

}  // namespace scalex::expression
