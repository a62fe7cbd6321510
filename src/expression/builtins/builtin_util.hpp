#pragma once

#include <scalex/expression/builtin.hpp>
#include <scalex/expression/function_registry.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

namespace scalex::expression::detail {

[[nodiscard]] inline auto arg_category(const ExprPtr& arg) -> EvalType {
    return arg->type().eval_type();
}

[[nodiscard]] inline auto all_unsigned(const std::vector<ExprPtr>& args) -> bool {
    return std::ranges::all_of(args, [](const ExprPtr& arg) {
        return arg->type().eval_type() == EvalType::Int && arg->type().is_unsigned();
    });
}

/// Category numeric arguments are computed in: Real when any argument is real or text,
/// Decimal when any is decimal, Int otherwise. Temporal arguments are rejected.
[[nodiscard]] inline auto numeric_category(std::string_view fn, const std::vector<ExprPtr>& args)
    -> Result<EvalType> {
    bool any_real = false;
    bool any_decimal = false;
    for (const auto& arg : args) {
        switch (arg_category(arg)) {
            case EvalType::Int:
                break;
            case EvalType::Real:
            case EvalType::String:
                any_real = true;
                break;
            case EvalType::Decimal:
                any_decimal = true;
                break;
            case EvalType::Datetime:
            case EvalType::Duration:
                return make_error(ErrorCode::InvalidArgumentType,
                                  "{}: {} argument {} is not numeric", fn,
                                  eval_type_name(arg_category(arg)), arg->to_string());
        }
    }
    if (any_real) {
        return EvalType::Real;
    }
    return any_decimal ? EvalType::Decimal : EvalType::Int;
}

/// NULL plus a statement warning, or an error when the session asks for one.
template <typename T>
[[nodiscard]] auto division_by_zero(const BuiltinFunction& fn) -> EvalResult<T> {
    auto& ctx = fn.context();
    if (ctx.vars().error_on_division_by_zero) {
        return make_error(ErrorCode::DivisionByZero, "Division by 0");
    }
    ctx.stmt().append_warning(Error{.code = ErrorCode::DivisionByZero, .message = "Division by 0"});
    return std::optional<T>{};
}

template <typename F>
[[nodiscard]] auto make_builtin(session::SessionContext& ctx, std::vector<ExprPtr> args,
                                FieldType ret_type) -> Result<std::unique_ptr<BuiltinFunction>> {
    return std::unique_ptr<BuiltinFunction>(
        std::make_unique<F>(ctx, std::move(args), ret_type));
}

/// Function of one argument of category In; NULL in, NULL out.
///
/// `Derived` provides `compute(const In&) const -> EvalResult<T>`.
template <typename Derived, typename T, typename In = T>
class UnaryFunction : public TypedFunction<Derived, T> {
   public:
    using TypedFunction<Derived, T>::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& row) const -> EvalResult<T> {
        auto a = this->template eval_arg<In>(0, row);
        if (!a) {
            return std::unexpected(a.error());
        }
        if (!a->has_value()) {
            return std::optional<T>{};
        }
        return derived().compute(**a);
    }

    [[nodiscard]] auto eval_batch(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status {
        chunk::ColumnVector in;
        if (auto status = this->template vec_eval_arg<In>(0, input, in); !status) {
            return status;
        }
        const auto rows = input.num_rows();
        result.reset<T>(rows);
        const auto& a = *in.template values<In>();
        auto& out = *result.template values<T>();
        for (std::size_t i = 0; i < rows; ++i) {
            if (in.is_null(i)) {
                result.set_null(i, true);
                continue;
            }
            auto value = derived().compute(a[i]);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (value->has_value()) {
                out[i] = std::move(**value);
            } else {
                result.set_null(i, true);
            }
        }
        return {};
    }

   private:
    [[nodiscard]] auto derived() const noexcept -> const Derived& {
        return static_cast<const Derived&>(*this);
    }
};

/// Function of two arguments of category In; NULL when either is NULL.
///
/// `Derived` provides `compute(const In&, const In&) const -> EvalResult<T>`.
template <typename Derived, typename T, typename In = T>
class BinaryFunction : public TypedFunction<Derived, T> {
   public:
    using TypedFunction<Derived, T>::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& row) const -> EvalResult<T> {
        auto a = this->template eval_arg<In>(0, row);
        if (!a) {
            return std::unexpected(a.error());
        }
        auto b = this->template eval_arg<In>(1, row);
        if (!b) {
            return std::unexpected(b.error());
        }
        if (!a->has_value() || !b->has_value()) {
            return std::optional<T>{};
        }
        return derived().compute(**a, **b);
    }

    [[nodiscard]] auto eval_batch(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status {
        chunk::ColumnVector lhs;
        chunk::ColumnVector rhs;
        if (auto status = this->template vec_eval_arg<In>(0, input, lhs); !status) {
            return status;
        }
        if (auto status = this->template vec_eval_arg<In>(1, input, rhs); !status) {
            return status;
        }
        const auto rows = input.num_rows();
        result.reset<T>(rows);
        const auto& a = *lhs.template values<In>();
        const auto& b = *rhs.template values<In>();
        auto& out = *result.template values<T>();
        for (std::size_t i = 0; i < rows; ++i) {
            if (lhs.is_null(i) || rhs.is_null(i)) {
                result.set_null(i, true);
                continue;
            }
            auto value = derived().compute(a[i], b[i]);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (value->has_value()) {
                out[i] = std::move(**value);
            } else {
                result.set_null(i, true);
            }
        }
        return {};
    }

   private:
    [[nodiscard]] auto derived() const noexcept -> const Derived& {
        return static_cast<const Derived&>(*this);
    }
};

}  // namespace scalex::expression::detail
