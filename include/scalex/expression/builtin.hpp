#pragma once

#include <scalex/expression/expression.hpp>
#include <scalex/session/context.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace scalex::expression {

/// Concrete implementation selected for a builtin call.
///
/// Two bound builtins are only comparable when their signatures match.
enum class Signature : std::uint16_t {
    PlusInt,
    PlusReal,
    PlusDecimal,
    MinusInt,
    MinusReal,
    MinusDecimal,
    MulInt,
    MulReal,
    MulDecimal,
    DivReal,
    IntDivInt,
    ModInt,
    ModReal,
    AbsInt,
    AbsReal,
    AbsDecimal,
    BitNeg,

    EqInt,
    EqReal,
    EqDecimal,
    EqString,
    NeInt,
    NeReal,
    NeDecimal,
    NeString,
    LtInt,
    LtReal,
    LtDecimal,
    LtString,
    LeInt,
    LeReal,
    LeDecimal,
    LeString,
    GtInt,
    GtReal,
    GtDecimal,
    GtString,
    GeInt,
    GeReal,
    GeDecimal,
    GeString,

    Concat,
    Lower,
    Upper,
    Length,

    Now,
    Sysdate,
    FromUnixTime,
    TimeDiff,
    SecToTime,

    Rand,
    Uuid,

    /// Builtins registered outside the catalog. They share one signature, so two of them
    /// compare equal only through ScalarFunction::equal, which also compares names.
    Extension,
};

[[nodiscard]] auto signature_name(Signature sig) noexcept -> std::string_view;

/// Bound implementation of one builtin call: its arguments, its inferred return type and the
/// session it evaluates in.
///
/// Every typed evaluator fails with UnsupportedEvalType unless the concrete signature
/// provides it; see TypedFunction.
class BuiltinFunction {
   public:
    BuiltinFunction(session::SessionContext& ctx, std::vector<ExprPtr> args, FieldType ret_type)
        : ctx_(&ctx), args_(std::move(args)), ret_type_(ret_type) {}
    virtual ~BuiltinFunction() = default;

    [[nodiscard]] virtual auto sig() const -> Signature = 0;

    [[nodiscard]] virtual auto eval_int(const chunk::Row& row) const -> EvalResult<std::int64_t>;
    [[nodiscard]] virtual auto eval_real(const chunk::Row& row) const -> EvalResult<double>;
    [[nodiscard]] virtual auto eval_string(const chunk::Row& row) const
        -> EvalResult<std::string>;
    [[nodiscard]] virtual auto eval_decimal(const chunk::Row& row) const -> EvalResult<Decimal>;
    [[nodiscard]] virtual auto eval_time(const chunk::Row& row) const -> EvalResult<Timestamp>;
    [[nodiscard]] virtual auto eval_duration(const chunk::Row& row) const -> EvalResult<Duration>;

    [[nodiscard]] virtual auto vec_eval_int(const chunk::Chunk& input,
                                            chunk::ColumnVector& result) const -> Status;
    [[nodiscard]] virtual auto vec_eval_real(const chunk::Chunk& input,
                                             chunk::ColumnVector& result) const -> Status;
    [[nodiscard]] virtual auto vec_eval_string(const chunk::Chunk& input,
                                               chunk::ColumnVector& result) const -> Status;
    [[nodiscard]] virtual auto vec_eval_decimal(const chunk::Chunk& input,
                                                chunk::ColumnVector& result) const -> Status;
    [[nodiscard]] virtual auto vec_eval_time(const chunk::Chunk& input,
                                             chunk::ColumnVector& result) const -> Status;
    [[nodiscard]] virtual auto vec_eval_duration(const chunk::Chunk& input,
                                                 chunk::ColumnVector& result) const -> Status;

    /// Whether this signature provides a batch evaluator for its category.
    [[nodiscard]] virtual auto vectorized() const -> bool { return false; }

    /// Whether every argument subtree supports vectorized evaluation.
    [[nodiscard]] auto children_vectorized() const -> bool;

    /// Deep copy: the arguments are cloned as well.
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<BuiltinFunction> = 0;

    /// Same signature and pairwise-equal arguments.
    [[nodiscard]] auto equal(const BuiltinFunction& other) const -> bool;

    [[nodiscard]] auto args() const noexcept -> const std::vector<ExprPtr>& { return args_; }
    [[nodiscard]] auto args() noexcept -> std::vector<ExprPtr>& { return args_; }
    [[nodiscard]] auto ret_type() const noexcept -> const FieldType& { return ret_type_; }
    [[nodiscard]] auto context() const noexcept -> session::SessionContext& { return *ctx_; }

   protected:
    BuiltinFunction(const BuiltinFunction&) = default;
    auto operator=(const BuiltinFunction&) -> BuiltinFunction& = delete;

    /// Replaces every argument with an independent clone.
    void clone_args();

    /// Value of argument `idx` as T. An argument of another category is evaluated in its own
    /// category and converted.
    template <typename T>
    [[nodiscard]] auto eval_arg(std::size_t idx, const chunk::Row& row) const -> EvalResult<T> {
        const auto& arg = *args_[idx];
        if (arg.type().eval_type() == eval_type_of<T>()) {
            return eval_as<T>(arg, row);
        }
        auto datum = eval_to_datum(arg, row);
        if (!datum) {
            return std::unexpected(datum.error());
        }
        if (is_null(*datum)) {
            return std::optional<T>{};
        }
        auto value = datum_as<T>(*datum);
        if (!value) {
            return std::unexpected(value.error());
        }
        return std::optional<T>{std::move(*value)};
    }

    /// Batch counterpart of eval_arg.
    template <typename T>
    [[nodiscard]] auto vec_eval_arg(std::size_t idx, const chunk::Chunk& input,
                                    chunk::ColumnVector& result) const -> Status {
        const auto& arg = *args_[idx];
        if (arg.type().eval_type() == eval_type_of<T>()) {
            return vec_eval_as<T>(arg, input, result);
        }
        const auto rows = input.num_rows();
        result.reset<T>(rows);
        auto& values = *result.values<T>();
        for (std::size_t i = 0; i < rows; ++i) {
            auto value = eval_arg<T>(idx, input.row(i));
            if (!value) {
                return std::unexpected(value.error());
            }
            if (value->has_value()) {
                values[i] = std::move(**value);
            } else {
                result.set_null(i, true);
            }
        }
        return {};
    }

   private:
    session::SessionContext* ctx_;
    std::vector<ExprPtr> args_;
    FieldType ret_type_;
};

/// Routes the evaluators of one category T to `Derived`.
///
/// `Derived` provides `eval_row(row) -> EvalResult<T>` and a `static constexpr Signature
/// kSig`. It may shadow `eval_batch(input, result) -> Status` with a column-wise
/// implementation and set `static constexpr bool kVectorized = false` to opt out of batch
/// evaluation; the default batch evaluator calls eval_row once per row.
template <typename Derived, typename T>
    requires kIsEvalValue<T>
class TypedFunction : public BuiltinFunction {
   public:
    using BuiltinFunction::BuiltinFunction;
    using value_type = T;

    [[nodiscard]] auto sig() const -> Signature override { return Derived::kSig; }

    [[nodiscard]] auto eval_int(const chunk::Row& row) const
        -> EvalResult<std::int64_t> override {
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_int(row);
        }
    }
    [[nodiscard]] auto eval_real(const chunk::Row& row) const -> EvalResult<double> override {
        if constexpr (std::is_same_v<T, double>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_real(row);
        }
    }
    [[nodiscard]] auto eval_string(const chunk::Row& row) const
        -> EvalResult<std::string> override {
        if constexpr (std::is_same_v<T, std::string>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_string(row);
        }
    }
    [[nodiscard]] auto eval_decimal(const chunk::Row& row) const -> EvalResult<Decimal> override {
        if constexpr (std::is_same_v<T, Decimal>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_decimal(row);
        }
    }
    [[nodiscard]] auto eval_time(const chunk::Row& row) const -> EvalResult<Timestamp> override {
        if constexpr (std::is_same_v<T, Timestamp>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_time(row);
        }
    }
    [[nodiscard]] auto eval_duration(const chunk::Row& row) const
        -> EvalResult<Duration> override {
        if constexpr (std::is_same_v<T, Duration>) {
            return derived().eval_row(row);
        } else {
            return BuiltinFunction::eval_duration(row);
        }
    }

    [[nodiscard]] auto vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_int(input, result);
        }
    }
    [[nodiscard]] auto vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        if constexpr (std::is_same_v<T, double>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_real(input, result);
        }
    }
    [[nodiscard]] auto vec_eval_string(const chunk::Chunk& input,
                                       chunk::ColumnVector& result) const -> Status override {
        if constexpr (std::is_same_v<T, std::string>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_string(input, result);
        }
    }
    [[nodiscard]] auto vec_eval_decimal(const chunk::Chunk& input,
                                        chunk::ColumnVector& result) const -> Status override {
        if constexpr (std::is_same_v<T, Decimal>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_decimal(input, result);
        }
    }
    [[nodiscard]] auto vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        if constexpr (std::is_same_v<T, Timestamp>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_time(input, result);
        }
    }
    [[nodiscard]] auto vec_eval_duration(const chunk::Chunk& input,
                                         chunk::ColumnVector& result) const -> Status override {
        if constexpr (std::is_same_v<T, Duration>) {
            return derived().eval_batch(input, result);
        } else {
            return BuiltinFunction::vec_eval_duration(input, result);
        }
    }

    [[nodiscard]] auto vectorized() const -> bool override {
        if constexpr (requires { Derived::kVectorized; }) {
            return Derived::kVectorized;
        } else {
            return true;
        }
    }

    [[nodiscard]] auto clone() const -> std::unique_ptr<BuiltinFunction> override {
        auto copy = std::make_unique<Derived>(derived());
        copy->clone_args();
        return copy;
    }

    /// Row-by-row batch evaluation.
    [[nodiscard]] auto eval_batch(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status {
        const auto rows = input.num_rows();
        result.reset<T>(rows);
        auto& values = *result.values<T>();
        for (std::size_t i = 0; i < rows; ++i) {
            auto value = derived().eval_row(input.row(i));
            if (!value) {
                return std::unexpected(value.error());
            }
            if (value->has_value()) {
                values[i] = std::move(**value);
            } else {
                result.set_null(i, true);
            }
        }
        return {};
    }

   protected:
    TypedFunction(const TypedFunction&) = default;

   private:
    [[nodiscard]] auto derived() const noexcept -> const Derived& {
        return static_cast<const Derived&>(*this);
    }
};

}  // namespace scalex::expression
