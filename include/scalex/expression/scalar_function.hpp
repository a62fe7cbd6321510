#pragma once

#include <scalex/expression/builtin.hpp>
#include <scalex/expression/expression.hpp>
#include <scalex/expression/function_registry.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scalex::expression {

/// Function-call node bound to a builtin implementation.
///
/// The node owns its builtin exclusively; the builtin owns the argument list. Any structural
/// change (decorrelate, replace_arg) clears the memoized hash.
class ScalarFunction final : public Expression {
   public:
    ScalarFunction(std::string name, FieldType ret_type, std::unique_ptr<BuiltinFunction> function);

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto type() const noexcept -> const FieldType& override { return ret_type_; }
    [[nodiscard]] auto args() const noexcept -> const std::vector<ExprPtr>& {
        return function_->args();
    }
    [[nodiscard]] auto function() const noexcept -> const BuiltinFunction& { return *function_; }

    /// Replaces argument `idx` and clears this node's memoized hash.
    ///
    /// Ancestors keep their own memoized hashes, so call this only on a node no other tree
    /// holds: one just built, or a clone().
    void replace_arg(std::size_t idx, ExprPtr arg);

    /// Boxed value of the node. Only the int, real and string categories are evaluated;
    /// any other declared category yields NULL without an error.
    [[nodiscard]] auto eval(const chunk::Row& row) const -> Result<Datum> override;

    [[nodiscard]] auto eval_int(const chunk::Row& row) const -> EvalResult<std::int64_t> override {
        return function_->eval_int(row);
    }
    [[nodiscard]] auto eval_real(const chunk::Row& row) const -> EvalResult<double> override {
        return function_->eval_real(row);
    }
    [[nodiscard]] auto eval_string(const chunk::Row& row) const
        -> EvalResult<std::string> override {
        return function_->eval_string(row);
    }
    [[nodiscard]] auto eval_decimal(const chunk::Row& row) const -> EvalResult<Decimal> override {
        return function_->eval_decimal(row);
    }
    [[nodiscard]] auto eval_time(const chunk::Row& row) const -> EvalResult<Timestamp> override {
        return function_->eval_time(row);
    }
    [[nodiscard]] auto eval_duration(const chunk::Row& row) const
        -> EvalResult<Duration> override {
        return function_->eval_duration(row);
    }

    [[nodiscard]] auto vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        return function_->vec_eval_int(input, result);
    }
    [[nodiscard]] auto vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        return function_->vec_eval_real(input, result);
    }
    [[nodiscard]] auto vec_eval_string(const chunk::Chunk& input,
                                       chunk::ColumnVector& result) const -> Status override {
        return function_->vec_eval_string(input, result);
    }
    [[nodiscard]] auto vec_eval_decimal(const chunk::Chunk& input,
                                        chunk::ColumnVector& result) const -> Status override {
        return function_->vec_eval_decimal(input, result);
    }
    [[nodiscard]] auto vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override {
        return function_->vec_eval_time(input, result);
    }
    [[nodiscard]] auto vec_eval_duration(const chunk::Chunk& input,
                                         chunk::ColumnVector& result) const -> Status override {
        return function_->vec_eval_duration(input, result);
    }

    [[nodiscard]] auto vectorized() const -> bool override {
        return function_->vectorized() && function_->children_vectorized();
    }

    /// Tag byte, length-prefixed name, then each argument's hash in order. Argument order
    /// matters even for commutative functions.
    [[nodiscard]] auto hash_code(const session::StatementContext& sc) const
        -> const HashCode& override;
    [[nodiscard]] auto equal(const Expression& other) const -> bool override;
    [[nodiscard]] auto is_correlated() const -> bool override;
    [[nodiscard]] auto const_item() const -> bool override;

    /// Rewrites the arguments in place and returns this node.
    [[nodiscard]] auto decorrelate(const Schema& schema) -> ExprPtr override;

    /// Clone bound to `schema`. On error the partially resolved clone is discarded.
    [[nodiscard]] auto resolve_indices(const Schema& schema) const -> Result<ExprPtr> override;

    /// Independent copy; the memoized hash is copied, not recomputed.
    [[nodiscard]] auto clone() const -> ExprPtr override;

    /// `name(arg, arg, ...)`
    [[nodiscard]] auto to_string() const -> std::string override;

   protected:
    [[nodiscard]] auto resolve_indices_in_place(const Schema& schema) -> Status override;

   private:
    std::string name_;
    FieldType ret_type_;
    std::unique_ptr<BuiltinFunction> function_;
    mutable HashCache hash_code_;
};

// ─── Construction ─────────────────────────────────────────────────────────────

/// Binds `name` against `registry` and builds the call node.
///
/// Fails with InvalidReturnType when `ret_type` is absent and FunctionNotFound for an
/// unknown name; argument errors from the builtin are returned unchanged. The node keeps the
/// builtin's own return type unless that is Unspecified and `ret_type` is not. With `fold`
/// set, a constant call is replaced by its value; a failing fold keeps the call.
[[nodiscard]] auto new_function_impl(session::SessionContext& ctx,
                                     const FunctionRegistry& registry, bool fold,
                                     std::string_view name, std::optional<FieldType> ret_type,
                                     std::vector<ExprPtr> args) -> Result<ExprPtr>;

/// Builtin catalog, folding enabled.
[[nodiscard]] auto new_function(session::SessionContext& ctx, std::string_view name,
                                std::optional<FieldType> ret_type, std::vector<ExprPtr> args)
    -> Result<ExprPtr>;

/// Builtin catalog, no folding.
[[nodiscard]] auto new_function_base(session::SessionContext& ctx, std::string_view name,
                                     std::optional<FieldType> ret_type, std::vector<ExprPtr> args)
    -> Result<ExprPtr>;

/// Like new_function, but logs a failure and returns nullptr instead.
[[nodiscard]] auto new_function_internal(session::SessionContext& ctx, std::string_view name,
                                         std::optional<FieldType> ret_type,
                                         std::vector<ExprPtr> args) -> ExprPtr;

[[nodiscard]] auto scalar_funcs_to_exprs(const std::vector<std::shared_ptr<ScalarFunction>>& funcs)
    -> std::vector<ExprPtr>;

}  // namespace scalex::expression
