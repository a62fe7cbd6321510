#pragma once

#include <scalex/expression/expression.hpp>

#include <memory>
#include <string>

namespace scalex::expression {

/// Literal value of a declared type.
class Constant final : public Expression {
   public:
    Constant(Datum value, FieldType type)
        : Expression(ExprKind::Constant), value_(std::move(value)), type_(type) {}

    [[nodiscard]] static auto make(Datum value, FieldType type) -> std::shared_ptr<Constant> {
        return std::make_shared<Constant>(std::move(value), type);
    }

    [[nodiscard]] auto value() const noexcept -> const Datum& { return value_; }
    [[nodiscard]] auto type() const noexcept -> const FieldType& override { return type_; }

    [[nodiscard]] auto eval(const chunk::Row& /*row*/) const -> Result<Datum> override {
        return value_;
    }
    [[nodiscard]] auto eval_int(const chunk::Row& row) const -> EvalResult<std::int64_t> override;
    [[nodiscard]] auto eval_real(const chunk::Row& row) const -> EvalResult<double> override;
    [[nodiscard]] auto eval_string(const chunk::Row& row) const
        -> EvalResult<std::string> override;
    [[nodiscard]] auto eval_decimal(const chunk::Row& row) const -> EvalResult<Decimal> override;
    [[nodiscard]] auto eval_time(const chunk::Row& row) const -> EvalResult<Timestamp> override;
    [[nodiscard]] auto eval_duration(const chunk::Row& row) const -> EvalResult<Duration> override;

    [[nodiscard]] auto vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override;
    [[nodiscard]] auto vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override;
    [[nodiscard]] auto vec_eval_string(const chunk::Chunk& input,
                                       chunk::ColumnVector& result) const -> Status override;
    [[nodiscard]] auto vec_eval_decimal(const chunk::Chunk& input,
                                        chunk::ColumnVector& result) const -> Status override;
    [[nodiscard]] auto vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status override;
    [[nodiscard]] auto vec_eval_duration(const chunk::Chunk& input,
                                         chunk::ColumnVector& result) const -> Status override;
    [[nodiscard]] auto vectorized() const -> bool override { return true; }

    [[nodiscard]] auto hash_code(const session::StatementContext& sc) const
        -> const HashCode& override;
    [[nodiscard]] auto equal(const Expression& other) const -> bool override;
    [[nodiscard]] auto is_correlated() const -> bool override { return false; }
    [[nodiscard]] auto const_item() const -> bool override { return true; }
    [[nodiscard]] auto decorrelate(const Schema& /*schema*/) -> ExprPtr override {
        return shared_from_this();
    }
    [[nodiscard]] auto resolve_indices(const Schema& /*schema*/) const
        -> Result<ExprPtr> override {
        return clone();
    }
    [[nodiscard]] auto clone() const -> ExprPtr override;
    [[nodiscard]] auto to_string() const -> std::string override {
        return datum_to_string(value_);
    }

   protected:
    [[nodiscard]] auto resolve_indices_in_place(const Schema& /*schema*/) -> Status override {
        return {};
    }

   private:
    Datum value_;
    FieldType type_;
    mutable HashCache hash_code_;
};

// ─── Literal builders ─────────────────────────────────────────────────────────
//  Convenience factories with the canonical type of each value category.

[[nodiscard]] auto int_lit(std::int64_t v) -> ExprPtr;
[[nodiscard]] auto uint_lit(std::uint64_t v) -> ExprPtr;
[[nodiscard]] auto real_lit(double v) -> ExprPtr;
[[nodiscard]] auto str_lit(std::string v) -> ExprPtr;
[[nodiscard]] auto dec_lit(Decimal v) -> ExprPtr;
[[nodiscard]] auto time_lit(Timestamp v) -> ExprPtr;
[[nodiscard]] auto duration_lit(Duration v) -> ExprPtr;
[[nodiscard]] auto null_lit(FieldType type) -> ExprPtr;

}  // namespace scalex::expression
