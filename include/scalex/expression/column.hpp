#pragma once

#include <scalex/expression/expression.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace scalex::expression {

/// Reference to a column of the current query scope.
///
/// `unique_id` is the planner-assigned identity; `index` is the physical offset set by
/// resolve_indices().
class ColumnRef final : public Expression {
   public:
    ColumnRef(std::int64_t unique_id, std::string name, FieldType type, std::size_t index = 0)
        : Expression(ExprKind::Column),
          unique_id_(unique_id),
          name_(std::move(name)),
          type_(type),
          index_(index) {}

    [[nodiscard]] static auto make(std::int64_t unique_id, std::string name, FieldType type,
                                   std::size_t index = 0) -> std::shared_ptr<ColumnRef> {
        return std::make_shared<ColumnRef>(unique_id, std::move(name), type, index);
    }

    [[nodiscard]] auto unique_id() const noexcept -> std::int64_t { return unique_id_; }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }
    [[nodiscard]] auto type() const noexcept -> const FieldType& override { return type_; }

    [[nodiscard]] auto eval(const chunk::Row& row) const -> Result<Datum> override;
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
    [[nodiscard]] auto const_item() const -> bool override { return false; }
    [[nodiscard]] auto decorrelate(const Schema& schema) -> ExprPtr override;
    [[nodiscard]] auto resolve_indices(const Schema& schema) const -> Result<ExprPtr> override;
    [[nodiscard]] auto clone() const -> ExprPtr override;
    [[nodiscard]] auto to_string() const -> std::string override;

   protected:
    [[nodiscard]] auto resolve_indices_in_place(const Schema& schema) -> Status override;

   private:
    template <typename T>
    [[nodiscard]] auto read(const chunk::Row& row) const -> EvalResult<T>;
    template <typename T>
    [[nodiscard]] auto copy_column(const chunk::Chunk& input, chunk::ColumnVector& result) const
        -> Status;

    std::int64_t unique_id_;
    std::string name_;
    FieldType type_;
    std::size_t index_;
    mutable HashCache hash_code_;
};

/// Column of an enclosing query scope, read from a value the executor binds once per outer
/// row. Clones share the binding slot.
class CorrelatedColumn final : public Expression {
   public:
    explicit CorrelatedColumn(std::shared_ptr<ColumnRef> column)
        : CorrelatedColumn(std::move(column), std::make_shared<Datum>()) {}

    CorrelatedColumn(std::shared_ptr<ColumnRef> column, std::shared_ptr<Datum> data)
        : Expression(ExprKind::CorrelatedColumn),
          column_(std::move(column)),
          data_(std::move(data)) {}

    [[nodiscard]] static auto make(std::shared_ptr<ColumnRef> column)
        -> std::shared_ptr<CorrelatedColumn> {
        return std::make_shared<CorrelatedColumn>(std::move(column));
    }

    [[nodiscard]] auto column() const noexcept -> const std::shared_ptr<ColumnRef>& {
        return column_;
    }

    /// Binds the outer row's value.
    void set_value(Datum value) { *data_ = std::move(value); }
    [[nodiscard]] auto value() const noexcept -> const Datum& { return *data_; }

    [[nodiscard]] auto type() const noexcept -> const FieldType& override {
        return column_->type();
    }

    [[nodiscard]] auto eval(const chunk::Row& row) const -> Result<Datum> override;
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
        -> const HashCode& override {
        return column_->hash_code(sc);
    }
    [[nodiscard]] auto equal(const Expression& other) const -> bool override;
    [[nodiscard]] auto is_correlated() const -> bool override { return true; }
    [[nodiscard]] auto const_item() const -> bool override { return false; }
    [[nodiscard]] auto decorrelate(const Schema& schema) -> ExprPtr override;
    [[nodiscard]] auto resolve_indices(const Schema& schema) const -> Result<ExprPtr> override;
    [[nodiscard]] auto clone() const -> ExprPtr override;
    [[nodiscard]] auto to_string() const -> std::string override { return column_->to_string(); }

   protected:
    /// Outer-scope columns are not part of the inner layout.
    [[nodiscard]] auto resolve_indices_in_place(const Schema& /*schema*/) -> Status override {
        return {};
    }

   private:
    std::shared_ptr<ColumnRef> column_;
    std::shared_ptr<Datum> data_;
};

}  // namespace scalex::expression
