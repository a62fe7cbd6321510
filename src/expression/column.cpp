#include <scalex/expression/column.hpp>
#include <scalex/expression/schema.hpp>

#include "eval_helpers.hpp"

#include <fmt/format.h>

namespace scalex::expression {

// ─── ColumnRef ────────────────────────────────────────────────────────────────

template <typename T>
auto ColumnRef::read(const chunk::Row& row) const -> EvalResult<T> {
    if (row.is_empty()) {
        return make_error(ErrorCode::EmptyRow, "column {} evaluated against an empty row",
                          to_string());
    }
    if (index_ >= row.num_cols()) {
        return make_error(ErrorCode::ColumnNotFound, "column {} offset {} out of range ({})",
                          to_string(), index_, row.num_cols());
    }
    if (row.is_null(index_)) {
        return std::optional<T>{};
    }
    const T* value = row.get<T>(index_);
    if (value == nullptr) {
        return make_error(ErrorCode::TypeMismatch, "column {} does not hold {} values",
                          to_string(), eval_type_name(eval_type_of<T>()));
    }
    return std::optional<T>{*value};
}

template <typename T>
auto ColumnRef::copy_column(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    if (index_ >= input.num_cols()) {
        return make_error(ErrorCode::ColumnNotFound, "column {} offset {} out of range ({})",
                          to_string(), index_, input.num_cols());
    }
    const auto& source = input.column(index_);
    if (source.values<T>() == nullptr) {
        return make_error(ErrorCode::TypeMismatch, "column {} does not hold {} values",
                          to_string(), eval_type_name(eval_type_of<T>()));
    }
    result = source;
    return {};
}

auto ColumnRef::eval(const chunk::Row& row) const -> Result<Datum> {
    return eval_to_datum(*this, row);
}

auto ColumnRef::eval_int(const chunk::Row& row) const -> EvalResult<std::int64_t> {
    return read<std::int64_t>(row);
}

auto ColumnRef::eval_real(const chunk::Row& row) const -> EvalResult<double> {
    return read<double>(row);
}

auto ColumnRef::eval_string(const chunk::Row& row) const -> EvalResult<std::string> {
    return read<std::string>(row);
}

auto ColumnRef::eval_decimal(const chunk::Row& row) const -> EvalResult<Decimal> {
    return read<Decimal>(row);
}

auto ColumnRef::eval_time(const chunk::Row& row) const -> EvalResult<Timestamp> {
    return read<Timestamp>(row);
}

auto ColumnRef::eval_duration(const chunk::Row& row) const -> EvalResult<Duration> {
    return read<Duration>(row);
}

auto ColumnRef::vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<std::int64_t>(input, result);
}

auto ColumnRef::vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<double>(input, result);
}

auto ColumnRef::vec_eval_string(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<std::string>(input, result);
}

auto ColumnRef::vec_eval_decimal(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<Decimal>(input, result);
}

auto ColumnRef::vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<Timestamp>(input, result);
}

auto ColumnRef::vec_eval_duration(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return copy_column<Duration>(input, result);
}

auto ColumnRef::hash_code(const session::StatementContext& /*sc*/) const -> const HashCode& {
    return hash_code_.get_or_compute([this] {
        HashCode bytes{kColumnFlag};
        codec::encode_int(bytes, unique_id_);
        return bytes;
    });
}

auto ColumnRef::equal(const Expression& other) const -> bool {
    if (other.kind() != ExprKind::Column) {
        return false;
    }
    return static_cast<const ColumnRef&>(other).unique_id_ == unique_id_;
}

auto ColumnRef::decorrelate(const Schema& /*schema*/) -> ExprPtr { return shared_from_this(); }

auto ColumnRef::resolve_indices(const Schema& schema) const -> Result<ExprPtr> {
    auto copy = std::make_shared<ColumnRef>(unique_id_, name_, type_, index_);
    copy->hash_code_ = hash_code_;
    auto status = copy->resolve_indices_in_place(schema);
    if (!status) {
        return std::unexpected(status.error());
    }
    return copy;
}

auto ColumnRef::resolve_indices_in_place(const Schema& schema) -> Status {
    auto idx = schema.column_index(*this);
    if (!idx) {
        return make_error(ErrorCode::ColumnNotFound, "Can't find column {} in schema {}",
                          to_string(), schema.to_string());
    }
    index_ = *idx;
    return {};
}

auto ColumnRef::clone() const -> ExprPtr {
    auto copy = std::make_shared<ColumnRef>(unique_id_, name_, type_, index_);
    copy->hash_code_ = hash_code_;
    return copy;
}

auto ColumnRef::to_string() const -> std::string {
    if (!name_.empty()) {
        return name_;
    }
    return fmt::format("Column#{}", unique_id_);
}

// ─── CorrelatedColumn ─────────────────────────────────────────────────────────

auto CorrelatedColumn::eval(const chunk::Row& row) const -> Result<Datum> {
    return eval_to_datum(*this, row);
}

auto CorrelatedColumn::eval_int(const chunk::Row& /*row*/) const -> EvalResult<std::int64_t> {
    return detail::datum_eval<std::int64_t>(*data_);
}

auto CorrelatedColumn::eval_real(const chunk::Row& /*row*/) const -> EvalResult<double> {
    return detail::datum_eval<double>(*data_);
}

auto CorrelatedColumn::eval_string(const chunk::Row& /*row*/) const -> EvalResult<std::string> {
    return detail::datum_eval<std::string>(*data_);
}

auto CorrelatedColumn::eval_decimal(const chunk::Row& /*row*/) const -> EvalResult<Decimal> {
    return detail::datum_eval<Decimal>(*data_);
}

auto CorrelatedColumn::eval_time(const chunk::Row& /*row*/) const -> EvalResult<Timestamp> {
    return detail::datum_eval<Timestamp>(*data_);
}

auto CorrelatedColumn::eval_duration(const chunk::Row& /*row*/) const -> EvalResult<Duration> {
    return detail::datum_eval<Duration>(*data_);
}

auto CorrelatedColumn::vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<std::int64_t>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<double>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::vec_eval_string(const chunk::Chunk& input,
                                       chunk::ColumnVector& result) const -> Status {
    return detail::fill_datum<std::string>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::vec_eval_decimal(const chunk::Chunk& input,
                                        chunk::ColumnVector& result) const -> Status {
    return detail::fill_datum<Decimal>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<Timestamp>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::vec_eval_duration(const chunk::Chunk& input,
                                         chunk::ColumnVector& result) const -> Status {
    return detail::fill_datum<Duration>(*data_, input.num_rows(), result);
}

auto CorrelatedColumn::equal(const Expression& other) const -> bool {
    if (other.kind() != ExprKind::CorrelatedColumn) {
        return false;
    }
    return column_->equal(*static_cast<const CorrelatedColumn&>(other).column_);
}

auto CorrelatedColumn::decorrelate(const Schema& schema) -> ExprPtr {
    if (schema.contains(*column_)) {
        return column_;
    }
    return shared_from_this();
}

auto CorrelatedColumn::resolve_indices(const Schema& /*schema*/) const -> Result<ExprPtr> {
    return clone();
}

auto CorrelatedColumn::clone() const -> ExprPtr {
    return std::make_shared<CorrelatedColumn>(column_, data_);
}

}  // namespace scalex::expression
