#include <scalex/expression/constant.hpp>

#include "eval_helpers.hpp"

namespace scalex::expression {

auto Constant::eval_int(const chunk::Row& /*row*/) const -> EvalResult<std::int64_t> {
    return detail::datum_eval<std::int64_t>(value_);
}

auto Constant::eval_real(const chunk::Row& /*row*/) const -> EvalResult<double> {
    return detail::datum_eval<double>(value_);
}

auto Constant::eval_string(const chunk::Row& /*row*/) const -> EvalResult<std::string> {
    return detail::datum_eval<std::string>(value_);
}

auto Constant::eval_decimal(const chunk::Row& /*row*/) const -> EvalResult<Decimal> {
    return detail::datum_eval<Decimal>(value_);
}

auto Constant::eval_time(const chunk::Row& /*row*/) const -> EvalResult<Timestamp> {
    return detail::datum_eval<Timestamp>(value_);
}

auto Constant::eval_duration(const chunk::Row& /*row*/) const -> EvalResult<Duration> {
    return detail::datum_eval<Duration>(value_);
}

auto Constant::vec_eval_int(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<std::int64_t>(value_, input.num_rows(), result);
}

auto Constant::vec_eval_real(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<double>(value_, input.num_rows(), result);
}

auto Constant::vec_eval_string(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<std::string>(value_, input.num_rows(), result);
}

auto Constant::vec_eval_decimal(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<Decimal>(value_, input.num_rows(), result);
}

auto Constant::vec_eval_time(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<Timestamp>(value_, input.num_rows(), result);
}

auto Constant::vec_eval_duration(const chunk::Chunk& input, chunk::ColumnVector& result) const
    -> Status {
    return detail::fill_datum<Duration>(value_, input.num_rows(), result);
}

auto Constant::hash_code(const session::StatementContext& /*sc*/) const -> const HashCode& {
    return hash_code_.get_or_compute([this] {
        HashCode bytes{kConstantFlag};
        codec::encode_datum(bytes, value_);
        return bytes;
    });
}

auto Constant::equal(const Expression& other) const -> bool {
    if (other.kind() != ExprKind::Constant) {
        return false;
    }
    const auto& c = static_cast<const Constant&>(other);
    return c.type_.eval_type() == type_.eval_type() && c.value_ == value_;
}

auto Constant::clone() const -> ExprPtr {
    auto copy = std::make_shared<Constant>(value_, type_);
    copy->hash_code_ = hash_code_;
    return copy;
}

auto int_lit(std::int64_t v) -> ExprPtr {
    return Constant::make(v, new_field_type(TypeCode::LongLong));
}

auto uint_lit(std::uint64_t v) -> ExprPtr {
    auto type = new_field_type(TypeCode::LongLong);
    type.flag |= type_flag::kUnsigned;
    return Constant::make(v, type);
}

auto real_lit(double v) -> ExprPtr { return Constant::make(v, new_field_type(TypeCode::Double)); }

auto str_lit(std::string v) -> ExprPtr {
    auto type = new_field_type(TypeCode::Varchar);
    type.flen = static_cast<int>(v.size());
    return Constant::make(std::move(v), type);
}

auto dec_lit(Decimal v) -> ExprPtr {
    auto type = new_field_type(TypeCode::NewDecimal);
    type.decimal = v.scale();
    return Constant::make(v, type);
}

auto time_lit(Timestamp v) -> ExprPtr {
    return Constant::make(v, new_field_type(TypeCode::Datetime));
}

auto duration_lit(Duration v) -> ExprPtr {
    return Constant::make(v, new_field_type(TypeCode::Duration));
}

auto null_lit(FieldType type) -> ExprPtr { return Constant::make(std::monostate{}, type); }

}  // namespace scalex::expression
