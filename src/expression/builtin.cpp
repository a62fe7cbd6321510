#include <scalex/expression/builtin.hpp>

#include <algorithm>

namespace scalex::expression {

namespace {

auto unsupported(const BuiltinFunction& fn, std::string_view category) -> std::unexpected<Error> {
    return make_error(ErrorCode::UnsupportedEvalType, "{} does not evaluate as {}",
                      signature_name(fn.sig()), category);
}

}  // namespace

auto signature_name(Signature sig) noexcept -> std::string_view {
    switch (sig) {
        case Signature::PlusInt:
            return "PlusInt";
        case Signature::PlusReal:
            return "PlusReal";
        case Signature::PlusDecimal:
            return "PlusDecimal";
        case Signature::MinusInt:
            return "MinusInt";
        case Signature::MinusReal:
            return "MinusReal";
        case Signature::MinusDecimal:
            return "MinusDecimal";
        case Signature::MulInt:
            return "MulInt";
        case Signature::MulReal:
            return "MulReal";
        case Signature::MulDecimal:
            return "MulDecimal";
        case Signature::DivReal:
            return "DivReal";
        case Signature::IntDivInt:
            return "IntDivInt";
        case Signature::ModInt:
            return "ModInt";
        case Signature::ModReal:
            return "ModReal";
        case Signature::AbsInt:
            return "AbsInt";
        case Signature::AbsReal:
            return "AbsReal";
        case Signature::AbsDecimal:
            return "AbsDecimal";
        case Signature::BitNeg:
            return "BitNeg";
        case Signature::EqInt:
            return "EqInt";
        case Signature::EqReal:
            return "EqReal";
        case Signature::EqDecimal:
            return "EqDecimal";
        case Signature::EqString:
            return "EqString";
        case Signature::NeInt:
            return "NeInt";
        case Signature::NeReal:
            return "NeReal";
        case Signature::NeDecimal:
            return "NeDecimal";
        case Signature::NeString:
            return "NeString";
        case Signature::LtInt:
            return "LtInt";
        case Signature::LtReal:
            return "LtReal";
        case Signature::LtDecimal:
            return "LtDecimal";
        case Signature::LtString:
            return "LtString";
        case Signature::LeInt:
            return "LeInt";
        case Signature::LeReal:
            return "LeReal";
        case Signature::LeDecimal:
            return "LeDecimal";
        case Signature::LeString:
            return "LeString";
        case Signature::GtInt:
            return "GtInt";
        case Signature::GtReal:
            return "GtReal";
        case Signature::GtDecimal:
            return "GtDecimal";
        case Signature::GtString:
            return "GtString";
        case Signature::GeInt:
            return "GeInt";
        case Signature::GeReal:
            return "GeReal";
        case Signature::GeDecimal:
            return "GeDecimal";
        case Signature::GeString:
            return "GeString";
        case Signature::Concat:
            return "Concat";
        case Signature::Lower:
            return "Lower";
        case Signature::Upper:
            return "Upper";
        case Signature::Length:
            return "Length";
        case Signature::Now:
            return "Now";
        case Signature::Sysdate:
            return "Sysdate";
        case Signature::FromUnixTime:
            return "FromUnixTime";
        case Signature::TimeDiff:
            return "TimeDiff";
        case Signature::SecToTime:
            return "SecToTime";
        case Signature::Rand:
            return "Rand";
        case Signature::Uuid:
            return "Uuid";
        case Signature::Extension:
            return "Extension";
    }
    return "Unknown";
}

auto BuiltinFunction::eval_int(const chunk::Row& /*row*/) const -> EvalResult<std::int64_t> {
    return unsupported(*this, "int");
}

auto BuiltinFunction::eval_real(const chunk::Row& /*row*/) const -> EvalResult<double> {
    return unsupported(*this, "real");
}

auto BuiltinFunction::eval_string(const chunk::Row& /*row*/) const -> EvalResult<std::string> {
    return unsupported(*this, "string");
}

auto BuiltinFunction::eval_decimal(const chunk::Row& /*row*/) const -> EvalResult<Decimal> {
    return unsupported(*this, "decimal");
}

auto BuiltinFunction::eval_time(const chunk::Row& /*row*/) const -> EvalResult<Timestamp> {
    return unsupported(*this, "datetime");
}

auto BuiltinFunction::eval_duration(const chunk::Row& /*row*/) const -> EvalResult<Duration> {
    return unsupported(*this, "duration");
}

auto BuiltinFunction::vec_eval_int(const chunk::Chunk& /*input*/,
                                   chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "int");
}

auto BuiltinFunction::vec_eval_real(const chunk::Chunk& /*input*/,
                                    chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "real");
}

auto BuiltinFunction::vec_eval_string(const chunk::Chunk& /*input*/,
                                      chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "string");
}

auto BuiltinFunction::vec_eval_decimal(const chunk::Chunk& /*input*/,
                                       chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "decimal");
}

auto BuiltinFunction::vec_eval_time(const chunk::Chunk& /*input*/,
                                    chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "datetime");
}

auto BuiltinFunction::vec_eval_duration(const chunk::Chunk& /*input*/,
                                        chunk::ColumnVector& /*result*/) const -> Status {
    return unsupported(*this, "duration");
}

auto BuiltinFunction::children_vectorized() const -> bool {
    return std::ranges::all_of(args_, [](const ExprPtr& arg) { return arg->vectorized(); });
}

auto BuiltinFunction::equal(const BuiltinFunction& other) const -> bool {
    if (sig() != other.sig() || args_.size() != other.args_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < args_.size(); ++i) {
        if (!args_[i]->equal(*other.args_[i])) {
            return false;
        }
    }
    return true;
}

void BuiltinFunction::clone_args() {
    for (auto& arg : args_) {
        arg = arg->clone();
    }
}

}  // namespace scalex::expression
