#include <scalex/expression/expression.hpp>

namespace scalex::expression {

namespace {

template <typename T>
auto box(const Expression& expr, const chunk::Row& row) -> Result<Datum> {
    auto value = eval_as<T>(expr, row);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!value->has_value()) {
        return Datum{};
    }
    if constexpr (std::is_same_v<T, std::int64_t>) {
        if (expr.type().is_unsigned()) {
            return Datum{static_cast<std::uint64_t>(**value)};
        }
    }
    return Datum{std::move(**value)};
}

}  // namespace

auto eval_to_datum(const Expression& expr, const chunk::Row& row) -> Result<Datum> {
    switch (expr.type().eval_type()) {
        case EvalType::Int:
            return box<std::int64_t>(expr, row);
        case EvalType::Real:
            return box<double>(expr, row);
        case EvalType::String:
            return box<std::string>(expr, row);
        case EvalType::Decimal:
            return box<Decimal>(expr, row);
        case EvalType::Datetime:
            return box<Timestamp>(expr, row);
        case EvalType::Duration:
            return box<Duration>(expr, row);
    }
    return make_error(ErrorCode::UnsupportedEvalType, "unknown evaluation category for {}",
                      expr.to_string());
}

auto Expression::to_json() const -> std::string { return "\"" + to_string() + "\""; }

}  // namespace scalex::expression
