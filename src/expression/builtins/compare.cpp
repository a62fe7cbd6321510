#include <scalex/expression/builtins.hpp>

#include "builtin_util.hpp"

#include <compare>
#include <limits>

namespace scalex::expression {

namespace {

enum class CmpOp : std::uint8_t { Eq, Ne, Lt, Le, Gt, Ge };

template <CmpOp Op>
constexpr auto holds(std::partial_ordering ord) noexcept -> bool {
    if constexpr (Op == CmpOp::Eq) {
        return ord == 0;
    } else if constexpr (Op == CmpOp::Ne) {
        return ord != 0;
    } else if constexpr (Op == CmpOp::Lt) {
        return ord < 0;
    } else if constexpr (Op == CmpOp::Le) {
        return ord <= 0;
    } else if constexpr (Op == CmpOp::Gt) {
        return ord > 0;
    } else {
        return ord >= 0;
    }
}

/// Orders two BIGINTs whose bit patterns may be unsigned.
auto compare_int(std::int64_t a, bool a_unsigned, std::int64_t b, bool b_unsigned)
    -> std::strong_ordering {
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (a_unsigned == b_unsigned) {
        if (a_unsigned) {
            return static_cast<std::uint64_t>(a) <=> static_cast<std::uint64_t>(b);
        }
        return a <=> b;
    }
    if (a_unsigned) {
        if (b < 0 || static_cast<std::uint64_t>(a) > kMax) {
            return std::strong_ordering::greater;
        }
        return a <=> b;
    }
    if (a < 0 || static_cast<std::uint64_t>(b) > kMax) {
        return std::strong_ordering::less;
    }
    return a <=> b;
}

template <Signature Sig, CmpOp Op, typename In>
class Compare final : public detail::BinaryFunction<Compare<Sig, Op, In>, std::int64_t, In> {
   public:
    static constexpr Signature kSig = Sig;
    using detail::BinaryFunction<Compare, std::int64_t, In>::BinaryFunction;

    [[nodiscard]] auto compute(const In& a, const In& b) const -> EvalResult<std::int64_t> {
        std::partial_ordering ord = std::partial_ordering::unordered;
        if constexpr (std::is_same_v<In, std::int64_t>) {
            ord = compare_int(a, this->args()[0]->type().is_unsigned(), b,
                              this->args()[1]->type().is_unsigned());
        } else {
            ord = a <=> b;
        }
        return std::int64_t{holds<Op>(ord) ? 1 : 0};
    }
};

auto compare_type() -> FieldType {
    auto type = new_field_type(TypeCode::LongLong);
    type.flen = 1;
    return type;
}

template <CmpOp Op, Signature IntSig, Signature RealSig, Signature DecimalSig,
          Signature StringSig>
auto make_compare(std::string_view name) -> BuiltinConstructor {
    return [name](session::SessionContext& ctx,
                  std::vector<ExprPtr> args) -> Result<std::unique_ptr<BuiltinFunction>> {
        const bool all_strings = std::ranges::all_of(args, [](const ExprPtr& arg) {
            return detail::arg_category(arg) == EvalType::String;
        });
        if (all_strings) {
            return detail::make_builtin<Compare<StringSig, Op, std::string>>(ctx, std::move(args),
                                                                             compare_type());
        }
        auto category = detail::numeric_category(name, args);
        if (!category) {
            return std::unexpected(category.error());
        }
        switch (*category) {
            case EvalType::Int:
                return detail::make_builtin<Compare<IntSig, Op, std::int64_t>>(
                    ctx, std::move(args), compare_type());
            case EvalType::Decimal:
                return detail::make_builtin<Compare<DecimalSig, Op, Decimal>>(
                    ctx, std::move(args), compare_type());
            default:
                return detail::make_builtin<Compare<RealSig, Op, double>>(ctx, std::move(args),
                                                                          compare_type());
        }
    };
}

}  // namespace

void register_compare_functions(FunctionRegistry& registry) {
    registry.register_function(
        "eq", 2, 2,
        make_compare<CmpOp::Eq, Signature::EqInt, Signature::EqReal, Signature::EqDecimal,
                     Signature::EqString>("eq"));
    registry.register_function(
        "ne", 2, 2,
        make_compare<CmpOp::Ne, Signature::NeInt, Signature::NeReal, Signature::NeDecimal,
                     Signature::NeString>("ne"));
    registry.register_function(
        "lt", 2, 2,
        make_compare<CmpOp::Lt, Signature::LtInt, Signature::LtReal, Signature::LtDecimal,
                     Signature::LtString>("lt"));
    registry.register_function(
        "le", 2, 2,
        make_compare<CmpOp::Le, Signature::LeInt, Signature::LeReal, Signature::LeDecimal,
                     Signature::LeString>("le"));
    registry.register_function(
        "gt", 2, 2,
        make_compare<CmpOp::Gt, Signature::GtInt, Signature::GtReal, Signature::GtDecimal,
                     Signature::GtString>("gt"));
    registry.register_function(
        "ge", 2, 2,
        make_compare<CmpOp::Ge, Signature::GeInt, Signature::GeReal, Signature::GeDecimal,
                     Signature::GeString>("ge"));
}

}  // namespace scalex::expression
