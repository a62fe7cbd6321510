#include <scalex/expression/builtins.hpp>

#include "builtin_util.hpp"

#include <algorithm>
#include <cctype>

namespace scalex::expression {

namespace {

/// NULL when any argument is NULL.
class Concat final : public TypedFunction<Concat, std::string> {
   public:
    static constexpr Signature kSig = Signature::Concat;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& row) const -> EvalResult<std::string> {
        std::string out;
        for (std::size_t i = 0; i < args().size(); ++i) {
            auto part = eval_arg<std::string>(i, row);
            if (!part) {
                return std::unexpected(part.error());
            }
            if (!part->has_value()) {
                return std::optional<std::string>{};
            }
            out.append(**part);
        }
        return out;
    }
};

class Lower final : public detail::UnaryFunction<Lower, std::string> {
   public:
    static constexpr Signature kSig = Signature::Lower;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const std::string& s) const -> EvalResult<std::string> {
        std::string out = s;
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
};

class Upper final : public detail::UnaryFunction<Upper, std::string> {
   public:
    static constexpr Signature kSig = Signature::Upper;
    static constexpr bool kVectorized = false;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const std::string& s) const -> EvalResult<std::string> {
        std::string out = s;
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }
};

/// Length in bytes.
class Length final : public detail::UnaryFunction<Length, std::int64_t, std::string> {
   public:
    static constexpr Signature kSig = Signature::Length;
    using UnaryFunction::UnaryFunction;

    [[nodiscard]] auto compute(const std::string& s) const -> EvalResult<std::int64_t> {
        return static_cast<std::int64_t>(s.size());
    }
};

auto varchar_type(int flen) -> FieldType {
    auto type = new_field_type(TypeCode::Varchar);
    type.flen = flen;
    return type;
}

auto make_concat(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    int flen = 0;
    for (const auto& arg : args) {
        if (arg->type().flen < 0) {
            flen = kUnspecifiedLength;
            break;
        }
        flen += arg->type().flen;
    }
    return detail::make_builtin<Concat>(ctx, std::move(args), varchar_type(flen));
}

template <typename Fn>
auto make_case_mapping() -> BuiltinConstructor {
    return [](session::SessionContext& ctx,
              std::vector<ExprPtr> args) -> Result<std::unique_ptr<BuiltinFunction>> {
        const int flen = args[0]->type().flen;
        return detail::make_builtin<Fn>(ctx, std::move(args), varchar_type(flen));
    };
}

auto make_length(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    return detail::make_builtin<Length>(ctx, std::move(args), new_field_type(TypeCode::LongLong));
}

}  // namespace

void register_string_functions(FunctionRegistry& registry) {
    registry.register_function("concat", 1, kVariadic, make_concat);
    registry.register_function("lower", 1, 1, make_case_mapping<Lower>());
    registry.register_function("upper", 1, 1, make_case_mapping<Upper>());
    registry.register_function("length", 1, 1, make_length);
}

}  // namespace scalex::expression
