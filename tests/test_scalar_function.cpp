#include <scalex/expression/builtin.hpp>
#include <scalex/expression/column.hpp>
#include <scalex/expression/constant.hpp>
#include <scalex/expression/function_registry.hpp>
#include <scalex/expression/scalar_function.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace scalex;
using namespace scalex::expression;

namespace {

auto int_type() -> FieldType { return new_field_type(TypeCode::LongLong); }

/// Returns the bit pattern of -1 with no type of its own.
class MinusOne final : public TypedFunction<MinusOne, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::Extension;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& /*row*/) const -> EvalResult<std::int64_t> {
        return std::int64_t{-1};
    }
};

auto untyped_registry() -> FunctionRegistry {
    FunctionRegistry registry;
    registry.register_function(
        "minus_one", 0, 0,
        [](session::SessionContext& ctx,
           std::vector<ExprPtr> args) -> Result<std::unique_ptr<BuiltinFunction>> {
            return std::make_unique<MinusOne>(ctx, std::move(args), FieldType{});
        });
    return registry;
}

auto sample_args(const std::string& name) -> std::optional<std::vector<ExprPtr>> {
    static const std::map<std::string, int> kShapes = {
        {"plus", 2},     {"minus", 2},  {"mul", 2},    {"div", 2},      {"intdiv", 2},
        {"mod", 2},      {"eq", 2},     {"ne", 2},     {"lt", 2},       {"le", 2},
        {"gt", 2},       {"ge", 2},     {"abs", 1},    {"bitneg", 1},   {"concat", 3},
        {"lower", 4},    {"upper", 4},  {"length", 4}, {"now", 0},      {"sysdate", 0},
        {"rand", 0},     {"uuid", 0},   {"from_unixtime", 1},           {"sec_to_time", 1},
        {"timediff", 5},
    };
    auto it = kShapes.find(name);
    if (it == kShapes.end()) {
        return std::nullopt;
    }
    switch (it->second) {
        case 0:
            return std::vector<ExprPtr>{};
        case 1:
            return std::vector<ExprPtr>{int_lit(60)};
        case 2:
            return std::vector<ExprPtr>{int_lit(7), int_lit(2)};
        case 3:
            return std::vector<ExprPtr>{str_lit("a"), str_lit("b")};
        case 4:
            return std::vector<ExprPtr>{str_lit("Ab")};
        default:
            return std::vector<ExprPtr>{time_lit(Timestamp{2'000'000'000}),
                                        time_lit(Timestamp{1'000'000'000})};
    }
}

}  // namespace

TEST_CASE("every builtin constructs with a return type", "[expression][scalar_function]") {
    session::SessionContext ctx;
    for (const auto& name : FunctionRegistry::builtins().names()) {
        INFO("function " << name);
        auto args = sample_args(name);
        REQUIRE(args.has_value());

        auto expr = new_function_base(ctx, name, int_type(), std::move(*args));
        REQUIRE(expr.has_value());
        REQUIRE((*expr)->kind() == ExprKind::ScalarFunction);
        REQUIRE((*expr)->type().tp != TypeCode::Unspecified);
    }
}

TEST_CASE("construction errors", "[expression][scalar_function]") {
    session::SessionContext ctx;

    SECTION("absent return type") {
        auto expr = new_function(ctx, "plus", std::nullopt, {int_lit(1), int_lit(2)});
        REQUIRE_FALSE(expr.has_value());
        REQUIRE(expr.error().code == ErrorCode::InvalidReturnType);
    }

    SECTION("unknown function") {
        auto expr = new_function(ctx, "no_such_fn", int_type(), {});
        REQUIRE_FALSE(expr.has_value());
        REQUIRE(expr.error().code == ErrorCode::FunctionNotFound);
    }

    SECTION("arity errors come from the registry") {
        auto expr = new_function(ctx, "plus", int_type(), {int_lit(1)});
        REQUIRE_FALSE(expr.has_value());
        REQUIRE(expr.error().code == ErrorCode::IncorrectParameterCount);
    }

    SECTION("argument type errors come from the builtin") {
        auto expr = new_function(ctx, "plus", int_type(), {time_lit(Timestamp{0}), int_lit(1)});
        REQUIRE_FALSE(expr.has_value());
        REQUIRE(expr.error().code == ErrorCode::InvalidArgumentType);
    }

    SECTION("error-swallowing variant returns nullptr") {
        REQUIRE(new_function_internal(ctx, "no_such_fn", int_type(), {}) == nullptr);
        REQUIRE(new_function_internal(ctx, "plus", int_type(), {int_lit(1), int_lit(1)}) !=
                nullptr);
    }
}

TEST_CASE("function names are canonical lowercase", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto expr = new_function_base(ctx, "PLUS", int_type(), {a, int_lit(1)});
    REQUIRE(expr.has_value());

    auto fn = std::static_pointer_cast<ScalarFunction>(*expr);
    REQUIRE(fn->name() == "plus");
    REQUIRE(fn->to_string() == "plus(a, 1)");
}

TEST_CASE("return type reconciliation", "[expression][scalar_function]") {
    session::SessionContext ctx;

    SECTION("a concrete builtin type wins over the declared one") {
        auto expr = new_function_base(ctx, "plus", new_field_type(TypeCode::Double),
                                      {int_lit(1), int_lit(2)});
        REQUIRE(expr.has_value());
        REQUIRE((*expr)->type().tp == TypeCode::LongLong);
    }

    SECTION("the declared type fills an unspecified builtin type") {
        auto registry = untyped_registry();
        auto expr = new_function_impl(ctx, registry, false, "minus_one", int_type(), {});
        REQUIRE(expr.has_value());
        REQUIRE((*expr)->type() == int_type());
    }

    SECTION("both unspecified stays unspecified") {
        auto registry = untyped_registry();
        auto expr = new_function_impl(ctx, registry, false, "minus_one", FieldType{}, {});
        REQUIRE(expr.has_value());
        REQUIRE((*expr)->type().tp == TypeCode::Unspecified);
    }
}

TEST_CASE("eval reinterprets unsigned integers", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto registry = untyped_registry();
    auto type = int_type();
    type.flag |= type_flag::kUnsigned;

    auto expr = new_function_impl(ctx, registry, false, "minus_one", type, {});
    REQUIRE(expr.has_value());

    auto value = (*expr)->eval(chunk::Row{});
    REQUIRE(value.has_value());
    REQUIRE(std::get<std::uint64_t>(*value) == std::numeric_limits<std::uint64_t>::max());

    SECTION("signed declaration keeps -1") {
        auto signed_expr = new_function_impl(ctx, registry, false, "minus_one", int_type(), {});
        auto signed_value = (*signed_expr)->eval(chunk::Row{});
        REQUIRE(std::get<std::int64_t>(*signed_value) == -1);
    }

    SECTION("bitneg(0) is the largest unsigned value") {
        auto bitneg = new_function_base(ctx, "bitneg", int_type(), {int_lit(0)});
        REQUIRE(bitneg.has_value());
        REQUIRE((*bitneg)->type().is_unsigned());
        auto bits = (*bitneg)->eval(chunk::Row{});
        REQUIRE(std::get<std::uint64_t>(*bits) == std::numeric_limits<std::uint64_t>::max());
    }
}

TEST_CASE("eval only dispatches int, real and string", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto expr = new_function_base(ctx, "plus", new_field_type(TypeCode::NewDecimal),
                                  {dec_lit(Decimal(15, 1)), dec_lit(Decimal(2, 0))});
    REQUIRE(expr.has_value());
    REQUIRE((*expr)->type().eval_type() == EvalType::Decimal);

    auto value = (*expr)->eval(chunk::Row{});
    REQUIRE(value.has_value());
    REQUIRE(is_null(*value));

    SECTION("the typed evaluator still computes the value") {
        auto dec = (*expr)->eval_decimal(chunk::Row{});
        REQUIRE(dec.has_value());
        REQUIRE(dec->value() == Decimal(35, 1));

        auto boxed = eval_to_datum(**expr, chunk::Row{});
        REQUIRE(std::get<Decimal>(*boxed) == Decimal(35, 1));
    }
}

TEST_CASE("eval propagates evaluator errors", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto expr = new_function_base(ctx, "plus", int_type(),
                                  {int_lit(std::numeric_limits<std::int64_t>::max()), int_lit(1)});
    REQUIRE(expr.has_value());

    auto value = (*expr)->eval(chunk::Row{});
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code == ErrorCode::Overflow);

    SECTION("a category the builtin lacks is unsupported") {
        auto real = (*expr)->eval_real(chunk::Row{});
        REQUIRE_FALSE(real.has_value());
        REQUIRE(real.error().code == ErrorCode::UnsupportedEvalType);
    }
}

TEST_CASE("rendering", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto inner = new_function_base(ctx, "mul", int_type(), {int_lit(2), int_lit(3)});
    REQUIRE(inner.has_value());
    auto outer = new_function_base(ctx, "plus", int_type(), {a, *inner});
    REQUIRE(outer.has_value());

    REQUIRE((*outer)->to_string() == "plus(a, mul(2, 3))");
    REQUIRE((*outer)->to_json() == "\"plus(a, mul(2, 3))\"");

    auto now = new_function_base(ctx, "now", int_type(), {});
    REQUIRE((*now)->to_string() == "now()");
}

TEST_CASE("equality delegates to the builtin", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto b = ColumnRef::make(2, "b", int_type());

    auto f1 = *new_function_base(ctx, "plus", int_type(), {a, int_lit(1)});
    auto f2 = *new_function_base(ctx, "plus", int_type(), {a, int_lit(1)});
    auto f3 = *new_function_base(ctx, "plus", int_type(), {b, int_lit(1)});
    auto f4 = *new_function_base(ctx, "minus", int_type(), {a, int_lit(1)});
    auto f5 = *new_function_base(ctx, "plus", int_type(), {a, real_lit(1.0)});

    REQUIRE(f1->equal(*f2));
    REQUIRE_FALSE(f1->equal(*f3));
    REQUIRE_FALSE(f1->equal(*f4));
    REQUIRE_FALSE(f1->equal(*f5));
    REQUIRE_FALSE(f1->equal(*a));
    REQUIRE(f1->equal(*f1->clone()));
}

TEST_CASE("registered extensions never match a catalog builtin", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto registry = untyped_registry();
    auto ext = new_function_impl(ctx, registry, false, "minus_one", int_type(), {});
    auto now = new_function_base(ctx, "now", int_type(), {});
    REQUIRE(ext.has_value());
    REQUIRE(now.has_value());

    const auto& ext_fn = static_cast<const ScalarFunction&>(**ext);
    const auto& now_fn = static_cast<const ScalarFunction&>(**now);
    REQUIRE(ext_fn.function().sig() == Signature::Extension);
    REQUIRE(signature_name(ext_fn.function().sig()) == "Extension");
    REQUIRE_FALSE(ext_fn.function().equal(now_fn.function()));
    REQUIRE_FALSE(ext_fn.equal(now_fn));
}

TEST_CASE("scalar_funcs_to_exprs keeps order", "[expression][scalar_function]") {
    session::SessionContext ctx;
    auto f1 = std::static_pointer_cast<ScalarFunction>(
        *new_function_base(ctx, "plus", int_type(), {int_lit(1), int_lit(2)}));
    auto f2 = std::static_pointer_cast<ScalarFunction>(
        *new_function_base(ctx, "minus", int_type(), {int_lit(1), int_lit(2)}));

    auto exprs = scalar_funcs_to_exprs({f1, f2});
    REQUIRE(exprs.size() == 2);
    REQUIRE(exprs[0].get() == f1.get());
    REQUIRE(exprs[1].get() == f2.get());
}
