#include <scalex/expression/constant.hpp>
#include <scalex/expression/function_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace scalex;
using namespace scalex::expression;

namespace {

class Zero final : public TypedFunction<Zero, std::int64_t> {
   public:
    static constexpr Signature kSig = Signature::Extension;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& /*row*/) const -> EvalResult<std::int64_t> {
        return std::int64_t{0};
    }
};

auto make_zero(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    return std::make_unique<Zero>(ctx, std::move(args), new_field_type(TypeCode::LongLong));
}

}  // namespace

TEST_CASE("builtin catalog is complete", "[registry]") {
    const auto& registry = FunctionRegistry::builtins();
    const std::vector<std::string> expected = {
        "abs",    "bitneg",  "concat", "div",         "eq",        "from_unixtime", "ge",
        "gt",     "intdiv",  "le",     "length",      "lower",     "lt",            "minus",
        "mod",    "mul",     "ne",     "now",         "plus",      "rand",          "sec_to_time",
        "sysdate", "timediff", "upper", "uuid",
    };
    REQUIRE(registry.names() == expected);
    REQUIRE(registry.size() == expected.size());
    REQUIRE(&registry == &FunctionRegistry::builtins());
}

TEST_CASE("lookup ignores case", "[registry]") {
    const auto& registry = FunctionRegistry::builtins();
    REQUIRE(registry.contains("plus"));
    REQUIRE(registry.contains("PLUS"));
    REQUIRE(registry.find("Sec_To_Time") == registry.find("sec_to_time"));
    REQUIRE(registry.find("nope") == nullptr);
    REQUIRE(canonical_name("FROM_UnixTime") == "from_unixtime");
}

TEST_CASE("get_function checks arity", "[registry]") {
    session::SessionContext ctx;
    const auto& registry = FunctionRegistry::builtins();

    SECTION("too few") {
        auto fn = registry.get_function(ctx, "plus", {int_lit(1)});
        REQUIRE_FALSE(fn.has_value());
        REQUIRE(fn.error().code == ErrorCode::IncorrectParameterCount);
        REQUIRE(fn.error().message ==
                "incorrect parameter count in the call to native function 'plus'");
    }

    SECTION("too many") {
        auto fn = registry.get_function(ctx, "uuid", {int_lit(1)});
        REQUIRE_FALSE(fn.has_value());
        REQUIRE(fn.error().code == ErrorCode::IncorrectParameterCount);
    }

    SECTION("optional argument") {
        REQUIRE(registry.get_function(ctx, "rand", {}).has_value());
        REQUIRE(registry.get_function(ctx, "rand", {int_lit(7)}).has_value());
        REQUIRE_FALSE(registry.get_function(ctx, "rand", {int_lit(1), int_lit(2)}).has_value());
    }

    SECTION("variadic") {
        std::vector<ExprPtr> args;
        for (int i = 0; i < 5; ++i) {
            args.push_back(str_lit("x"));
        }
        auto fn = registry.get_function(ctx, "concat", std::move(args));
        REQUIRE(fn.has_value());
        REQUIRE((*fn)->args().size() == 5);
        REQUIRE_FALSE(registry.get_function(ctx, "concat", {}).has_value());
    }

    SECTION("unknown name") {
        auto fn = registry.get_function(ctx, "nope", {});
        REQUIRE_FALSE(fn.has_value());
        REQUIRE(fn.error().code == ErrorCode::FunctionNotFound);
    }
}

TEST_CASE("custom registry", "[registry]") {
    session::SessionContext ctx;
    FunctionRegistry registry;
    REQUIRE(registry.size() == 0);

    registry.register_function("Zero", 0, 0, make_zero);
    REQUIRE(registry.contains("zero"));
    REQUIRE(registry.names() == std::vector<std::string>{"zero"});

    auto fn = registry.get_function(ctx, "ZERO", {});
    REQUIRE(fn.has_value());
    REQUIRE((*fn)->sig() == Signature::Extension);

    SECTION("re-registering replaces the entry") {
        registry.register_function("zero", 1, 1, make_zero);
        REQUIRE(registry.size() == 1);
        REQUIRE_FALSE(registry.get_function(ctx, "zero", {}).has_value());
        REQUIRE(registry.get_function(ctx, "zero", {int_lit(1)}).has_value());
    }
}

TEST_CASE("unfoldable functions", "[registry]") {
    for (const auto* name : {"sysdate", "rand", "uuid", "sleep", "found_rows", "row", "values",
                             "setvar", "getvar", "getparam", "benchmark"}) {
        INFO(name);
        REQUIRE(is_unfoldable_function(name));
    }
    REQUIRE_FALSE(is_unfoldable_function("now"));
    REQUIRE_FALSE(is_unfoldable_function("plus"));
}
