#include <scalex/expression/constant.hpp>
#include <scalex/expression/scalar_function.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace scalex;
using namespace scalex::expression;

namespace {

constexpr std::int64_t kSecond = 1'000'000'000;

auto int_type() -> FieldType { return new_field_type(TypeCode::LongLong); }

/// Builds `name(args...)` without folding and evaluates it on the empty row.
auto run(session::SessionContext& ctx, std::string_view name, std::vector<ExprPtr> args)
    -> Result<Datum> {
    auto expr = new_function_base(ctx, name, int_type(), std::move(args));
    if (!expr) {
        return std::unexpected(expr.error());
    }
    return eval_to_datum(**expr, chunk::Row{});
}

auto run_ok(session::SessionContext& ctx, std::string_view name, std::vector<ExprPtr> args)
    -> Datum {
    auto value = run(ctx, name, std::move(args));
    REQUIRE(value.has_value());
    return *value;
}

}  // namespace

TEST_CASE("integer arithmetic", "[builtins][arithmetic]") {
    session::SessionContext ctx;

    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "plus", {int_lit(2), int_lit(3)})) == 5);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "minus", {int_lit(2), int_lit(3)})) == -1);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "mul", {int_lit(-4), int_lit(3)})) == -12);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "intdiv", {int_lit(7), int_lit(2)})) == 3);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "mod", {int_lit(-7), int_lit(3)})) == -1);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "abs", {int_lit(-5)})) == 5);

    SECTION("overflow is an error") {
        constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
        constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

        auto sum = run(ctx, "plus", {int_lit(kMax), int_lit(1)});
        REQUIRE_FALSE(sum.has_value());
        REQUIRE(sum.error().code == ErrorCode::Overflow);
        REQUIRE(sum.error().message.contains("BIGINT value is out of range"));

        REQUIRE_FALSE(run(ctx, "mul", {int_lit(kMax), int_lit(2)}).has_value());
        REQUIRE_FALSE(run(ctx, "minus", {int_lit(kMin), int_lit(1)}).has_value());
        REQUIRE_FALSE(run(ctx, "abs", {int_lit(kMin)}).has_value());
        REQUIRE_FALSE(run(ctx, "intdiv", {int_lit(kMin), int_lit(-1)}).has_value());
    }

    SECTION("unsigned operands compute unsigned") {
        constexpr auto kBig = std::uint64_t{1} << 63U;
        auto sum = run_ok(ctx, "plus", {uint_lit(kBig), uint_lit(1)});
        REQUIRE(std::get<std::uint64_t>(sum) == kBig + 1);

        auto below_zero = run(ctx, "minus", {uint_lit(1), uint_lit(2)});
        REQUIRE_FALSE(below_zero.has_value());
        REQUIRE(below_zero.error().code == ErrorCode::Overflow);
    }
}

TEST_CASE("real and decimal arithmetic", "[builtins][arithmetic]") {
    session::SessionContext ctx;

    REQUIRE(std::get<double>(run_ok(ctx, "plus", {real_lit(1.5), int_lit(2)})) ==
            Catch::Approx(3.5));
    REQUIRE(std::get<double>(run_ok(ctx, "div", {int_lit(7), int_lit(2)})) == Catch::Approx(3.5));
    REQUIRE(std::get<double>(run_ok(ctx, "mod", {real_lit(7.5), int_lit(2)})) ==
            Catch::Approx(1.5));
    REQUIRE(std::get<double>(run_ok(ctx, "abs", {real_lit(-0.25)})) == Catch::Approx(0.25));

    SECTION("text operands compute as real") {
        REQUIRE(std::get<double>(run_ok(ctx, "plus", {str_lit("1.25"), int_lit(1)})) ==
                Catch::Approx(2.25));
    }

    SECTION("decimal operands stay exact") {
        auto sum = run_ok(ctx, "plus", {dec_lit(Decimal(125, 2)), int_lit(1)});
        REQUIRE(std::get<Decimal>(sum) == Decimal(225, 2));

        auto diff = run_ok(ctx, "minus", {dec_lit(Decimal(1, 1)), dec_lit(Decimal(3, 1))});
        REQUIRE(std::get<Decimal>(diff) == Decimal(-2, 1));

        auto abs = run_ok(ctx, "abs", {dec_lit(Decimal(-15, 1))});
        REQUIRE(std::get<Decimal>(abs) == Decimal(15, 1));
    }

    SECTION("temporal operands are rejected") {
        auto expr = run(ctx, "mul", {duration_lit(Duration{kSecond}), int_lit(2)});
        REQUIRE_FALSE(expr.has_value());
        REQUIRE(expr.error().code == ErrorCode::InvalidArgumentType);
    }
}

TEST_CASE("division by zero", "[builtins][arithmetic]") {
    SECTION("NULL plus a warning by default") {
        session::SessionContext ctx;
        REQUIRE(is_null(run_ok(ctx, "div", {int_lit(1), int_lit(0)})));
        REQUIRE(is_null(run_ok(ctx, "intdiv", {int_lit(1), int_lit(0)})));
        REQUIRE(is_null(run_ok(ctx, "mod", {int_lit(1), int_lit(0)})));
        REQUIRE(ctx.stmt().warning_count() == 3);

        ctx.stmt().reset_warnings();
        REQUIRE(ctx.stmt().warning_count() == 0);
    }

    SECTION("an error when the session asks for one") {
        session::SessionVars vars;
        vars.error_on_division_by_zero = true;
        session::SessionContext ctx{vars};

        auto value = run(ctx, "div", {int_lit(1), int_lit(0)});
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().code == ErrorCode::DivisionByZero);
        REQUIRE(ctx.stmt().warning_count() == 0);
    }
}

TEST_CASE("NULL operands give NULL", "[builtins]") {
    session::SessionContext ctx;
    REQUIRE(is_null(run_ok(ctx, "plus", {null_lit(int_type()), int_lit(1)})));
    REQUIRE(is_null(run_ok(ctx, "eq", {int_lit(1), null_lit(int_type())})));
    REQUIRE(is_null(run_ok(ctx, "concat", {str_lit("a"), null_lit(int_type())})));
    REQUIRE(is_null(run_ok(ctx, "length", {null_lit(new_field_type(TypeCode::Varchar))})));
}

TEST_CASE("comparison", "[builtins][compare]") {
    session::SessionContext ctx;
    auto cmp = [&](std::string_view name, ExprPtr a, ExprPtr b) {
        return std::get<std::int64_t>(run_ok(ctx, name, {std::move(a), std::move(b)}));
    };

    REQUIRE(cmp("lt", int_lit(1), int_lit(2)) == 1);
    REQUIRE(cmp("le", int_lit(2), int_lit(2)) == 1);
    REQUIRE(cmp("gt", int_lit(1), int_lit(2)) == 0);
    REQUIRE(cmp("ge", real_lit(2.5), int_lit(2)) == 1);
    REQUIRE(cmp("eq", dec_lit(Decimal(150, 2)), dec_lit(Decimal(15, 1))) == 1);
    REQUIRE(cmp("ne", str_lit("a"), str_lit("b")) == 1);
    REQUIRE(cmp("lt", str_lit("abc"), str_lit("abd")) == 1);

    SECTION("unsigned values order above negative ones") {
        const auto max = std::numeric_limits<std::uint64_t>::max();
        REQUIRE(cmp("lt", uint_lit(max), int_lit(-1)) == 0);
        REQUIRE(cmp("gt", uint_lit(max), int_lit(-1)) == 1);
        REQUIRE(cmp("lt", int_lit(-1), uint_lit(0)) == 1);
        REQUIRE(cmp("lt", uint_lit(1), uint_lit(max)) == 1);
    }
}

TEST_CASE("string functions", "[builtins][string]") {
    session::SessionContext ctx;

    auto joined = run_ok(ctx, "concat", {str_lit("a"), int_lit(1), str_lit("b")});
    REQUIRE(std::get<std::string>(joined) == "a1b");

    REQUIRE(std::get<std::string>(run_ok(ctx, "lower", {str_lit("MiXeD")})) == "mixed");
    REQUIRE(std::get<std::string>(run_ok(ctx, "upper", {str_lit("MiXeD")})) == "MIXED");
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "length", {str_lit("four")})) == 4);
    REQUIRE(std::get<std::int64_t>(run_ok(ctx, "length", {int_lit(12345)})) == 5);

    SECTION("temporal values render as text") {
        auto text = run_ok(ctx, "concat", {time_lit(Timestamp{0}), str_lit("!")});
        REQUIRE(std::get<std::string>(text) == "1970-01-01 00:00:00!");
    }

    SECTION("concat length adds up") {
        auto expr = new_function_base(ctx, "concat", int_type(), {str_lit("ab"), str_lit("cde")});
        REQUIRE(expr.has_value());
        REQUIRE((*expr)->type().flen == 5);
    }
}

TEST_CASE("time functions", "[builtins][time]") {
    session::SessionContext ctx;

    auto epoch = run_ok(ctx, "from_unixtime", {int_lit(0)});
    REQUIRE(format_timestamp(std::get<Timestamp>(epoch)) == "1970-01-01 00:00:00");

    auto fractional = run_ok(ctx, "from_unixtime", {dec_lit(Decimal(15, 1))});
    REQUIRE(std::get<Timestamp>(fractional).nanos == kSecond + kSecond / 2);

    REQUIRE(is_null(run_ok(ctx, "from_unixtime", {int_lit(-1)})));

    auto diff = run_ok(ctx, "timediff", {time_lit(Timestamp{90 * kSecond}),
                                         time_lit(Timestamp{30 * kSecond})});
    REQUIRE(std::get<Duration>(diff).nanos == 60 * kSecond);

    auto hms = run_ok(ctx, "sec_to_time", {int_lit(3661)});
    REQUIRE(format_duration(std::get<Duration>(hms)) == "01:01:01");

    SECTION("session time zone shifts the result") {
        session::SessionVars vars;
        vars.time_zone_offset = std::chrono::seconds{3600};
        session::SessionContext east{vars};
        auto shifted = run_ok(east, "from_unixtime", {int_lit(0)});
        REQUIRE(format_timestamp(std::get<Timestamp>(shifted)) == "1970-01-01 01:00:00");
    }

    SECTION("sec_to_time clamps with a warning") {
        auto clamped = run_ok(ctx, "sec_to_time", {int_lit(10'000'000)});
        REQUIRE(format_duration(std::get<Duration>(clamped)) == "838:59:59");
        REQUIRE(ctx.stmt().warning_count() == 1);
    }

    SECTION("timediff needs datetimes") {
        auto bad = run(ctx, "timediff", {int_lit(1), int_lit(2)});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::InvalidArgumentType);
    }

    SECTION("now and sysdate are datetimes") {
        auto now = run_ok(ctx, "now", {});
        auto sysdate = run_ok(ctx, "sysdate", {});
        REQUIRE(std::get<Timestamp>(now).nanos % kSecond == 0);
        REQUIRE(std::get<Timestamp>(sysdate) >= std::get<Timestamp>(now));
    }
}

TEST_CASE("misc functions", "[builtins][misc]") {
    session::SessionContext ctx;

    SECTION("rand is in [0, 1)") {
        for (int i = 0; i < 16; ++i) {
            auto value = std::get<double>(run_ok(ctx, "rand", {}));
            REQUIRE(value >= 0.0);
            REQUIRE(value < 1.0);
        }
    }

    SECTION("seeded rand repeats its sequence") {
        auto first = new_function_base(ctx, "rand", int_type(), {int_lit(3)});
        auto second = new_function_base(ctx, "rand", int_type(), {int_lit(3)});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        for (int i = 0; i < 4; ++i) {
            auto a = (*first)->eval_real(chunk::Row{});
            auto b = (*second)->eval_real(chunk::Row{});
            REQUIRE(a->value() == b->value());
        }
    }

    SECTION("uuid is a version 4 UUID") {
        auto text = std::get<std::string>(run_ok(ctx, "uuid", {}));
        REQUIRE(text.size() == 36);
        REQUIRE(text[8] == '-');
        REQUIRE(text[13] == '-');
        REQUIRE(text[14] == '4');
        REQUIRE(text[18] == '-');
        REQUIRE(text[23] == '-');
        REQUIRE(text != std::get<std::string>(run_ok(ctx, "uuid", {})));
    }
}
