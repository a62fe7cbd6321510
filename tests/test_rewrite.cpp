#include <scalex/chunk/chunk.hpp>
#include <scalex/expression/column.hpp>
#include <scalex/expression/constant.hpp>
#include <scalex/expression/scalar_function.hpp>
#include <scalex/expression/schema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace scalex;
using namespace scalex::expression;

namespace {

auto int_type() -> FieldType { return new_field_type(TypeCode::LongLong); }

auto build(session::SessionContext& ctx, std::string_view name, std::vector<ExprPtr> args)
    -> std::shared_ptr<ScalarFunction> {
    auto expr = new_function_base(ctx, name, int_type(), std::move(args));
    REQUIRE(expr.has_value());
    return std::static_pointer_cast<ScalarFunction>(*expr);
}

}  // namespace

TEST_CASE("clone is independent of the original", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto fn = build(ctx, "plus", {a, build(ctx, "mul", {a, int_lit(2)})});

    auto copy = std::static_pointer_cast<ScalarFunction>(fn->clone());
    REQUIRE(copy.get() != fn.get());
    REQUIRE(copy->equal(*fn));
    REQUIRE(copy->args()[0].get() != fn->args()[0].get());

    copy->replace_arg(0, int_lit(9));
    REQUIRE(fn->to_string() == "plus(a, mul(a, 2))");
    REQUIRE(copy->to_string() == "plus(9, mul(a, 2))");
    REQUIRE_FALSE(copy->equal(*fn));
}

TEST_CASE("replace_arg on a clone keeps hashed parents intact", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto inner = build(ctx, "plus", {a, int_lit(1)});
    auto parent = build(ctx, "abs", {inner});
    const auto parent_hash = parent->hash_code(ctx.stmt());

    auto copy = std::static_pointer_cast<ScalarFunction>(inner->clone());
    copy->replace_arg(1, int_lit(2));

    REQUIRE(copy->to_string() == "plus(a, 2)");
    auto fresh = build(ctx, "plus", {a, int_lit(2)});
    REQUIRE(copy->hash_code(ctx.stmt()) == fresh->hash_code(ctx.stmt()));
    REQUIRE(parent->to_string() == "abs(plus(a, 1))");
    REQUIRE(parent->hash_code(ctx.stmt()) == parent_hash);
    REQUIRE(parent->args()[0].get() == inner.get());
}

TEST_CASE("resolve_indices binds a clone", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto b = ColumnRef::make(2, "b", int_type());
    auto fn = build(ctx, "minus", {a, b});

    const auto rendered = fn->to_string();
    const auto hash = fn->hash_code(ctx.stmt());

    Schema schema({b, a});
    auto resolved = fn->resolve_indices(schema);
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->get() != fn.get());

    SECTION("the receiver is untouched") {
        REQUIRE(fn->to_string() == rendered);
        REQUIRE(fn->hash_code(ctx.stmt()) == hash);
        REQUIRE(a->index() == 0);
        REQUIRE(b->index() == 0);
        REQUIRE(fn->args()[0].get() == a.get());
    }

    SECTION("the clone reads the bound offsets") {
        chunk::Chunk batch;
        batch.add_column(chunk::ColumnVector{chunk::Column<std::int64_t>{100}});
        batch.add_column(chunk::ColumnVector{chunk::Column<std::int64_t>{1}});

        auto value = (*resolved)->eval(batch.row(0));
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::int64_t>(*value) == 1 - 100);

        const auto& bound = static_cast<const ScalarFunction&>(**resolved);
        REQUIRE(static_cast<const ColumnRef&>(*bound.args()[0]).index() == 1);
        REQUIRE(static_cast<const ColumnRef&>(*bound.args()[1]).index() == 0);
    }

    SECTION("the clone keeps rendering and hash") {
        REQUIRE((*resolved)->to_string() == rendered);
        REQUIRE((*resolved)->hash_code(ctx.stmt()) == hash);
    }
}

TEST_CASE("resolve_indices reports a missing column", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());
    auto c = ColumnRef::make(3, "c", int_type());
    auto fn = build(ctx, "plus", {a, build(ctx, "abs", {c})});

    Schema schema({a});
    auto resolved = fn->resolve_indices(schema);
    REQUIRE_FALSE(resolved.has_value());
    REQUIRE(resolved.error().code == ErrorCode::ColumnNotFound);
    REQUIRE(resolved.error().message.contains("Can't find column c"));
    REQUIRE(resolved.error().message.contains("Column: [a]"));
    REQUIRE(fn->to_string() == "plus(a, abs(c))");
}

TEST_CASE("decorrelate rewrites in place", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto outer = ColumnRef::make(10, "o", int_type());
    auto inner = ColumnRef::make(11, "i", int_type());
    auto fn = build(ctx, "plus", {CorrelatedColumn::make(outer), inner});
    REQUIRE(fn->is_correlated());

    SECTION("columns the schema provides are uncorrelated") {
        Schema schema({outer, inner});
        auto result = fn->decorrelate(schema);
        REQUIRE(result.get() == fn.get());
        REQUIRE(fn->args()[0]->kind() == ExprKind::Column);
        REQUIRE_FALSE(fn->is_correlated());
    }

    SECTION("other columns stay correlated") {
        Schema schema({inner});
        auto result = fn->decorrelate(schema);
        REQUIRE(result.get() == fn.get());
        REQUIRE(fn->args()[0]->kind() == ExprKind::CorrelatedColumn);
        REQUIRE(fn->is_correlated());
    }

    SECTION("nested calls are rewritten") {
        auto nested = build(ctx, "abs", {fn});
        REQUIRE(nested->is_correlated());
        Schema schema({outer});
        static_cast<void>(nested->decorrelate(schema));
        REQUIRE_FALSE(nested->is_correlated());
    }

    SECTION("clone first to keep the original") {
        auto copy = fn->clone();
        Schema schema({outer});
        static_cast<void>(copy->decorrelate(schema));
        REQUIRE_FALSE(copy->is_correlated());
        REQUIRE(fn->is_correlated());
    }
}

TEST_CASE("const_item classification", "[expression][rewrite]") {
    session::SessionContext ctx;
    auto a = ColumnRef::make(1, "a", int_type());

    REQUIRE(build(ctx, "plus", {int_lit(1), int_lit(2)})->const_item());
    REQUIRE(build(ctx, "plus", {int_lit(1), build(ctx, "mul", {int_lit(2), int_lit(3)})})
                ->const_item());
    REQUIRE(build(ctx, "now", {})->const_item());

    REQUIRE_FALSE(build(ctx, "plus", {a, int_lit(2)})->const_item());
    REQUIRE_FALSE(build(ctx, "plus", {int_lit(1), build(ctx, "abs", {a})})->const_item());
    REQUIRE_FALSE(build(ctx, "rand", {})->const_item());
    REQUIRE_FALSE(build(ctx, "uuid", {})->const_item());
    REQUIRE_FALSE(build(ctx, "sysdate", {})->const_item());
    REQUIRE_FALSE(build(ctx, "plus", {int_lit(1), build(ctx, "rand", {})})->const_item());
    REQUIRE_FALSE(build(ctx, "plus", {CorrelatedColumn::make(a), int_lit(1)})->const_item());
}
