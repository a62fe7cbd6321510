#include <scalex/chunk/chunk.hpp>
#include <scalex/expression/column.hpp>
#include <scalex/expression/constant.hpp>
#include <scalex/expression/schema.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace scalex;
using namespace scalex::expression;

namespace {

auto int_type() -> FieldType { return new_field_type(TypeCode::LongLong); }

auto make_chunk() -> chunk::Chunk {
    chunk::Chunk batch;
    batch.add_column(chunk::ColumnVector{chunk::Column<std::int64_t>{5, 6},
                                         std::vector<bool>{true, false}});
    batch.add_column(chunk::ColumnVector{chunk::Column<std::string>{"p", "q"}});
    return batch;
}

}  // namespace

TEST_CASE("ColumnRef reads its offset", "[expression][column]") {
    auto batch = make_chunk();
    auto col = ColumnRef::make(7, "a", int_type(), 0);

    auto value = col->eval_int(batch.row(0));
    REQUIRE(value.has_value());
    REQUIRE(value->value() == 5);

    SECTION("null slot is NULL") {
        auto null_value = col->eval_int(batch.row(1));
        REQUIRE(null_value.has_value());
        REQUIRE_FALSE(null_value->has_value());
    }

    SECTION("generic eval boxes the value") {
        auto boxed = col->eval(batch.row(0));
        REQUIRE(boxed.has_value());
        REQUIRE(std::get<std::int64_t>(*boxed) == 5);
    }

    SECTION("wrong category is a type mismatch") {
        auto wrong = col->eval_string(batch.row(0));
        REQUIRE_FALSE(wrong.has_value());
        REQUIRE(wrong.error().code == ErrorCode::TypeMismatch);
    }

    SECTION("empty row is rejected") {
        auto empty = col->eval_int(chunk::Row{});
        REQUIRE_FALSE(empty.has_value());
        REQUIRE(empty.error().code == ErrorCode::EmptyRow);
    }

    SECTION("offset past the row is rejected") {
        auto far = ColumnRef::make(8, "z", int_type(), 9);
        auto missing = far->eval_int(batch.row(0));
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().code == ErrorCode::ColumnNotFound);
    }
}

TEST_CASE("ColumnRef identity and rendering", "[expression][column]") {
    auto a = ColumnRef::make(1, "a", int_type());
    auto a_again = ColumnRef::make(1, "a", int_type(), 3);
    auto b = ColumnRef::make(2, "b", int_type());

    REQUIRE(a->equal(*a_again));
    REQUIRE_FALSE(a->equal(*b));
    REQUIRE(a->to_string() == "a");
    REQUIRE(ColumnRef::make(9, "", int_type())->to_string() == "Column#9");
    REQUIRE_FALSE(a->const_item());
    REQUIRE_FALSE(a->is_correlated());
    REQUIRE(a->to_json() == "\"a\"");
}

TEST_CASE("Schema looks columns up by unique id", "[expression][schema]") {
    auto a = ColumnRef::make(1, "a", int_type());
    auto b = ColumnRef::make(2, "b", int_type());
    Schema schema({b, a});

    REQUIRE(schema.size() == 2);
    REQUIRE(schema.column_index(*a) == 1);
    REQUIRE(schema.column_index(*ColumnRef::make(1, "renamed", int_type())) == 1);
    REQUIRE_FALSE(schema.contains(*ColumnRef::make(3, "c", int_type())));
    REQUIRE(schema.to_string() == "Column: [b,a]");
}

TEST_CASE("Constant converts to the requested category", "[expression][constant]") {
    auto c = int_lit(42);
    REQUIRE(c->const_item());
    REQUIRE(c->type().eval_type() == EvalType::Int);
    REQUIRE(c->to_string() == "42");

    REQUIRE(c->eval_int(chunk::Row{})->value() == 42);
    REQUIRE(c->eval_real(chunk::Row{})->value() == Catch::Approx(42.0));
    REQUIRE(c->eval_string(chunk::Row{})->value() == "42");
    REQUIRE(c->eval_decimal(chunk::Row{})->value() == Decimal(42, 0));

    SECTION("temporal conversion fails") {
        auto value = c->eval_time(chunk::Row{});
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().code == ErrorCode::TypeMismatch);
    }

    SECTION("NULL constant is NULL in every category") {
        auto null = null_lit(int_type());
        REQUIRE_FALSE(null->eval_int(chunk::Row{})->has_value());
        REQUIRE_FALSE(null->eval_string(chunk::Row{})->has_value());
        REQUIRE(null->to_string() == "NULL");
    }
}

TEST_CASE("Constant equality requires the same category", "[expression][constant]") {
    REQUIRE(int_lit(1)->equal(*int_lit(1)));
    REQUIRE_FALSE(int_lit(1)->equal(*int_lit(2)));
    REQUIRE_FALSE(int_lit(1)->equal(*real_lit(1.0)));
    REQUIRE_FALSE(int_lit(1)->equal(*ColumnRef::make(1, "a", int_type())));
}

TEST_CASE("CorrelatedColumn reads its bound outer value", "[expression][column]") {
    auto a = ColumnRef::make(1, "a", int_type());
    auto corr = CorrelatedColumn::make(a);

    REQUIRE(corr->is_correlated());
    REQUIRE_FALSE(corr->const_item());
    REQUIRE(corr->equal(*CorrelatedColumn::make(ColumnRef::make(1, "a", int_type()))));
    REQUIRE_FALSE(corr->equal(*a));
    REQUIRE_FALSE(a->equal(*corr));
    REQUIRE_FALSE(corr->equal(*int_lit(1)));
    REQUIRE_FALSE(corr->eval_int(chunk::Row{})->has_value());

    corr->set_value(Datum{std::int64_t{11}});
    REQUIRE(corr->eval_int(chunk::Row{})->value() == 11);

    SECTION("clones share the binding") {
        auto copy = corr->clone();
        corr->set_value(Datum{std::int64_t{12}});
        REQUIRE(copy->eval_int(chunk::Row{})->value() == 12);
    }

    SECTION("decorrelate returns the column when the schema has it") {
        Schema inner({a});
        auto rewritten = corr->decorrelate(inner);
        REQUIRE(rewritten->kind() == ExprKind::Column);
        REQUIRE(rewritten.get() == a.get());

        Schema other({ColumnRef::make(2, "b", int_type())});
        REQUIRE(corr->decorrelate(other).get() == corr.get());
    }
}
