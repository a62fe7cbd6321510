#include <scalex/scalex.hpp>

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>

namespace ex = scalex::expression;

auto main() -> int {
    scalex::session::SessionContext ctx;

    // Build a batch with two integer columns
    scalex::chunk::Chunk chunk;
    chunk.add_column(scalex::chunk::ColumnVector{scalex::chunk::Column<std::int64_t>{1, 2, 3, 4}});
    chunk.add_column(
        scalex::chunk::ColumnVector{scalex::chunk::Column<std::int64_t>{10, 20, 30, 40}});

    auto a = ex::ColumnRef::make(1, "a", scalex::new_field_type(scalex::TypeCode::LongLong));
    auto b = ex::ColumnRef::make(2, "b", scalex::new_field_type(scalex::TypeCode::LongLong));
    ex::Schema schema({a, b});

    fmt::print("=== Construction ===\n");
    auto sum = ex::new_function(ctx, "plus", scalex::new_field_type(scalex::TypeCode::LongLong),
                                {a, ex::int_lit(100)});
    if (!sum) {
        fmt::print("error: {}\n", sum.error().format());
        return 1;
    }
    auto folded = ex::new_function(ctx, "mul", scalex::new_field_type(scalex::TypeCode::LongLong),
                                   {ex::int_lit(6), ex::int_lit(7)});
    if (!folded) {
        fmt::print("error: {}\n", folded.error().format());
        return 1;
    }
    fmt::print("{} -> {}\n", (*sum)->to_string(), (*sum)->to_json());
    fmt::print("mul(6, 7) folds to {}\n", (*folded)->to_string());

    fmt::print("\n=== Evaluation ===\n");
    auto bound = (*sum)->resolve_indices(schema);
    if (!bound) {
        fmt::print("error: {}\n", bound.error().format());
        return 1;
    }
    for (std::size_t i = 0; i < chunk.num_rows(); ++i) {
        auto value = (*bound)->eval(chunk.row(i));
        if (!value) {
            fmt::print("error: {}\n", value.error().format());
            return 1;
        }
        fmt::print("row {}: {}\n", i, scalex::datum_to_string(*value));
    }

    scalex::chunk::ColumnVector out;
    if (auto status = (*bound)->vec_eval_int(chunk, out); !status) {
        fmt::print("error: {}\n", status.error().format());
        return 1;
    }
    fmt::print("vectorized: {} rows, {} nulls\n", out.size(), out.null_count());

    fmt::print("\n=== Hashing ===\n");
    fmt::print("hash: {}\n", scalex::codec::to_hex((*sum)->hash_code(ctx.stmt())));

    return 0;
}
