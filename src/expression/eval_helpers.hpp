#pragma once

#include <scalex/chunk/column.hpp>
#include <scalex/core/datum.hpp>
#include <scalex/expression/expression.hpp>

#include <cstddef>
#include <optional>

namespace scalex::expression::detail {

/// Typed view of a boxed value; NULL stays NULL.
template <typename T>
[[nodiscard]] auto datum_eval(const Datum& datum) -> EvalResult<T> {
    if (is_null(datum)) {
        return std::optional<T>{};
    }
    auto value = datum_as<T>(datum);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<T>{std::move(*value)};
}

/// Broadcasts one boxed value over `rows` rows of `result`.
template <typename T>
[[nodiscard]] auto fill_datum(const Datum& datum, std::size_t rows, chunk::ColumnVector& result)
    -> Status {
    result.reset<T>(rows);
    if (is_null(datum)) {
        for (std::size_t i = 0; i < rows; ++i) {
            result.set_null(i, true);
        }
        return {};
    }
    auto value = datum_as<T>(datum);
    if (!value) {
        return std::unexpected(value.error());
    }
    auto& values = *result.values<T>();
    for (std::size_t i = 0; i < rows; ++i) {
        values[i] = *value;
    }
    return {};
}

}  // namespace scalex::expression::detail
