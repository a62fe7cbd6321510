#include <scalex/chunk/chunk.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace scalex::chunk {

Chunk::Chunk(std::vector<ColumnVector> columns) {
    columns_.reserve(columns.size());
    for (auto& column : columns) {
        add_column(std::move(column));
    }
}

void Chunk::add_column(ColumnVector column) {
    if (columns_.empty() && rows_ == 0) {
        rows_ = column.size();
    } else if (column.size() != rows_) {
        throw std::invalid_argument(
            fmt::format("column length {} does not match chunk rows {}", column.size(), rows_));
    }
    columns_.push_back(std::move(column));
}

}  // namespace scalex::chunk
