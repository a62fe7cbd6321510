#pragma once

#include <scalex/chunk/column.hpp>

#include <cstddef>
#include <vector>

namespace scalex::chunk {

class Row;

/// A batch of rows stored column-wise; all columns have the same length.
class Chunk {
   public:
    Chunk() = default;

    /// Batch of `num_rows` rows without columns.
    explicit Chunk(std::size_t num_rows) : rows_(num_rows) {}

    /// Throws std::invalid_argument when column lengths differ.
    explicit Chunk(std::vector<ColumnVector> columns);

    /// Throws std::invalid_argument when the column length differs from the batch.
    void add_column(ColumnVector column);

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto num_cols() const noexcept -> std::size_t { return columns_.size(); }

    [[nodiscard]] auto column(std::size_t idx) const -> const ColumnVector& {
        return columns_.at(idx);
    }

    [[nodiscard]] auto row(std::size_t idx) const -> Row;

   private:
    std::vector<ColumnVector> columns_;
    std::size_t rows_ = 0;
};

/// Non-owning view of one row of a Chunk.
///
/// A default-constructed Row is empty: it has no columns and is what constant folding
/// evaluates against.
class Row {
   public:
    Row() = default;
    Row(const Chunk& chunk, std::size_t idx) : chunk_(&chunk), idx_(idx) {}

    [[nodiscard]] auto is_empty() const noexcept -> bool { return chunk_ == nullptr; }
    [[nodiscard]] auto idx() const noexcept -> std::size_t { return idx_; }
    [[nodiscard]] auto num_cols() const noexcept -> std::size_t {
        return chunk_ == nullptr ? 0 : chunk_->num_cols();
    }

    /// Caller must check col < num_cols().
    [[nodiscard]] auto is_null(std::size_t col) const -> bool {
        return chunk_->column(col).is_null(idx_);
    }

    /// Value at `col`, or nullptr when the column holds another type.
    template <typename T>
    [[nodiscard]] auto get(std::size_t col) const -> const T* {
        const auto* values = chunk_->column(col).values<T>();
        if (values == nullptr) {
            return nullptr;
        }
        return &(*values)[idx_];
    }

   private:
    const Chunk* chunk_ = nullptr;
    std::size_t idx_ = 0;
};

inline auto Chunk::row(std::size_t idx) const -> Row { return Row{*this, idx}; }

}  // namespace scalex::chunk
