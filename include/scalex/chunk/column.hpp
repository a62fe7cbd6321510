#pragma once

#include <scalex/core/decimal.hpp>
#include <scalex/core/time.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace scalex::chunk {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values
/// and exposes span-based access for zero-copy interop.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Bounds-checked access.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Zero-copy view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }
    [[nodiscard]] auto span() noexcept -> std::span<T> { return data_; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void assign(size_type count, const T& value) { data_.assign(count, value); }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    void clear() noexcept { data_.clear(); }

    /// Resize the column (value-initialize new elements).
    void resize(size_type count) { data_.resize(count); }

    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

using ColumnData = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                Column<Decimal>, Column<Timestamp>, Column<Duration>>;

/// One column of a batch: typed values plus a validity bitmap (true = valid, false = null).
///
/// This is also the output buffer of vectorized evaluation: the evaluator calls reset<T>()
/// for the batch size and then fills values and null flags in place.
class ColumnVector {
   public:
    ColumnVector() = default;

    template <typename T>
    explicit ColumnVector(Column<T> values)
        : data_(std::move(values)), validity_(std::get<Column<T>>(data_).size(), true) {}

    template <typename T>
    ColumnVector(Column<T> values, std::vector<bool> validity)
        : data_(std::move(values)), validity_(std::move(validity)) {}

    /// Re-types the vector as Column<T> with `rows` value-initialized, valid entries.
    template <typename T>
    void reset(std::size_t rows) {
        Column<T> values;
        values.resize(rows);
        data_ = std::move(values);
        validity_.assign(rows, true);
    }

    /// Typed values, or nullptr when the vector holds another type.
    template <typename T>
    [[nodiscard]] auto values() noexcept -> Column<T>* {
        return std::get_if<Column<T>>(&data_);
    }

    template <typename T>
    [[nodiscard]] auto values() const noexcept -> const Column<T>* {
        return std::get_if<Column<T>>(&data_);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return validity_.size(); }

    [[nodiscard]] auto is_null(std::size_t row) const -> bool { return !validity_[row]; }

    void set_null(std::size_t row, bool null) { validity_[row] = !null; }

    [[nodiscard]] auto null_count() const -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count(validity_, false));
    }

    [[nodiscard]] auto data() const noexcept -> const ColumnData& { return data_; }

   private:
    ColumnData data_;
    std::vector<bool> validity_;
};

}  // namespace scalex::chunk
