#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scalex::expression {

class ColumnRef;

/// Physical row layout: the ordered column slots an expression is bound against.
class Schema {
   public:
    Schema() = default;
    explicit Schema(std::vector<std::shared_ptr<ColumnRef>> columns)
        : columns_(std::move(columns)) {}

    void append(std::shared_ptr<ColumnRef> column) { columns_.push_back(std::move(column)); }

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::shared_ptr<ColumnRef>>& {
        return columns_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns_.size(); }

    /// Offset of the column with the same unique id, if present.
    [[nodiscard]] auto column_index(const ColumnRef& column) const -> std::optional<std::size_t>;

    [[nodiscard]] auto contains(const ColumnRef& column) const -> bool {
        return column_index(column).has_value();
    }

    /// `Column: [a,b,c]`
    [[nodiscard]] auto to_string() const -> std::string;

   private:
    std::vector<std::shared_ptr<ColumnRef>> columns_;
};

}  // namespace scalex::expression
