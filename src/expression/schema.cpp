#include <scalex/expression/column.hpp>
#include <scalex/expression/schema.hpp>

namespace scalex::expression {

auto Schema::column_index(const ColumnRef& column) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i]->unique_id() == column.unique_id()) {
            return i;
        }
    }
    return std::nullopt;
}

auto Schema::to_string() const -> std::string {
    std::string out = "Column: [";
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out.append(columns_[i]->to_string());
    }
    out.push_back(']');
    return out;
}

}  // namespace scalex::expression
