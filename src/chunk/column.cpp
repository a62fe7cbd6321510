#include <scalex/chunk/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only; this unit anchors the instantiations used by every batch.

namespace scalex::chunk {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Decimal>;
template class Column<Timestamp>;
template class Column<Duration>;

}  // namespace scalex::chunk
