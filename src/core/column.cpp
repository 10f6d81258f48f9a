#include <tabula/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is fully header-only (template class).
// Explicit instantiations for the four element kinds a ColumnVector can hold.

namespace tabula {

template class Column<bool>;
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace tabula
