#pragma once

#include <tabula/core/diagnostics.hpp>
#include <tabula/runtime/column_vector.hpp>
#include <tabula/runtime/table.hpp>

#include <expected>
#include <string>
#include <vector>

namespace tabula::runtime {

/// Build a Strict container from row-major values.
///
/// `names` are the column tokens; a leading `~` is accepted and stripped
/// (`~letters`). `values` are read row by row, so column p receives every
/// `names.size()`-th value starting at offset p. Each column takes the least
/// general kind holding all of its values (Logical < Integer < Double), and
/// any text value makes the whole column Text.
///
/// Fails with Shape when there are no names or the value count is not a
/// multiple of the name count; InvalidColumnName for an empty token;
/// DuplicateColumnName for a repeated name.
[[nodiscard]] auto make_from_rows(const std::vector<std::string>& names,
                                  const std::vector<Scalar>& values)
    -> std::expected<Table, Error>;

/// Least general kind able to hold every value (Logical for an empty list).
[[nodiscard]] auto common_kind(const std::vector<Scalar>& values) noexcept -> Kind;

/// Build a column of `kind` from values, widening or rendering as text.
[[nodiscard]] auto coerce_column(const std::vector<Scalar>& values, Kind kind) -> ColumnVector;

}  // namespace tabula::runtime
