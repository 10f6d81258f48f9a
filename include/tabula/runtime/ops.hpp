#pragma once

#include <tabula/core/diagnostics.hpp>
#include <tabula/runtime/column_vector.hpp>
#include <tabula/runtime/key.hpp>
#include <tabula/runtime/table.hpp>

#include <cstddef>
#include <iostream>
#include <string>
#include <variant>

namespace tabula::ops {

// ─── Column accessors ─────────────────────────────────────────────────────────
//  Each accessor reads its container and returns a new value; the input is
//  never modified. Behavior branches on the container's Policy.

/// Result of the two-argument bracket: a bare column when the dimension is
/// dropped, otherwise a container.
using Selection = std::variant<runtime::ColumnVector, runtime::Table>;

/// `table$name`. Legacy accepts a unique prefix silently; Strict requires
/// the exact name and warns when it is missing.
[[nodiscard]] auto dollar(const runtime::Table& table, const std::string& name)
    -> Outcome<runtime::ColumnVector>;

/// `table[key]`. Always a container of the selected columns, in key order,
/// with the receiver's policy.
[[nodiscard]] auto bracket(const runtime::Table& table, const runtime::Key& key)
    -> Result<runtime::Table>;

/// `table[rows, key]`. Legacy drops to a bare column when exactly one column
/// is selected; Strict always returns a container.
[[nodiscard]] auto bracket(const runtime::Table& table, const runtime::RowSelector& rows,
                           const runtime::Key& key) -> Result<Selection>;

/// `table[[key]]`. A scalar key yields the whole column under both policies.
/// A compound key is chained element indexing under Legacy and
/// InvalidIndex under Strict.
[[nodiscard]] auto double_bracket(const runtime::Table& table, const runtime::Key& key)
    -> Result<runtime::ColumnVector>;

/// `table$name <- source`. Returns the new container version; the input is
/// unchanged whatever the outcome.
[[nodiscard]] auto assign_column(const runtime::Table& table, const std::string& name,
                                 const runtime::ColumnVector& source) -> Result<runtime::Table>;

// ─── Printing ─────────────────────────────────────────────────────────────────

/// Render a container. Strict prints a tibble header, a type row and at most
/// `max_rows` rows; Legacy prints every row with row labels.
void print(const runtime::Table& table, std::ostream& out = std::cout, std::size_t max_rows = 10);

/// Render a bare column as `[1] ...`.
void print(const runtime::ColumnVector& column, std::ostream& out = std::cout);

}  // namespace tabula::ops
