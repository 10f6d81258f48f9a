#pragma once

#include <tabula/core/diagnostics.hpp>
#include <tabula/core/policy.hpp>
#include <tabula/runtime/column_vector.hpp>

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabula::runtime {

/// Input to the column-major constructor.
struct NamedColumn {
    std::string name;
    ColumnVector column;
};

struct ColumnEntry {
    std::string name;
    // Shared between container versions; never written through.
    std::shared_ptr<const ColumnVector> column;
};

/// An immutable, ordered collection of equal-length named columns carrying
/// one Policy.
///
/// Every operation that derives a new container returns a new Table value.
/// Unchanged columns are shared with the source by pointer, so deriving a
/// version costs one pointer copy per column plus the storage of whatever
/// column actually changed.
class Table {
   public:
    /// An empty container (no columns, zero rows).
    explicit Table(Policy policy = Policy::Legacy) : policy_(policy) {}

    [[nodiscard]] auto policy() const noexcept -> Policy { return policy_; }
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto cols() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnEntry>& {
        return columns_;
    }
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Exact-name lookups.
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnVector*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto index_of(const std::string& name) const -> std::optional<std::size_t>;

    /// Column at 0-based position (bounds-checked, throws std::out_of_range).
    [[nodiscard]] auto column(std::size_t index) const -> const ColumnVector&;

    /// Columns at the given 0-based positions, in order, sharing storage.
    /// A position selected more than once gets a suffixed name (`a.1`).
    [[nodiscard]] auto select(const std::vector<std::size_t>& indices) const -> Table;

    /// Every column restricted to the given 0-based rows, in order.
    [[nodiscard]] auto take_rows(const std::vector<std::size_t>& rows) const -> Table;

    /// Replace the column named `name` in place, or append it. The column
    /// length must equal rows() unless the container has no columns.
    [[nodiscard]] auto with_column(const std::string& name, ColumnVector column) const -> Table;

    /// Same columns (shared) under another policy.
    [[nodiscard]] auto with_policy(Policy policy) const -> Table;

    friend auto operator==(const Table& lhs, const Table& rhs) -> bool;

    friend auto make_container(std::vector<NamedColumn> columns, Policy policy)
        -> std::expected<Table, Error>;

   private:
    void add_column(std::string name, std::shared_ptr<const ColumnVector> column);

    std::vector<ColumnEntry> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    Policy policy_ = Policy::Legacy;
    std::size_t rows_ = 0;
};

/// Column-major constructor.
///
/// Fails with UnequalColumnLength when the columns differ in length. Strict
/// rejects empty names (InvalidColumnName) and duplicates
/// (DuplicateColumnName); Legacy repairs them to `V<n>` and `name.<k>`.
[[nodiscard]] auto make_container(std::vector<NamedColumn> columns, Policy policy)
    -> std::expected<Table, Error>;

/// Metadata consumed by printers and other collaborators.
struct Description {
    std::vector<std::string> names;
    std::vector<Kind> kinds;
    std::size_t row_count = 0;
    Policy policy = Policy::Legacy;
};

[[nodiscard]] auto describe(const Table& table) -> Description;

/// Comma-separated column names, back-quoting non-syntactic ones.
[[nodiscard]] auto format_columns(const Table& table) -> std::string;

}  // namespace tabula::runtime
