#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/resolver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tabula::ops {

namespace {

using runtime::Arity;
using runtime::ColumnVector;
using runtime::Key;
using runtime::Table;

// Strict containers keep names unique, so selecting one column twice is an error.
auto check_distinct(const Table& table, const std::vector<std::size_t>& columns)
    -> std::expected<void, Error> {
    if (table.policy() != Policy::Strict) {
        return {};
    }
    std::unordered_set<std::size_t> seen;
    for (auto idx : columns) {
        if (!seen.insert(idx).second) {
            return make_error(ErrorKind::DuplicateColumnName,
                              fmt::format("column name '{}' must not be duplicated",
                                          table.columns()[idx].name));
        }
    }
    return {};
}

auto resolve_rows(const Table& table, const runtime::RowSelector& rows)
    -> std::expected<std::vector<std::size_t>, Error> {
    std::vector<std::size_t> resolved;
    resolved.reserve(rows.rows().size());
    for (auto row : rows.rows()) {
        if (row < 1 || static_cast<std::size_t>(row) > table.rows()) {
            return make_error(ErrorKind::IndexOutOfRange,
                              fmt::format("can't subset row {}: container has {} row{}", row,
                                          table.rows(), table.rows() == 1 ? "" : "s"));
        }
        resolved.push_back(static_cast<std::size_t>(row - 1));
    }
    return resolved;
}

auto select_columns(const Table& table, const Key& key)
    -> std::expected<Outcome<Table>, Error> {
    auto resolved = runtime::resolve(table, key, Arity::Single);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!resolved->found()) {
        return Outcome<Table>{.value = std::nullopt, .warning = std::move(resolved->warning)};
    }
    if (auto distinct = check_distinct(table, *resolved->columns); !distinct) {
        return std::unexpected(distinct.error());
    }
    return Outcome<Table>{.value = table.select(*resolved->columns), .warning = std::nullopt};
}

// Legacy `[[` with several items: the first picks a column, each later item
// picks an element of the previous result.
auto chain_elements(const Table& table, const Key& key) -> Result<ColumnVector> {
    const auto& items = key.items();
    auto head = runtime::resolve(table, Key(std::vector<runtime::KeyItem>{items.front()}),
                                 Arity::Double);
    if (!head) {
        return std::unexpected(head.error());
    }
    if (!head->found()) {
        return Outcome<ColumnVector>{.value = std::nullopt, .warning = std::move(head->warning)};
    }

    ColumnVector current = table.column(head->columns->front());
    for (std::size_t depth = 1; depth < items.size(); ++depth) {
        const auto* position = std::get_if<std::int64_t>(&items[depth]);
        const std::size_t length = runtime::column_size(current);
        if (position == nullptr) {
            return make_error(ErrorKind::IndexOutOfRange,
                              fmt::format("subscript out of bounds: can't index a {} vector "
                                          "by name `{}`",
                                          runtime::to_string(runtime::kind_of(current)),
                                          std::get<std::string>(items[depth])));
        }
        if (*position < 1 || static_cast<std::size_t>(*position) > length) {
            return make_error(ErrorKind::IndexOutOfRange,
                              fmt::format("subscript out of bounds: element {} of a vector "
                                          "of length {}",
                                          *position, length));
        }
        current = runtime::element_vector(current, static_cast<std::size_t>(*position - 1));
    }
    return Outcome<ColumnVector>{.value = std::move(current), .warning = std::nullopt};
}

auto format_cell(const ColumnVector& column, std::size_t row, bool quote) -> std::string {
    auto text = runtime::format_scalar(runtime::element_at(column, row));
    if (quote && runtime::kind_of(column) == runtime::Kind::Text) {
        return fmt::format("\"{}\"", text);
    }
    return text;
}

void print_strict(const Table& table, std::ostream& out, std::size_t max_rows) {
    const auto desc = runtime::describe(table);
    out << fmt::format("# A tibble: {} × {}\n", desc.row_count, desc.names.size());
    if (desc.names.empty()) {
        return;
    }

    const std::size_t shown_rows = std::min(desc.row_count, max_rows);
    const std::size_t label_width = fmt::format("{}", shown_rows).size();
    const std::size_t col_count = desc.names.size();

    std::vector<std::string> glyphs(col_count);
    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        glyphs[c] = fmt::format("<{}>", runtime::type_glyph(desc.kinds[c]));
        widths[c] = std::max(desc.names[c].size(), glyphs[c].size());
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_cell(table.column(c), r, false);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    // Numbers align right, text aligns left.
    auto emit = [&](std::size_t c, const std::string& text) {
        if (runtime::is_numeric(desc.kinds[c])) {
            out << fmt::format(" {:>{}}", text, widths[c]);
        } else {
            out << fmt::format(" {:<{}}", text, widths[c]);
        }
    };

    out << fmt::format("{:>{}}", "", label_width);
    for (std::size_t c = 0; c < col_count; ++c) {
        emit(c, desc.names[c]);
    }
    out << "\n";
    out << fmt::format("{:>{}}", "", label_width);
    for (std::size_t c = 0; c < col_count; ++c) {
        emit(c, glyphs[c]);
    }
    out << "\n";

    for (std::size_t r = 0; r < shown_rows; ++r) {
        out << fmt::format("{:>{}}", r + 1, label_width);
        for (std::size_t c = 0; c < col_count; ++c) {
            emit(c, cells[c][r]);
        }
        out << "\n";
    }

    if (desc.row_count > shown_rows) {
        out << fmt::format("# ℹ {} more row{}\n", desc.row_count - shown_rows,
                           desc.row_count - shown_rows == 1 ? "" : "s");
    }
}

void print_legacy(const Table& table, std::ostream& out) {
    const auto desc = runtime::describe(table);
    if (desc.names.empty()) {
        out << fmt::format("data frame with 0 columns and {} row{}\n", desc.row_count,
                           desc.row_count == 1 ? "" : "s");
        return;
    }
    if (desc.row_count == 0) {
        out << "[1] ";
        for (std::size_t c = 0; c < desc.names.size(); ++c) {
            out << (c > 0 ? " " : "") << desc.names[c];
        }
        out << "\n<0 rows> (or 0-length row.names)\n";
        return;
    }

    const std::size_t col_count = desc.names.size();
    const std::size_t label_width = fmt::format("{}", desc.row_count).size();
    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = desc.names[c].size();
        cells[c].reserve(desc.row_count);
        for (std::size_t r = 0; r < desc.row_count; ++r) {
            auto cell = format_cell(table.column(c), r, false);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    out << fmt::format("{:>{}}", "", label_width);
    for (std::size_t c = 0; c < col_count; ++c) {
        out << fmt::format(" {:>{}}", desc.names[c], widths[c]);
    }
    out << "\n";
    for (std::size_t r = 0; r < desc.row_count; ++r) {
        out << fmt::format("{:<{}}", r + 1, label_width);
        for (std::size_t c = 0; c < col_count; ++c) {
            out << fmt::format(" {:>{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace

// ─── Column accessors ─────────────────────────────────────────────────────────

auto dollar(const Table& table, const std::string& name) -> Outcome<ColumnVector> {
    auto lookup = runtime::resolve_name(table, name, Arity::Single);
    if (!lookup.found()) {
        return Outcome<ColumnVector>{.value = std::nullopt, .warning = std::move(lookup.warning)};
    }
    return Outcome<ColumnVector>{.value = table.column(lookup.columns->front()),
                                 .warning = std::nullopt};
}

auto bracket(const Table& table, const Key& key) -> Result<Table> {
    return select_columns(table, key);
}

auto bracket(const Table& table, const runtime::RowSelector& rows, const Key& key)
    -> Result<Selection> {
    std::optional<std::vector<std::size_t>> selected_rows;
    if (!rows.is_all()) {
        auto resolved_rows = resolve_rows(table, rows);
        if (!resolved_rows) {
            return std::unexpected(resolved_rows.error());
        }
        selected_rows = std::move(*resolved_rows);
    }

    auto columns = select_columns(table, key);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    if (!columns->found()) {
        return Outcome<Selection>{.value = std::nullopt, .warning = std::move(columns->warning)};
    }

    Table subset = std::move(*columns->value);
    if (selected_rows) {
        subset = subset.take_rows(*selected_rows);
    }

    if (table.policy() == Policy::Legacy && subset.cols() == 1) {
        return Outcome<Selection>{.value = Selection{subset.column(0)}, .warning = std::nullopt};
    }
    return Outcome<Selection>{.value = Selection{std::move(subset)}, .warning = std::nullopt};
}

auto double_bracket(const Table& table, const Key& key) -> Result<ColumnVector> {
    if (key.is_all() || key.size() == 0) {
        return make_error(ErrorKind::InvalidIndex,
                          "`[[` needs a single column name or position, got an empty key");
    }

    if (!key.is_scalar()) {
        switch (table.policy()) {
            case Policy::Legacy:
                return chain_elements(table, key);
            case Policy::Strict:
                return make_error(ErrorKind::InvalidIndex,
                                  fmt::format("can't extract with {}: `[[` takes a single "
                                              "column name or position, not {} values",
                                              format_key(key), key.size()));
        }
    }

    auto resolved = runtime::resolve(table, key, Arity::Double);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!resolved->found()) {
        return Outcome<ColumnVector>{.value = std::nullopt,
                                     .warning = std::move(resolved->warning)};
    }
    return Outcome<ColumnVector>{.value = table.column(resolved->columns->front()),
                                 .warning = std::nullopt};
}

auto assign_column(const Table& table, const std::string& name, const ColumnVector& source)
    -> Result<Table> {
    if (name.empty()) {
        return make_error(ErrorKind::InvalidColumnName, "can't assign to an unnamed column");
    }

    const std::size_t target = table.empty() ? runtime::column_size(source) : table.rows();
    auto recycled = runtime::recycle_to_length(source, target, table.policy());
    if (!recycled) {
        if (table.policy() == Policy::Strict) {
            return std::unexpected(recycled.error());
        }
        Warning warning{.kind = WarningKind::RecycleLength,
                        .message = fmt::format("replacement has {} rows, data has {}; "
                                               "assignment to '{}' not applied",
                                               runtime::column_size(source), target, name)};
        spdlog::debug("{}", warning.format());
        return Outcome<Table>{.value = table, .warning = std::move(warning)};
    }
    return Outcome<Table>{.value = table.with_column(name, std::move(*recycled)),
                          .warning = std::nullopt};
}

// ─── Printing ─────────────────────────────────────────────────────────────────

void print(const Table& table, std::ostream& out, std::size_t max_rows) {
    switch (table.policy()) {
        case Policy::Strict:
            print_strict(table, out, max_rows);
            return;
        case Policy::Legacy:
            print_legacy(table, out);
            return;
    }
}

void print(const ColumnVector& column, std::ostream& out) {
    const std::size_t length = runtime::column_size(column);
    if (length == 0) {
        out << fmt::format("{}(0)\n", runtime::to_string(runtime::kind_of(column)));
        return;
    }

    constexpr std::size_t kLineWidth = 80;
    std::vector<std::string> cells;
    cells.reserve(length);
    std::size_t cell_width = 0;
    for (std::size_t i = 0; i < length; ++i) {
        cells.push_back(format_cell(column, i, true));
        cell_width = std::max(cell_width, cells.back().size());
    }
    const bool text = runtime::kind_of(column) == runtime::Kind::Text;
    const std::size_t label_width = fmt::format("[{}]", length).size();
    const std::size_t per_line =
        std::max<std::size_t>(1, (kLineWidth - label_width) / (cell_width + 1));

    for (std::size_t i = 0; i < length; i += per_line) {
        out << fmt::format("{:>{}}", fmt::format("[{}]", i + 1), label_width);
        for (std::size_t j = i; j < std::min(length, i + per_line); ++j) {
            if (text) {
                out << fmt::format(" {:<{}}", cells[j], cell_width);
            } else {
                out << fmt::format(" {:>{}}", cells[j], cell_width);
            }
        }
        out << "\n";
    }
}

}  // namespace tabula::ops
