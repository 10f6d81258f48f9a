#include <tabula/runtime/table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

namespace tabula::runtime {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    auto is_alpha = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0;
    };
    auto is_alnum = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0;
    };
    unsigned char first = static_cast<unsigned char>(name.front());
    if (!is_alpha(first) && first != '.') {
        return false;
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(name[i]);
        if (!is_alnum(ch) && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

// Permissive constructors never reject a name: blanks get a positional
// placeholder and repeats get a numeric suffix, first occurrence unchanged.
auto repair_names(std::vector<std::string>& names) -> void {
    std::unordered_set<std::string> used(names.begin(), names.end());
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto& name = names[i];
        if (name.empty()) {
            std::string candidate = fmt::format("V{}", i + 1);
            for (std::size_t k = 1; used.contains(candidate); ++k) {
                candidate = fmt::format("V{}.{}", i + 1, k);
            }
            spdlog::debug("renamed unnamed column {} to '{}'", i + 1, candidate);
            name = candidate;
            used.insert(name);
        } else if (seen.contains(name)) {
            std::string candidate;
            std::size_t k = 1;
            do {
                candidate = fmt::format("{}.{}", name, k++);
            } while (used.contains(candidate));
            spdlog::debug("renamed duplicate column '{}' to '{}'", name, candidate);
            name = candidate;
            used.insert(name);
        }
        seen.insert(name);
    }
}

auto check_names(const std::vector<NamedColumn>& columns) -> std::expected<void, Error> {
    std::unordered_set<std::string_view> seen;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const auto& name = columns[i].name;
        if (name.empty()) {
            return make_error(ErrorKind::InvalidColumnName,
                              fmt::format("column {} must be named", i + 1));
        }
        if (!seen.insert(name).second) {
            return make_error(ErrorKind::DuplicateColumnName,
                              fmt::format("column name '{}' must not be duplicated", name));
        }
    }
    return {};
}

}  // namespace

auto Table::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& entry : columns_) {
        out.push_back(entry.name);
    }
    return out;
}

auto Table::find(const std::string& name) const -> const ColumnVector* {
    if (auto it = index_.find(name); it != index_.end()) {
        return columns_[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

auto Table::index_of(const std::string& name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Table::column(std::size_t index) const -> const ColumnVector& {
    return *columns_.at(index).column;
}

auto Table::select(const std::vector<std::size_t>& indices) const -> Table {
    std::vector<std::string> selected;
    selected.reserve(indices.size());
    for (auto idx : indices) {
        selected.push_back(columns_.at(idx).name);
    }
    repair_names(selected);

    Table output{policy_};
    output.rows_ = rows_;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        output.add_column(std::move(selected[i]), columns_[indices[i]].column);
    }
    return output;
}

auto Table::take_rows(const std::vector<std::size_t>& rows) const -> Table {
    Table output{policy_};
    output.rows_ = rows.size();
    for (const auto& entry : columns_) {
        output.add_column(entry.name,
                          std::make_shared<const ColumnVector>(gather(*entry.column, rows)));
    }
    return output;
}

auto Table::with_column(const std::string& name, ColumnVector column) const -> Table {
    const std::size_t length = column_size(column);
    if (!columns_.empty() && length != rows_) {
        throw std::invalid_argument(
            fmt::format("column '{}' has {} rows, container has {}", name, length, rows_));
    }
    Table output = *this;
    output.rows_ = length;
    auto storage = std::make_shared<const ColumnVector>(std::move(column));
    if (auto it = output.index_.find(name); it != output.index_.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        output.columns_[it->second].column = std::move(storage);
    } else {
        output.add_column(name, std::move(storage));
    }
    return output;
}

auto Table::with_policy(Policy policy) const -> Table {
    Table output = *this;
    output.policy_ = policy;
    return output;
}

void Table::add_column(std::string name, std::shared_ptr<const ColumnVector> column) {
    std::size_t pos = columns_.size();
    columns_.push_back(ColumnEntry{.name = std::move(name), .column = std::move(column)});
    index_.insert_or_assign(columns_.back().name, pos);
}

auto operator==(const Table& lhs, const Table& rhs) -> bool {
    if (lhs.policy_ != rhs.policy_ || lhs.rows_ != rhs.rows_ ||
        lhs.columns_.size() != rhs.columns_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.columns_.size(); ++i) {
        const auto& l = lhs.columns_[i];
        const auto& r = rhs.columns_[i];
        if (l.name != r.name) {
            return false;
        }
        if (l.column != r.column && *l.column != *r.column) {
            return false;
        }
    }
    return true;
}

auto make_container(std::vector<NamedColumn> columns, Policy policy)
    -> std::expected<Table, Error> {
    if (!columns.empty()) {
        const std::size_t expected_rows = column_size(columns.front().column);
        for (const auto& col : columns) {
            const std::size_t rows = column_size(col.column);
            if (rows != expected_rows) {
                return make_error(
                    ErrorKind::UnequalColumnLength,
                    fmt::format("column '{}' has {} rows, column '{}' has {}", col.name, rows,
                                columns.front().name, expected_rows));
            }
        }
    }

    if (policy == Policy::Strict) {
        if (auto checked = check_names(columns); !checked) {
            return std::unexpected(checked.error());
        }
    } else {
        std::vector<std::string> names;
        names.reserve(columns.size());
        for (const auto& col : columns) {
            names.push_back(col.name);
        }
        repair_names(names);
        for (std::size_t i = 0; i < columns.size(); ++i) {
            columns[i].name = std::move(names[i]);
        }
    }

    Table table{policy};
    table.rows_ = columns.empty() ? 0 : column_size(columns.front().column);
    for (auto& col : columns) {
        table.add_column(std::move(col.name),
                         std::make_shared<const ColumnVector>(std::move(col.column)));
    }
    return table;
}

auto describe(const Table& table) -> Description {
    Description desc;
    desc.names = table.names();
    desc.kinds.reserve(table.cols());
    for (const auto& entry : table.columns()) {
        desc.kinds.push_back(kind_of(*entry.column));
    }
    desc.row_count = table.rows();
    desc.policy = table.policy();
    return desc;
}

auto format_columns(const Table& table) -> std::string {
    if (table.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < table.cols(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        const auto& name = table.columns()[i].name;
        if (is_simple_identifier(name)) {
            out.append(name);
        } else {
            out.push_back('`');
            out.append(name);
            out.push_back('`');
        }
    }
    return out;
}

}  // namespace tabula::runtime
