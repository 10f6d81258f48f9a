#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace tabula::runtime {

/// One element of a column key: a 1-based position or a column name.
using KeyItem = std::variant<std::int64_t, std::string>;

/// A column lookup key: a single name or position, an ordered set of them,
/// or every column.
///
/// Positions are 1-based under both policies.
class Key {
   public:
    Key(std::string name) : items_{KeyItem{std::move(name)}} {}
    Key(const char* name) : items_{KeyItem{std::string(name)}} {}
    Key(std::int64_t position) : items_{KeyItem{position}} {}
    Key(int position) : items_{KeyItem{static_cast<std::int64_t>(position)}} {}
    Key(std::initializer_list<KeyItem> items) : items_(items) {}
    explicit Key(std::vector<KeyItem> items) : items_(std::move(items)) {}

    [[nodiscard]] static auto all() -> Key {
        Key key(std::vector<KeyItem>{});
        key.all_ = true;
        return key;
    }

    [[nodiscard]] static auto names(const std::vector<std::string>& names) -> Key;
    [[nodiscard]] static auto positions(const std::vector<std::int64_t>& positions) -> Key;

    [[nodiscard]] auto is_all() const noexcept -> bool { return all_; }
    [[nodiscard]] auto is_scalar() const noexcept -> bool { return !all_ && items_.size() == 1; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }
    [[nodiscard]] auto items() const noexcept -> const std::vector<KeyItem>& { return items_; }

   private:
    std::vector<KeyItem> items_;
    bool all_ = false;
};

/// Row selection for the two-argument bracket: every row, or 1-based row
/// positions applied in order (repeats allowed).
class RowSelector {
   public:
    RowSelector(std::initializer_list<std::int64_t> rows) : rows_(rows) {}
    explicit RowSelector(std::vector<std::int64_t> rows) : rows_(std::move(rows)) {}

    [[nodiscard]] static auto all() -> RowSelector {
        RowSelector selector(std::vector<std::int64_t>{});
        selector.all_ = true;
        return selector;
    }

    [[nodiscard]] auto is_all() const noexcept -> bool { return all_; }
    [[nodiscard]] auto rows() const noexcept -> const std::vector<std::int64_t>& { return rows_; }

   private:
    std::vector<std::int64_t> rows_;
    bool all_ = false;
};

/// "`name`", "3", "c(1, 3)" or "<all>", for messages.
[[nodiscard]] auto format_key(const Key& key) -> std::string;

}  // namespace tabula::runtime
