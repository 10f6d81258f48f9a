#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace tabula {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, immutable columnar storage unit.
///
/// Column<T> owns a contiguous vector of homogeneously typed values. Its
/// length is fixed at construction; every operation that would change the
/// contents returns a new column instead.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using const_reference = typename std::vector<T>::const_reference;
    using const_iterator = typename std::vector<T>::const_iterator;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Element access (bounds-checked).
    [[nodiscard]] auto at(size_type idx) const -> const_reference { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    /// Copy of the backing values.
    [[nodiscard]] auto values() const -> std::vector<T> { return data_; }

    /// Build a new column from the given row indices, in order.
    [[nodiscard]] auto gather(const std::vector<size_type>& rows) const -> Column<T> {
        std::vector<T> result;
        result.reserve(rows.size());
        for (auto row : rows) {
            result.push_back(data_.at(row));
        }
        return Column<T>{std::move(result)};
    }

    /// Repeat the column cyclically until it holds `count` elements.
    /// The column must be non-empty when `count` is non-zero.
    [[nodiscard]] auto cycle(size_type count) const -> Column<T> {
        std::vector<T> result;
        result.reserve(count);
        for (size_type i = 0; i < count; ++i) {
            result.push_back(data_[i % data_.size()]);
        }
        return Column<T>{std::move(result)};
    }

    auto operator==(const Column&) const -> bool = default;

    // Iterator support
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return data_.cend(); }
    [[nodiscard]] auto cbegin() const noexcept -> const_iterator { return data_.cbegin(); }
    [[nodiscard]] auto cend() const noexcept -> const_iterator { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace tabula
