#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/diagnostics.hpp>
#include <tabula/core/policy.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula::runtime {

/// Element kind of a column, ordered from least to most general.
enum class Kind : std::uint8_t {
    Logical,
    Integer,
    Double,
    Text,
};

using Scalar = std::variant<bool, std::int64_t, double, std::string>;

using ColumnVector =
    std::variant<Column<bool>, Column<std::int64_t>, Column<double>, Column<std::string>>;

/// "logical", "integer", "double" or "character".
[[nodiscard]] auto to_string(Kind kind) noexcept -> std::string_view;

/// Abbreviated type glyph used by the strict printer: lgl, int, dbl, chr.
[[nodiscard]] auto type_glyph(Kind kind) noexcept -> std::string_view;

[[nodiscard]] constexpr auto is_numeric(Kind kind) noexcept -> bool {
    return kind != Kind::Text;
}

[[nodiscard]] auto kind_of(const ColumnVector& column) noexcept -> Kind;
[[nodiscard]] auto kind_of(const Scalar& value) noexcept -> Kind;

[[nodiscard]] auto column_size(const ColumnVector& column) noexcept -> std::size_t;

/// Element at 0-based `index` (bounds-checked, throws std::out_of_range).
[[nodiscard]] auto element_at(const ColumnVector& column, std::size_t index) -> Scalar;

/// Length-1 vector holding the element at 0-based `index`.
[[nodiscard]] auto element_vector(const ColumnVector& column, std::size_t index) -> ColumnVector;

/// New vector holding the given 0-based rows, in order.
[[nodiscard]] auto gather(const ColumnVector& column, const std::vector<std::size_t>& rows)
    -> ColumnVector;

/// Stretch `source` to `target` elements under the recycling rule of `policy`.
///
/// Legacy repeats the source cyclically when its length divides `target`.
/// Strict accepts a length-1 source (broadcast) or an exact-length source.
/// Any other length yields ErrorKind::LengthMismatch.
[[nodiscard]] auto recycle_to_length(const ColumnVector& source, std::size_t target,
                                     Policy policy) -> std::expected<ColumnVector, Error>;

/// Text rendering of a scalar: TRUE/FALSE, decimal integers, shortest doubles.
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

}  // namespace tabula::runtime
