#include <tabula/runtime/column_vector.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <type_traits>

namespace tabula::runtime {

auto to_string(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::Logical:
            return "logical";
        case Kind::Integer:
            return "integer";
        case Kind::Double:
            return "double";
        case Kind::Text:
            return "character";
    }
    return "unknown";
}

auto type_glyph(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::Logical:
            return "lgl";
        case Kind::Integer:
            return "int";
        case Kind::Double:
            return "dbl";
        case Kind::Text:
            return "chr";
    }
    return "???";
}

auto kind_of(const ColumnVector& column) noexcept -> Kind {
    if (std::holds_alternative<Column<bool>>(column)) {
        return Kind::Logical;
    }
    if (std::holds_alternative<Column<std::int64_t>>(column)) {
        return Kind::Integer;
    }
    if (std::holds_alternative<Column<double>>(column)) {
        return Kind::Double;
    }
    return Kind::Text;
}

auto kind_of(const Scalar& value) noexcept -> Kind {
    return static_cast<Kind>(value.index());
}

auto column_size(const ColumnVector& column) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto element_at(const ColumnVector& column, std::size_t index) -> Scalar {
    return std::visit([index](const auto& col) -> Scalar { return col.at(index); }, column);
}

auto element_vector(const ColumnVector& column, std::size_t index) -> ColumnVector {
    return gather(column, std::vector<std::size_t>{index});
}

auto gather(const ColumnVector& column, const std::vector<std::size_t>& rows) -> ColumnVector {
    return std::visit([&rows](const auto& col) -> ColumnVector { return col.gather(rows); },
                      column);
}

auto recycle_to_length(const ColumnVector& source, std::size_t target, Policy policy)
    -> std::expected<ColumnVector, Error> {
    const std::size_t length = column_size(source);
    if (length == target) {
        return source;
    }
    bool accepted = false;
    switch (policy) {
        case Policy::Legacy:
            accepted = length > 0 && target % length == 0;
            break;
        case Policy::Strict:
            accepted = length == 1;
            break;
    }
    if (!accepted) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("cannot recycle input of size {} to size {}", length,
                                      target));
    }
    return std::visit([target](const auto& col) -> ColumnVector { return col.cycle(target); },
                      source);
}

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "TRUE" : "FALSE";
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "NaN";
                if (std::isinf(v))
                    return v > 0 ? "Inf" : "-Inf";
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace tabula::runtime
