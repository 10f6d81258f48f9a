#include <tabula/runtime/row_builder.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace tabula::runtime {

namespace {

auto strip_token(const std::string& token) -> std::string {
    if (!token.empty() && token.front() == '~') {
        return token.substr(1);
    }
    return token;
}

template <typename T>
auto widen(const Scalar& value) -> T {
    return std::visit(
        [](const auto& v) -> T {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                // Unreachable: text forces the Text kind before widening.
                return T{};
            } else {
                return static_cast<T>(v);
            }
        },
        value);
}

}  // namespace

auto common_kind(const std::vector<Scalar>& values) noexcept -> Kind {
    Kind kind = Kind::Logical;
    for (const auto& value : values) {
        kind = std::max(kind, kind_of(value));
    }
    return kind;
}

auto coerce_column(const std::vector<Scalar>& values, Kind kind) -> ColumnVector {
    switch (kind) {
        case Kind::Logical: {
            std::vector<bool> out;
            out.reserve(values.size());
            for (const auto& value : values) {
                out.push_back(widen<bool>(value));
            }
            return Column<bool>{std::move(out)};
        }
        case Kind::Integer: {
            std::vector<std::int64_t> out;
            out.reserve(values.size());
            for (const auto& value : values) {
                out.push_back(widen<std::int64_t>(value));
            }
            return Column<std::int64_t>{std::move(out)};
        }
        case Kind::Double: {
            std::vector<double> out;
            out.reserve(values.size());
            for (const auto& value : values) {
                out.push_back(widen<double>(value));
            }
            return Column<double>{std::move(out)};
        }
        case Kind::Text:
            break;
    }
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& value : values) {
        out.push_back(format_scalar(value));
    }
    return Column<std::string>{std::move(out)};
}

auto make_from_rows(const std::vector<std::string>& names, const std::vector<Scalar>& values)
    -> std::expected<Table, Error> {
    if (names.empty()) {
        return make_error(ErrorKind::Shape, "row-wise construction needs at least one column name");
    }
    const std::size_t width = names.size();
    if (values.size() % width != 0) {
        return make_error(ErrorKind::Shape,
                          fmt::format("{} values can't be split into rows of {} columns",
                                      values.size(), width));
    }
    const std::size_t rows = values.size() / width;

    std::vector<NamedColumn> columns;
    columns.reserve(width);
    for (std::size_t p = 0; p < width; ++p) {
        std::vector<Scalar> gathered;
        gathered.reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            gathered.push_back(values[r * width + p]);
        }
        auto name = strip_token(names[p]);
        if (name.empty()) {
            return make_error(ErrorKind::InvalidColumnName,
                              fmt::format("column token {} ('{}') has no name", p + 1, names[p]));
        }
        columns.push_back(NamedColumn{.name = std::move(name),
                                      .column = coerce_column(gathered, common_kind(gathered))});
    }
    return make_container(std::move(columns), Policy::Strict);
}

}  // namespace tabula::runtime
