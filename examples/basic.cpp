#include <tabula/core/column.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/table.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

auto main() -> int {
    using namespace tabula;

    // The same columns under both profiles.
    std::vector<runtime::NamedColumn> columns = {
        {.name = "symbol", .column = Column<std::string>{"A", "B", "C", "D"}},
        {.name = "price", .column = Column<double>{100.5, 200.3, 50.0, 175.8}},
    };
    auto legacy = runtime::make_container(columns, Policy::Legacy);
    auto strict = runtime::make_container(columns, Policy::Strict);
    if (!legacy || !strict) {
        fmt::print("construction failed\n");
        return 1;
    }

    fmt::print("=== Partial names ===\n");
    auto legacy_pr = ops::dollar(*legacy, "pr");
    auto strict_pr = ops::dollar(*strict, "pr");
    fmt::print("legacy df$pr found: {}\n", legacy_pr.found());
    fmt::print("strict df$pr found: {} ({})\n", strict_pr.found(),
               strict_pr.warning ? strict_pr.warning->format() : "no warning");

    fmt::print("\n=== Dimension dropping ===\n");
    auto legacy_col = ops::bracket(*legacy, runtime::RowSelector::all(), "price");
    auto strict_col = ops::bracket(*strict, runtime::RowSelector::all(), "price");
    if (!legacy_col || !strict_col) {
        fmt::print("column selection failed\n");
        return 1;
    }
    fmt::print("legacy df[, \"price\"] is a vector: {}\n",
               std::holds_alternative<runtime::ColumnVector>(*legacy_col->value));
    fmt::print("strict df[, \"price\"] is a vector: {}\n",
               std::holds_alternative<runtime::ColumnVector>(*strict_col->value));

    fmt::print("\n=== Recycling ===\n");
    auto legacy_flag = ops::assign_column(*legacy, "flag", Column<bool>{true, false});
    auto strict_flag = ops::assign_column(*strict, "flag", Column<bool>{true, false});
    if (!legacy_flag) {
        fmt::print("{}\n", legacy_flag.error().format());
        return 1;
    }
    fmt::print("legacy df$flag <- c(TRUE, FALSE): {} columns\n", legacy_flag->value->cols());
    fmt::print("strict df$flag <- c(TRUE, FALSE): {}\n",
               strict_flag ? "accepted" : strict_flag.error().format());

    ops::print(*legacy_flag->value);
    return 0;
}
