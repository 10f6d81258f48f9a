#pragma once

#include <tabula/core/policy.hpp>
#include <tabula/runtime/table.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

namespace tabula::tour {

/// Configuration for a tour session.
struct TourConfig {
    bool verbose = false;
    /// Rows shown when printing a Strict container.
    std::size_t max_rows = 10;
    /// Profiles walked through, in order.
    std::vector<Policy> policies = {Policy::Legacy, Policy::Strict};
};

/// Parse a row limit such as the value of TABULA_MAX_ROWS. Returns nullopt
/// unless the whole text is a positive decimal integer.
[[nodiscard]] auto parse_max_rows(std::string_view text) -> std::optional<std::size_t>;

/// The 26-row sample container: letters_lower, letters_upper, values.
[[nodiscard]] auto sample_table(Policy policy) -> runtime::Table;

/// Walk through every accessor on the sample container under each
/// configured policy, printing each outcome to `out`.
///
/// Returns false if any outcome contradicts its policy's contract.
[[nodiscard]] auto run(const TourConfig& config, std::ostream& out = std::cout) -> bool;

}  // namespace tabula::tour
