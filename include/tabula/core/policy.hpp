#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tabula {

/// Indexing and mutation profile attached to every container.
///
/// Legacy: permissive data.frame-like behavior (partial name matching,
///         dimension dropping, cyclic recycling on assignment).
/// Strict: tibble-like behavior (exact names with warnings, never drops
///         dimensions, assignment accepts only length 1 or the row count).
enum class Policy : std::uint8_t {
    Legacy,
    Strict,
};

[[nodiscard]] auto to_string(Policy policy) noexcept -> std::string_view;

/// Parse "legacy" or "strict" (case-insensitive).
[[nodiscard]] auto parse_policy(std::string_view text) -> std::optional<Policy>;

}  // namespace tabula
