#pragma once

#include <tabula/core/diagnostics.hpp>
#include <tabula/runtime/key.hpp>
#include <tabula/runtime/table.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace tabula::runtime {

/// Operator context of a lookup. `Double` is element extraction (`[[`),
/// which matches names exactly under every policy.
enum class Arity : std::uint8_t {
    Single,
    Double,
};

struct Resolution {
    /// 0-based column indices in key order; nullopt when the key matched nothing.
    std::optional<std::vector<std::size_t>> columns;
    std::optional<Warning> warning;

    [[nodiscard]] auto found() const noexcept -> bool { return columns.has_value(); }
};

/// Resolve one column name.
///
/// An exact match always wins. Otherwise a Legacy container under `Single`
/// arity accepts the unique column the name is a prefix of, and reports
/// nothing when zero or several columns match. A Strict container never
/// prefix-matches and attaches a MissingColumn warning instead. An empty
/// name never matches.
[[nodiscard]] auto resolve_name(const Table& table, const std::string& name, Arity arity)
    -> Resolution;

/// Map a 1-based column position to a 0-based index.
[[nodiscard]] auto resolve_position(const Table& table, std::int64_t position)
    -> std::expected<std::size_t, Error>;

/// Resolve every item of `key` in order. A missing name makes the whole key
/// NotFound; an out-of-range position aborts with IndexOutOfRange.
[[nodiscard]] auto resolve(const Table& table, const Key& key, Arity arity)
    -> std::expected<Resolution, Error>;

}  // namespace tabula::runtime
