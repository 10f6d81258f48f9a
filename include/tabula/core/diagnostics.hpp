#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tabula {

/// Hard failures: the triggering operation is aborted.
enum class ErrorKind : std::uint8_t {
    IndexOutOfRange,
    InvalidIndex,
    LengthMismatch,
    Shape,
    UnequalColumnLength,
    DuplicateColumnName,
    InvalidColumnName,
};

/// Soft signals attached to an otherwise successful outcome.
enum class WarningKind : std::uint8_t {
    MissingColumn,
    RecycleLength,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;
[[nodiscard]] auto to_string(WarningKind kind) noexcept -> std::string_view;

struct Error {
    ErrorKind kind;
    std::string message;

    /// "<Kind>: <message>"
    [[nodiscard]] auto format() const -> std::string;
};

struct Warning {
    WarningKind kind;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result of an operation that never aborts on a failed lookup.
///
/// `value` is empty when the lookup found nothing; `warning` carries the
/// diagnostic the active policy attaches, if any.
template <typename T>
struct Outcome {
    std::optional<T> value;
    std::optional<Warning> warning;

    [[nodiscard]] auto found() const noexcept -> bool { return value.has_value(); }
};

template <typename T>
using Result = std::expected<Outcome<T>, Error>;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace tabula
