#include <tabula/core/diagnostics.hpp>

#include <fmt/format.h>

#include <string>

namespace tabula {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::IndexOutOfRange:
            return "IndexOutOfRange";
        case ErrorKind::InvalidIndex:
            return "InvalidIndexError";
        case ErrorKind::LengthMismatch:
            return "LengthMismatchError";
        case ErrorKind::Shape:
            return "ShapeError";
        case ErrorKind::UnequalColumnLength:
            return "UnequalColumnLengthError";
        case ErrorKind::DuplicateColumnName:
            return "DuplicateColumnNameError";
        case ErrorKind::InvalidColumnName:
            return "InvalidColumnNameError";
    }
    return "UnknownError";
}

auto to_string(WarningKind kind) noexcept -> std::string_view {
    switch (kind) {
        case WarningKind::MissingColumn:
            return "MissingColumnWarning";
        case WarningKind::RecycleLength:
            return "RecycleLengthWarning";
    }
    return "UnknownWarning";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto Warning::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace tabula
