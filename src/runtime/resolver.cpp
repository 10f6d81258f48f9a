#include <tabula/runtime/resolver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <numeric>
#include <string_view>

namespace tabula::runtime {

namespace {

auto missing_column_warning(const std::vector<std::string>& missing) -> Warning {
    std::string names;
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            names.append(", ");
        }
        names.append(fmt::format("`{}`", missing[i]));
    }
    return Warning{.kind = WarningKind::MissingColumn,
                   .message = fmt::format("Unknown or uninitialised column{}: {}.",
                                          missing.size() > 1 ? "s" : "", names)};
}

auto prefix_matches(const Table& table, std::string_view prefix) -> std::vector<std::size_t> {
    std::vector<std::size_t> matches;
    for (std::size_t i = 0; i < table.cols(); ++i) {
        if (std::string_view(table.columns()[i].name).starts_with(prefix)) {
            matches.push_back(i);
        }
    }
    return matches;
}

}  // namespace

auto resolve_name(const Table& table, const std::string& name, Arity arity) -> Resolution {
    if (auto exact = table.index_of(name)) {
        return Resolution{.columns = std::vector<std::size_t>{*exact}, .warning = std::nullopt};
    }

    switch (table.policy()) {
        case Policy::Legacy: {
            // An empty name is a prefix of every column.
            if (arity == Arity::Double || name.empty()) {
                return Resolution{};
            }
            auto matches = prefix_matches(table, name);
            if (matches.size() == 1) {
                return Resolution{.columns = std::move(matches), .warning = std::nullopt};
            }
            if (matches.size() > 1) {
                spdlog::debug("'{}' is a prefix of {} columns; treating as not found", name,
                              matches.size());
            }
            return Resolution{};
        }
        case Policy::Strict: {
            auto warning = missing_column_warning({name});
            spdlog::debug("{}", warning.format());
            return Resolution{.columns = std::nullopt, .warning = std::move(warning)};
        }
    }
    return Resolution{};
}

auto resolve_position(const Table& table, std::int64_t position)
    -> std::expected<std::size_t, Error> {
    if (position < 1 || static_cast<std::size_t>(position) > table.cols()) {
        return make_error(ErrorKind::IndexOutOfRange,
                          fmt::format("can't subset column {}: container has {} column{}",
                                      position, table.cols(), table.cols() == 1 ? "" : "s"));
    }
    return static_cast<std::size_t>(position - 1);
}

auto resolve(const Table& table, const Key& key, Arity arity) -> std::expected<Resolution, Error> {
    if (key.is_all()) {
        std::vector<std::size_t> every(table.cols());
        std::iota(every.begin(), every.end(), std::size_t{0});
        return Resolution{.columns = std::move(every), .warning = std::nullopt};
    }

    std::vector<std::size_t> resolved;
    resolved.reserve(key.size());
    std::vector<std::string> missing;
    for (const auto& item : key.items()) {
        if (const auto* position = std::get_if<std::int64_t>(&item)) {
            auto index = resolve_position(table, *position);
            if (!index) {
                return std::unexpected(index.error());
            }
            resolved.push_back(*index);
            continue;
        }
        const auto& name = std::get<std::string>(item);
        auto lookup = resolve_name(table, name, arity);
        if (!lookup.found()) {
            missing.push_back(name);
            continue;
        }
        resolved.push_back(lookup.columns->front());
    }

    if (missing.empty()) {
        return Resolution{.columns = std::move(resolved), .warning = std::nullopt};
    }
    if (table.policy() == Policy::Strict) {
        return Resolution{.columns = std::nullopt, .warning = missing_column_warning(missing)};
    }
    return Resolution{};
}

}  // namespace tabula::runtime
