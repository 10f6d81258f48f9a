#include <tabula/runtime/key.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace tabula::runtime {

namespace {

auto format_item(const KeyItem& item) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::string>) {
                return fmt::format("`{}`", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        item);
}

}  // namespace

auto Key::names(const std::vector<std::string>& names) -> Key {
    std::vector<KeyItem> items;
    items.reserve(names.size());
    for (const auto& name : names) {
        items.emplace_back(name);
    }
    return Key(std::move(items));
}

auto Key::positions(const std::vector<std::int64_t>& positions) -> Key {
    std::vector<KeyItem> items;
    items.reserve(positions.size());
    for (auto pos : positions) {
        items.emplace_back(pos);
    }
    return Key(std::move(items));
}

auto format_key(const Key& key) -> std::string {
    if (key.is_all()) {
        return "<all>";
    }
    if (key.is_scalar()) {
        return format_item(key.items().front());
    }
    std::string out = "c(";
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(format_item(key.items()[i]));
    }
    out.push_back(')');
    return out;
}

}  // namespace tabula::runtime
