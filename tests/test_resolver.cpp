#include <tabula/runtime/resolver.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace tabula;
using runtime::Arity;
using runtime::Key;
using runtime::Table;

namespace {

auto letters_table(Policy policy) -> Table {
    auto table = runtime::make_container(
        {
            {.name = "letters_lower", .column = Column<std::string>{"a", "b"}},
            {.name = "letters_upper", .column = Column<std::string>{"A", "B"}},
            {.name = "values", .column = Column<std::int64_t>{1, 2}},
        },
        policy);
    REQUIRE(table.has_value());
    return std::move(table.value());
}

auto indices(std::initializer_list<std::size_t> init) -> std::vector<std::size_t> {
    return std::vector<std::size_t>(init);
}

}  // namespace

TEST_CASE("Exact names resolve under both policies", "[runtime][resolver]") {
    for (auto policy : {Policy::Legacy, Policy::Strict}) {
        auto table = letters_table(policy);
        for (auto arity : {Arity::Single, Arity::Double}) {
            auto lookup = runtime::resolve_name(table, "values", arity);
            REQUIRE(lookup.found());
            REQUIRE(*lookup.columns == indices({2}));
            REQUIRE_FALSE(lookup.warning.has_value());
        }
    }
}

TEST_CASE("Legacy resolves a unique prefix silently", "[runtime][resolver]") {
    auto table = letters_table(Policy::Legacy);

    auto lookup = runtime::resolve_name(table, "val", Arity::Single);

    REQUIRE(lookup.found());
    REQUIRE(*lookup.columns == indices({2}));
    REQUIRE_FALSE(lookup.warning.has_value());
}

TEST_CASE("Legacy treats an ambiguous prefix as silently not found", "[runtime][resolver]") {
    auto table = letters_table(Policy::Legacy);

    auto lookup = runtime::resolve_name(table, "let", Arity::Single);

    REQUIRE_FALSE(lookup.found());
    REQUIRE_FALSE(lookup.warning.has_value());
}

TEST_CASE("Legacy element extraction matches exactly", "[runtime][resolver]") {
    auto table = letters_table(Policy::Legacy);

    auto lookup = runtime::resolve_name(table, "val", Arity::Double);

    REQUIRE_FALSE(lookup.found());
    REQUIRE_FALSE(lookup.warning.has_value());
}

TEST_CASE("An empty name never prefix-matches", "[runtime][resolver]") {
    auto single = runtime::make_container({{.name = "only", .column = Column<std::int64_t>{1}}},
                                          Policy::Legacy);
    REQUIRE(single.has_value());

    auto lookup = runtime::resolve_name(*single, "", Arity::Single);

    REQUIRE_FALSE(lookup.found());
    REQUIRE_FALSE(lookup.warning.has_value());
}

TEST_CASE("Strict never prefix-matches and warns", "[runtime][resolver]") {
    auto table = letters_table(Policy::Strict);

    for (const char* name : {"val", "let", "nope"}) {
        auto lookup = runtime::resolve_name(table, name, Arity::Single);
        REQUIRE_FALSE(lookup.found());
        REQUIRE(lookup.warning.has_value());
        REQUIRE(lookup.warning->kind == WarningKind::MissingColumn);
        REQUIRE(lookup.warning->message.find(name) != std::string::npos);
    }
}

TEST_CASE("Positions are 1-based and policy independent", "[runtime][resolver]") {
    for (auto policy : {Policy::Legacy, Policy::Strict}) {
        auto table = letters_table(policy);

        REQUIRE(runtime::resolve_position(table, 1) == std::size_t{0});
        REQUIRE(runtime::resolve_position(table, 3) == std::size_t{2});

        for (std::int64_t bad : {std::int64_t{0}, std::int64_t{4}, std::int64_t{-1}}) {
            auto outcome = runtime::resolve_position(table, bad);
            REQUIRE_FALSE(outcome.has_value());
            REQUIRE(outcome.error().kind == ErrorKind::IndexOutOfRange);
        }
    }
}

TEST_CASE("Key sets resolve in requested order", "[runtime][resolver]") {
    auto table = letters_table(Policy::Strict);

    auto resolved = runtime::resolve(table, Key{"values", 1}, Arity::Single);

    REQUIRE(resolved.has_value());
    REQUIRE(resolved->found());
    REQUIRE(*resolved->columns == indices({2, 0}));
}

TEST_CASE("A missing name makes the whole key set not found", "[runtime][resolver]") {
    SECTION("strict warns and names every missing column") {
        auto table = letters_table(Policy::Strict);
        auto resolved = runtime::resolve(table, Key{"values", "x", "y"}, Arity::Single);

        REQUIRE(resolved.has_value());
        REQUIRE_FALSE(resolved->found());
        REQUIRE(resolved->warning.has_value());
        REQUIRE(resolved->warning->message.find("`x`, `y`") != std::string::npos);
    }

    SECTION("legacy stays silent") {
        auto table = letters_table(Policy::Legacy);
        auto resolved = runtime::resolve(table, Key{"values", "x"}, Arity::Single);

        REQUIRE(resolved.has_value());
        REQUIRE_FALSE(resolved->found());
        REQUIRE_FALSE(resolved->warning.has_value());
    }
}

TEST_CASE("An out-of-range position in a key set aborts", "[runtime][resolver]") {
    auto table = letters_table(Policy::Legacy);

    auto resolved = runtime::resolve(table, Key{1, 9}, Arity::Single);

    REQUIRE_FALSE(resolved.has_value());
    REQUIRE(resolved.error().kind == ErrorKind::IndexOutOfRange);
}

TEST_CASE("Key::all resolves every column", "[runtime][resolver]") {
    auto table = letters_table(Policy::Legacy);

    auto resolved = runtime::resolve(table, Key::all(), Arity::Single);

    REQUIRE(resolved.has_value());
    REQUIRE(*resolved->columns == indices({0, 1, 2}));
}

TEST_CASE("format_key renders keys for messages", "[runtime][key]") {
    REQUIRE(runtime::format_key(Key("a")) == "`a`");
    REQUIRE(runtime::format_key(Key(3)) == "3");
    REQUIRE(runtime::format_key(Key{1, 3}) == "c(1, 3)");
    REQUIRE(runtime::format_key(Key::all()) == "<all>");
    REQUIRE(runtime::format_key(Key::names({"a", "b"})) == "c(`a`, `b`)");
    REQUIRE(runtime::format_key(Key::positions({2})) == "2");
}
