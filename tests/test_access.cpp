#include <tabula/runtime/ops.hpp>
#include <tabula/tour/tour.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using namespace tabula;
using runtime::ColumnVector;
using runtime::Key;
using runtime::RowSelector;
using runtime::Table;

namespace {

auto values_column() -> ColumnVector {
    std::vector<std::int64_t> values(26);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<std::int64_t>(i + 1);
    }
    return Column<std::int64_t>{std::move(values)};
}

}  // namespace

TEST_CASE("dollar with an exact name", "[ops][dollar]") {
    for (auto policy : {Policy::Legacy, Policy::Strict}) {
        auto table = tour::sample_table(policy);

        auto outcome = ops::dollar(table, "values");

        REQUIRE(outcome.found());
        REQUIRE(*outcome.value == values_column());
        REQUIRE_FALSE(outcome.warning.has_value());
    }
}

TEST_CASE("dollar with a partial name", "[ops][dollar]") {
    SECTION("legacy resolves a unique prefix") {
        auto outcome = ops::dollar(tour::sample_table(Policy::Legacy), "val");

        REQUIRE(outcome.found());
        REQUIRE(*outcome.value == values_column());
        REQUIRE_FALSE(outcome.warning.has_value());
    }

    SECTION("legacy returns nothing for an ambiguous prefix") {
        auto outcome = ops::dollar(tour::sample_table(Policy::Legacy), "let");

        REQUIRE_FALSE(outcome.found());
        REQUIRE_FALSE(outcome.warning.has_value());
    }

    SECTION("legacy never resolves an empty name") {
        auto single = runtime::make_container(
            {{.name = "values", .column = Column<std::int64_t>{1, 2}}}, Policy::Legacy);
        REQUIRE(single.has_value());

        auto outcome = ops::dollar(*single, "");

        REQUIRE_FALSE(outcome.found());
        REQUIRE_FALSE(outcome.warning.has_value());
    }

    SECTION("strict warns for both") {
        auto table = tour::sample_table(Policy::Strict);
        for (const char* name : {"val", "let"}) {
            auto outcome = ops::dollar(table, name);
            REQUIRE_FALSE(outcome.found());
            REQUIRE(outcome.warning.has_value());
            REQUIRE(outcome.warning->kind == WarningKind::MissingColumn);
        }
    }
}

TEST_CASE("Single bracket always returns a container", "[ops][bracket]") {
    for (auto policy : {Policy::Legacy, Policy::Strict}) {
        auto table = tour::sample_table(policy);

        auto outcome = ops::bracket(table, Key("letters_upper"));

        REQUIRE(outcome.has_value());
        REQUIRE(outcome->found());
        const auto& subset = *outcome->value;
        REQUIRE(subset.cols() == 1);
        REQUIRE(subset.rows() == 26);
        REQUIRE(subset.policy() == policy);
        REQUIRE(subset.names() == std::vector<std::string>{"letters_upper"});
    }
}

TEST_CASE("Single bracket keeps key order and is idempotent", "[ops][bracket]") {
    auto table = tour::sample_table(Policy::Strict);

    auto first = ops::bracket(table, Key{"values", "letters_lower"});
    REQUIRE(first.has_value());
    REQUIRE(first->value->names() == std::vector<std::string>{"values", "letters_lower"});

    auto again = ops::bracket(*first->value, Key{"values", "letters_lower"});
    REQUIRE(again.has_value());
    REQUIRE(*again->value == *first->value);
}

TEST_CASE("Positions in a bracket key are relative to the receiver", "[ops][bracket]") {
    auto table = tour::sample_table(Policy::Legacy);

    auto first = ops::bracket(table, Key{2, 1});
    REQUIRE(first.has_value());
    REQUIRE(first->value->names() ==
            std::vector<std::string>{"letters_upper", "letters_lower"});

    auto again = ops::bracket(*first->value, Key{2, 1});
    REQUIRE(again.has_value());
    REQUIRE(again->value->names() ==
            std::vector<std::string>{"letters_lower", "letters_upper"});

    auto by_name = ops::bracket(*first->value, Key{"letters_upper", "letters_lower"});
    REQUIRE(by_name.has_value());
    REQUIRE(*by_name->value == *first->value);
}

TEST_CASE("Single bracket with a missing column", "[ops][bracket]") {
    SECTION("strict warns") {
        auto outcome = ops::bracket(tour::sample_table(Policy::Strict), Key("nope"));
        REQUIRE(outcome.has_value());
        REQUIRE_FALSE(outcome->found());
        REQUIRE(outcome->warning.has_value());
    }

    SECTION("position out of range is an error under both policies") {
        for (auto policy : {Policy::Legacy, Policy::Strict}) {
            auto outcome = ops::bracket(tour::sample_table(policy), Key(4));
            REQUIRE_FALSE(outcome.has_value());
            REQUIRE(outcome.error().kind == ErrorKind::IndexOutOfRange);
        }
    }
}

TEST_CASE("Repeated columns in a key", "[ops][bracket]") {
    SECTION("strict rejects the duplicate name") {
        auto outcome = ops::bracket(tour::sample_table(Policy::Strict), Key{1, 1});
        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().kind == ErrorKind::DuplicateColumnName);
    }

    SECTION("legacy renames the repeat") {
        auto outcome = ops::bracket(tour::sample_table(Policy::Legacy), Key{1, 1});
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->value->names() ==
                std::vector<std::string>{"letters_lower", "letters_lower.1"});
    }
}

TEST_CASE("Row and column bracket drops dimensions only under legacy", "[ops][bracket]") {
    SECTION("legacy single column becomes a bare column") {
        auto outcome =
            ops::bracket(tour::sample_table(Policy::Legacy), RowSelector::all(), Key("values"));

        REQUIRE(outcome.has_value());
        REQUIRE(outcome->found());
        REQUIRE(std::holds_alternative<ColumnVector>(*outcome->value));
        REQUIRE(std::get<ColumnVector>(*outcome->value) == values_column());
    }

    SECTION("strict single column stays a container") {
        auto outcome =
            ops::bracket(tour::sample_table(Policy::Strict), RowSelector::all(), Key("values"));

        REQUIRE(outcome.has_value());
        REQUIRE(std::holds_alternative<Table>(*outcome->value));
        REQUIRE(std::get<Table>(*outcome->value).cols() == 1);
    }

    SECTION("legacy with several columns stays a container") {
        auto outcome = ops::bracket(tour::sample_table(Policy::Legacy), RowSelector::all(),
                                    Key{"values", "letters_upper"});

        REQUIRE(outcome.has_value());
        REQUIRE(std::holds_alternative<Table>(*outcome->value));
    }

    SECTION("selected rows are gathered in order") {
        auto outcome = ops::bracket(tour::sample_table(Policy::Legacy), RowSelector{3, 1},
                                    Key("letters_upper"));

        REQUIRE(outcome.has_value());
        REQUIRE(std::get<ColumnVector>(*outcome->value) ==
                ColumnVector{Column<std::string>{"C", "A"}});
    }

    SECTION("row out of range is an error before column lookup") {
        auto outcome =
            ops::bracket(tour::sample_table(Policy::Strict), RowSelector{27}, Key("nope"));

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().kind == ErrorKind::IndexOutOfRange);
    }
}

TEST_CASE("Double bracket with a scalar key matches across policies", "[ops][double_bracket]") {
    auto legacy = tour::sample_table(Policy::Legacy);
    auto strict = tour::sample_table(Policy::Strict);

    for (const Key& key : {Key("values"), Key(3), Key("letters_upper")}) {
        auto a = ops::double_bracket(legacy, key);
        auto b = ops::double_bracket(strict, key);

        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->found());
        REQUIRE(*a->value == *b->value);
    }
}

TEST_CASE("Double bracket never prefix-matches", "[ops][double_bracket]") {
    auto legacy = ops::double_bracket(tour::sample_table(Policy::Legacy), Key("val"));
    REQUIRE(legacy.has_value());
    REQUIRE_FALSE(legacy->found());
    REQUIRE_FALSE(legacy->warning.has_value());

    auto strict = ops::double_bracket(tour::sample_table(Policy::Strict), Key("val"));
    REQUIRE(strict.has_value());
    REQUIRE_FALSE(strict->found());
    REQUIRE(strict->warning.has_value());
}

TEST_CASE("Double bracket with a compound key", "[ops][double_bracket]") {
    SECTION("legacy chains into the element") {
        auto outcome = ops::double_bracket(tour::sample_table(Policy::Legacy), Key{1, 3});

        REQUIRE(outcome.has_value());
        REQUIRE(outcome->found());
        REQUIRE(*outcome->value == ColumnVector{Column<std::string>{"c"}});
    }

    SECTION("legacy chain out of bounds") {
        auto outcome = ops::double_bracket(tour::sample_table(Policy::Legacy), Key{1, 27});

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().kind == ErrorKind::IndexOutOfRange);
    }

    SECTION("strict rejects the key") {
        auto outcome = ops::double_bracket(tour::sample_table(Policy::Strict), Key{1, 3});

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().kind == ErrorKind::InvalidIndex);
    }
}

TEST_CASE("Double bracket with no key is invalid", "[ops][double_bracket]") {
    for (auto policy : {Policy::Legacy, Policy::Strict}) {
        auto outcome = ops::double_bracket(tour::sample_table(policy), Key::all());

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().kind == ErrorKind::InvalidIndex);
    }
}

TEST_CASE("Accessors leave their input untouched", "[ops]") {
    auto table = tour::sample_table(Policy::Legacy);
    const auto before = table;

    (void)ops::dollar(table, "val");
    (void)ops::bracket(table, Key{2, 1});
    (void)ops::bracket(table, RowSelector{1}, Key("values"));
    (void)ops::double_bracket(table, Key{1, 2});

    REQUIRE(table == before);
}
