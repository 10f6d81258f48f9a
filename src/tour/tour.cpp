#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/row_builder.hpp>
#include <tabula/tour/tour.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

namespace tabula::tour {

namespace {

using runtime::ColumnVector;
using runtime::Key;
using runtime::RowSelector;
using runtime::Table;

class Session {
   public:
    Session(std::ostream& out, std::size_t max_rows) : out_(out), max_rows_(max_rows) {}

    void heading(std::string_view title) { out_ << fmt::format("\n── {} ──\n", title); }

    void command(std::string_view text) { out_ << fmt::format("> {}\n", text); }

    void expect(bool condition, std::string_view what) {
        if (!condition) {
            ok_ = false;
            spdlog::error("unexpected outcome: {}", what);
            out_ << fmt::format("!! unexpected: {}\n", what);
        }
    }

    void show(const Table& table) { ops::print(table, out_, max_rows_); }

    void show(const ColumnVector& column) { ops::print(column, out_); }

    template <typename T>
    void show(const Outcome<T>& outcome) {
        if (outcome.warning) {
            out_ << fmt::format("Warning: {}\n", outcome.warning->format());
        }
        if (!outcome.value) {
            out_ << "NULL\n";
            return;
        }
        if constexpr (std::is_same_v<T, ops::Selection>) {
            std::visit([this](const auto& v) { show(v); }, *outcome.value);
        } else {
            show(*outcome.value);
        }
    }

    template <typename T>
    void show(const Result<T>& result) {
        if (!result) {
            out_ << fmt::format("Error: {}\n", result.error().format());
            return;
        }
        show(*result);
    }

    [[nodiscard]] auto ok() const noexcept -> bool { return ok_; }

   private:
    std::ostream& out_;
    std::size_t max_rows_;
    bool ok_ = true;
};

auto letters(char first) -> Column<std::string> {
    std::vector<std::string> out;
    out.reserve(26);
    for (char ch = first; ch < first + 26; ++ch) {
        out.emplace_back(1, ch);
    }
    return Column<std::string>{std::move(out)};
}

void tour_name_access(Session& session, const Table& df) {
    const bool legacy = df.policy() == Policy::Legacy;
    session.heading("name access");

    session.command("df$values");
    auto exact = ops::dollar(df, "values");
    session.show(exact);
    session.expect(exact.found(), "exact name must resolve");

    session.command("df$val");
    auto prefix = ops::dollar(df, "val");
    session.show(prefix);
    session.expect(prefix.found() == legacy, "unique prefix resolves only under legacy");
    session.expect(prefix.warning.has_value() != legacy, "strict warns on a missing name");

    session.command("df$let");
    auto ambiguous = ops::dollar(df, "let");
    session.show(ambiguous);
    session.expect(!ambiguous.found(), "ambiguous prefix never resolves");
    session.expect(ambiguous.warning.has_value() != legacy, "only strict signals a miss");
}

void tour_brackets(Session& session, const Table& df) {
    const bool legacy = df.policy() == Policy::Legacy;
    session.heading("single and two-argument brackets");

    session.command("df[\"values\"]");
    auto single = ops::bracket(df, Key("values"));
    session.show(single);
    session.expect(single.has_value() && single->found() && single->value->cols() == 1,
                   "single bracket keeps the container shape");

    session.command("df[1:3, \"values\"]");
    auto one = ops::bracket(df, RowSelector{1, 2, 3}, Key("values"));
    session.show(one);
    session.expect(one.has_value() && one->found() &&
                       std::holds_alternative<ColumnVector>(*one->value) == legacy,
                   "one column drops to a vector only under legacy");

    session.command("df[1:3, c(\"letters_lower\", \"values\")]");
    auto two = ops::bracket(df, RowSelector{1, 2, 3}, Key{"letters_lower", "values"});
    session.show(two);
    session.expect(two.has_value() && two->found() &&
                       std::holds_alternative<Table>(*two->value),
                   "two columns always stay a container");
}

void tour_extraction(Session& session, const Table& df) {
    const bool legacy = df.policy() == Policy::Legacy;
    session.heading("element extraction");

    session.command("df[[1]]");
    auto scalar = ops::double_bracket(df, Key(1));
    session.show(scalar);
    session.expect(scalar.has_value() && scalar->found(), "scalar key extracts the column");

    session.command("df[[c(1, 3)]]");
    auto compound = ops::double_bracket(df, Key{1, 3});
    session.show(compound);
    if (legacy) {
        session.expect(compound.has_value() && compound->found() &&
                           runtime::column_size(*compound->value) == 1,
                       "legacy chains a compound key into one element");
    } else {
        session.expect(!compound.has_value() &&
                           compound.error().kind == ErrorKind::InvalidIndex,
                       "strict rejects a compound key");
    }
}

void tour_assignment(Session& session, const Table& df) {
    const bool legacy = df.policy() == Policy::Legacy;
    session.heading("assignment");

    session.command("df$ones <- 1");
    auto ones = ops::assign_column(df, "ones", Column<std::int64_t>{1});
    session.show(ones);
    session.expect(ones.has_value() && ones->value->cols() == df.cols() + 1,
                   "length-1 source broadcasts under both profiles");

    session.command("df$pair <- 1:2");
    auto pair = ops::assign_column(df, "pair", Column<std::int64_t>{1, 2});
    session.show(pair);
    session.expect(pair.has_value() == legacy, "only legacy recycles a divisor length");

    session.command("df$triple <- 1:3");
    auto triple = ops::assign_column(df, "triple", Column<std::int64_t>{1, 2, 3});
    session.show(triple);
    if (legacy) {
        session.expect(triple.has_value() && triple->warning.has_value() &&
                           *triple->value == df,
                       "legacy leaves the container unchanged for a non-divisor length");
    } else {
        session.expect(!triple.has_value(), "strict rejects a mismatched length");
    }

    session.command("df  # unchanged until rebound");
    session.show(df);
    session.expect(df.find("ones") == nullptr, "assignment never mutates its input");
}

void tour_rows(Session& session) {
    using namespace std::string_literals;
    session.heading("row-wise construction");

    session.command("tribble(~letters, ~numbers, \"a\", 1, \"b\", 2, \"c\", 3)");
    auto built = runtime::make_from_rows(
        {"~letters", "~numbers"},
        {"a"s, std::int64_t{1}, "b"s, std::int64_t{2}, "c"s, std::int64_t{3}});
    if (built) {
        session.show(*built);
    } else {
        session.show(Result<Table>{std::unexpected(built.error())});
    }
    session.expect(built.has_value() && built->policy() == Policy::Strict && built->rows() == 3,
                   "row-wise construction yields a strict container");

    session.command("tribble(~letters, ~numbers, \"a\", 1, \"b\", 2, \"c\")");
    auto ragged = runtime::make_from_rows({"~letters", "~numbers"},
                                          {"a"s, std::int64_t{1}, "b"s, std::int64_t{2}, "c"s});
    if (!ragged) {
        session.show(Result<Table>{std::unexpected(ragged.error())});
    }
    session.expect(!ragged && ragged.error().kind == ErrorKind::Shape,
                   "a ragged value list is a shape error");
}

}  // namespace

auto parse_max_rows(std::string_view text) -> std::optional<std::size_t> {
    std::size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || parsed == 0) {
        return std::nullopt;
    }
    return parsed;
}

auto sample_table(Policy policy) -> Table {
    std::vector<std::int64_t> values(26);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<std::int64_t>(i + 1);
    }
    auto table = runtime::make_container(
        {
            {.name = "letters_lower", .column = letters('a')},
            {.name = "letters_upper", .column = letters('A')},
            {.name = "values", .column = Column<std::int64_t>{std::move(values)}},
        },
        policy);
    if (!table) {
        throw std::runtime_error(table.error().format());
    }
    return std::move(*table);
}

auto run(const TourConfig& config, std::ostream& out) -> bool {
    if (config.verbose) {
        spdlog::info("tour started (policies={}, max_rows={})", config.policies.size(),
                     config.max_rows);
    }

    Session session{out, config.max_rows};
    for (auto policy : config.policies) {
        out << fmt::format("\n=== {} profile ===\n", to_string(policy));
        auto df = sample_table(policy);
        session.command("df");
        session.show(df);
        tour_name_access(session, df);
        tour_brackets(session, df);
        tour_extraction(session, df);
        tour_assignment(session, df);
    }
    tour_rows(session);

    if (config.verbose) {
        spdlog::info("tour finished (ok={})", session.ok());
    }
    return session.ok();
}

}  // namespace tabula::tour
