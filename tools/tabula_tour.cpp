#include <tabula/core/policy.hpp>
#include <tabula/tour/tour.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Tabula: legacy and strict column access side by side"};

    bool verbose = false;
    std::string policy = "both";
    std::optional<std::size_t> max_rows;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--policy", policy, "Profile to walk through: legacy, strict or both")
        ->transform(CLI::IsMember({"legacy", "strict", "both"}, CLI::ignore_case));
    app.add_option("--max-rows", max_rows,
                   "Rows shown when printing a strict container. "
                   "Defaults to TABULA_MAX_ROWS environment variable, then 10.")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    tabula::tour::TourConfig config;
    config.verbose = verbose;

    // Resolve the row limit: --max-rows flag takes precedence,
    // then fall back to TABULA_MAX_ROWS environment variable.
    if (!max_rows) {
        if (const char* env = std::getenv("TABULA_MAX_ROWS"); env != nullptr) {
            max_rows = tabula::tour::parse_max_rows(env);
            if (!max_rows) {
                spdlog::warn("ignoring TABULA_MAX_ROWS='{}': not a positive integer", env);
            }
        }
    }
    if (max_rows) {
        config.max_rows = *max_rows;
    }

    if (policy != "both") {
        auto parsed = tabula::parse_policy(policy);
        if (!parsed) {
            spdlog::error("unknown policy '{}'", policy);
            return 2;
        }
        config.policies = {*parsed};
    }

    return tabula::tour::run(config) ? 0 : 1;
}
