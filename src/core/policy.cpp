#include <tabula/core/policy.hpp>

#include <cctype>
#include <string>

namespace tabula {

auto to_string(Policy policy) noexcept -> std::string_view {
    switch (policy) {
        case Policy::Legacy:
            return "legacy";
        case Policy::Strict:
            return "strict";
    }
    return "unknown";
}

auto parse_policy(std::string_view text) -> std::optional<Policy> {
    std::string lowered;
    lowered.reserve(text.size());
    for (char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "legacy") {
        return Policy::Legacy;
    }
    if (lowered == "strict") {
        return Policy::Strict;
    }
    return std::nullopt;
}

}  // namespace tabula
