//
// Created by gregorian-rayne on 10/12/26.
//

#include "ppa/types.hpp"
#include "ppa/utils/string_utils.hpp"

namespace ppa
{
    std::optional<Severity> parse_severity(const std::string_view text) {
        const std::string lowered = string_utils::to_lower(string_utils::trim(text));
        for (const auto severity : kAllSeverities) {
            if (lowered == to_string(severity)) {
                return severity;
            }
        }
        return std::nullopt;
    }

    std::optional<IssueCategory> parse_category(const std::string_view text) {
        const std::string normalized = string_utils::replace_all(
            string_utils::to_lower(string_utils::trim(text)), "_", "-");
        for (const auto category : kAllCategories) {
            if (normalized == to_string(category)) {
                return category;
            }
        }
        return std::nullopt;
    }

    std::optional<RuleId> parse_rule_id(const std::string_view text) {
        const std::string normalized = string_utils::replace_all(
            string_utils::to_lower(string_utils::trim(text)), "-", "_");
        for (const auto rule : kAllRules) {
            if (normalized == to_string(rule)) {
                return rule;
            }
        }
        return std::nullopt;
    }
}  // namespace ppa
