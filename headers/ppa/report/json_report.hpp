//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef PPA_JSON_REPORT_HPP
#define PPA_JSON_REPORT_HPP

/**
 * @file json_report.hpp
 * @brief JSON shapes handed to callers of the checker.
 *
 * Issue:
 * @code
 *     {"category": "blocking-io-in-async", "severity": "critical",
 *      "line_number": 4, "end_line_number": 4,
 *      "description": "...", "suggestion": "...",
 *      "code_snippet": "    f = open(path)" | null,
 *      "function_name": "load" | null}
 * @endcode
 *
 * Summary:
 * @code
 *     {"total_issues": 1,
 *      "by_severity": {"critical": 1, "high": 0, "medium": 0, "low": 0},
 *      "by_category": {"repeated-query-in-loop": 0, ...}}
 * @endcode
 */

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/checker/performance_checker.hpp"
#include "ppa/error.hpp"
#include "ppa/result.hpp"
#include "ppa/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ppa::report {

    [[nodiscard]] nlohmann::json to_json(const PerformanceIssue& issue);
    [[nodiscard]] nlohmann::json to_json(const std::vector<PerformanceIssue>& issues);
    [[nodiscard]] nlohmann::json to_json(const IssueSummary& summary);

    /**
     * Structural model: functions, loops, imports, calls and classes.
     */
    [[nodiscard]] nlohmann::json structure_to_json(const analysis::AstAnalyzer& analyzer);

    /**
     * Full result of one check: {"file"?, "issues", "summary"}.
     */
    [[nodiscard]] nlohmann::json check_report(const checker::PerformanceChecker& checker,
                                              const std::optional<std::string>& file = std::nullopt);

    /**
     * Reads an issue back from its JSON shape.
     *
     * @return ParseError for missing fields or unknown enum names.
     */
    [[nodiscard]] Result<PerformanceIssue, Error> issue_from_json(const nlohmann::json& json);

    /**
     * Serializes for output. Source text is not required to be UTF-8, so
     * invalid byte sequences in snippets are replaced with U+FFFD.
     */
    [[nodiscard]] std::string dump_json(const nlohmann::json& json, int indent = 2);

    [[nodiscard]] Result<void, Error> write_json(const std::filesystem::path& path,
                                                 const nlohmann::json& json,
                                                 int indent = 2);

}  // namespace ppa::report

#endif //PPA_JSON_REPORT_HPP
