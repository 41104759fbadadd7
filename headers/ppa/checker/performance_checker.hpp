//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef PPA_PERFORMANCE_CHECKER_HPP
#define PPA_PERFORMANCE_CHECKER_HPP

/**
 * @file performance_checker.hpp
 * @brief Runs the detection rules over one module.
 *
 * Construction parses the module, extracts the structural model and runs
 * every enabled rule once. The merged findings are sorted critical first,
 * then by line, and never change afterwards; every query below reads that
 * stored list.
 *
 * @code
 *     auto checker = checker::PerformanceChecker::from_file("app.py");
 *     if (checker.is_err()) {
 *         return checker.error();
 *     }
 *     for (const auto& issue : checker.value().check_all()) {
 *         std::cout << issue.line << ": " << issue.description << "\n";
 *     }
 * @endcode
 */

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/config/checker_config.hpp"
#include "ppa/error.hpp"
#include "ppa/frontend/frontend.hpp"
#include "ppa/patterns/catalog.hpp"
#include "ppa/result.hpp"
#include "ppa/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ppa::checker {

    class PerformanceChecker {
    public:
        /**
         * @return ConfigError for an invalid configuration, otherwise the
         *         front end's usage, resource or parse error.
         */
        [[nodiscard]] static Result<PerformanceChecker, Error> create(
            const frontend::SourceInput& input,
            config::CheckerConfig config = {}
        );

        [[nodiscard]] static Result<PerformanceChecker, Error> from_source(
            std::string source,
            config::CheckerConfig config = {}
        );

        [[nodiscard]] static Result<PerformanceChecker, Error> from_file(
            const std::filesystem::path& path,
            config::CheckerConfig config = {}
        );

        /**
         * Builds a checker over an existing model. The configuration must
         * already be valid.
         */
        PerformanceChecker(analysis::AstAnalyzer analyzer, config::CheckerConfig config);

        // Single rules, run on demand whether or not they are enabled.
        [[nodiscard]] std::vector<PerformanceIssue> check_repeated_queries() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_blocking_io_in_async() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_inefficient_loops() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_memory_loads() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_exceptions_in_loops() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_type_conversions_in_loops() const;
        [[nodiscard]] std::vector<PerformanceIssue> check_global_mutations() const;

        [[nodiscard]] std::vector<PerformanceIssue> run_rule(RuleId rule) const;

        /**
         * Findings of every enabled rule at or above the configured minimum
         * severity, ordered by severity (critical first), then line.
         */
        [[nodiscard]] const std::vector<PerformanceIssue>& check_all() const noexcept { return issues_; }

        [[nodiscard]] std::vector<PerformanceIssue> issues_by_severity(Severity severity) const;
        [[nodiscard]] std::vector<PerformanceIssue> issues_by_category(IssueCategory category) const;
        [[nodiscard]] std::vector<PerformanceIssue> critical_issues() const;

        [[nodiscard]] bool has_issues() const noexcept { return !issues_.empty(); }

        /**
         * Counts of check_all(). Every severity and category appears.
         */
        [[nodiscard]] IssueSummary summary() const;

        [[nodiscard]] const analysis::AstAnalyzer& analyzer() const noexcept { return analyzer_; }
        [[nodiscard]] const config::CheckerConfig& config() const noexcept { return config_; }
        [[nodiscard]] const patterns::PatternCatalog& catalog() const noexcept { return catalog_; }

    private:
        analysis::AstAnalyzer analyzer_;
        config::CheckerConfig config_;
        patterns::PatternCatalog catalog_;
        std::vector<PerformanceIssue> issues_;
    };

    /**
     * Counts a list of issues the way PerformanceChecker::summary() does.
     */
    [[nodiscard]] IssueSummary summarize(const std::vector<PerformanceIssue>& issues);

}  // namespace ppa::checker

#endif //PPA_PERFORMANCE_CHECKER_HPP
