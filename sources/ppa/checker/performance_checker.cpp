//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/checker/performance_checker.hpp"
#include "ppa/rules/rule.hpp"

#include <algorithm>
#include <iterator>

namespace ppa::checker
{
    namespace {

        std::vector<PerformanceIssue> filter(const std::vector<PerformanceIssue>& issues, auto&& predicate) {
            std::vector<PerformanceIssue> result;
            std::ranges::copy_if(issues, std::back_inserter(result), predicate);
            return result;
        }

    }  // namespace

    Result<PerformanceChecker, Error> PerformanceChecker::create(const frontend::SourceInput& input,
                                                                 config::CheckerConfig config) {
        if (auto valid = config.validate(); valid.is_err()) {
            return Result<PerformanceChecker, Error>::failure(valid.error());
        }

        auto analyzer = analysis::AstAnalyzer::create(input);
        if (analyzer.is_err()) {
            return Result<PerformanceChecker, Error>::failure(analyzer.error());
        }

        return Result<PerformanceChecker, Error>::success(
            PerformanceChecker(std::move(analyzer).value(), std::move(config)));
    }

    Result<PerformanceChecker, Error> PerformanceChecker::from_source(std::string source,
                                                                      config::CheckerConfig config) {
        return create(frontend::SourceInput::text(std::move(source)), std::move(config));
    }

    Result<PerformanceChecker, Error> PerformanceChecker::from_file(const std::filesystem::path& path,
                                                                    config::CheckerConfig config) {
        return create(frontend::SourceInput::file(path), std::move(config));
    }

    PerformanceChecker::PerformanceChecker(analysis::AstAnalyzer analyzer, config::CheckerConfig config)
        : analyzer_(std::move(analyzer))
        , config_(std::move(config))
        , catalog_(config_.catalog) {
        for (const auto rule : kAllRules) {
            if (!config_.is_enabled(rule)) {
                continue;
            }
            for (auto& issue : run_rule(rule)) {
                if (severity_rank(issue.severity) >= severity_rank(config_.min_severity)) {
                    issues_.push_back(std::move(issue));
                }
            }
        }
        std::ranges::stable_sort(issues_, issue_order);
    }

    std::vector<PerformanceIssue> PerformanceChecker::run_rule(const RuleId rule) const {
        const auto implementation = rules::make_rule(rule);
        const rules::RuleContext context{analyzer_, catalog_, config_};
        return implementation->check(context);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_repeated_queries() const {
        return run_rule(RuleId::RepeatedQuery);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_blocking_io_in_async() const {
        return run_rule(RuleId::BlockingIo);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_inefficient_loops() const {
        return run_rule(RuleId::InefficientLoop);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_memory_loads() const {
        return run_rule(RuleId::MemoryLoad);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_exceptions_in_loops() const {
        return run_rule(RuleId::ExceptionInLoop);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_type_conversions_in_loops() const {
        return run_rule(RuleId::TypeConversionInLoop);
    }

    std::vector<PerformanceIssue> PerformanceChecker::check_global_mutations() const {
        return run_rule(RuleId::GlobalMutation);
    }

    std::vector<PerformanceIssue> PerformanceChecker::issues_by_severity(const Severity severity) const {
        return filter(issues_, [severity](const PerformanceIssue& issue) { return issue.severity == severity; });
    }

    std::vector<PerformanceIssue> PerformanceChecker::issues_by_category(const IssueCategory category) const {
        return filter(issues_, [category](const PerformanceIssue& issue) { return issue.category == category; });
    }

    std::vector<PerformanceIssue> PerformanceChecker::critical_issues() const {
        return issues_by_severity(Severity::Critical);
    }

    IssueSummary PerformanceChecker::summary() const {
        return summarize(issues_);
    }

    IssueSummary summarize(const std::vector<PerformanceIssue>& issues) {
        IssueSummary summary;
        summary.total_issues = issues.size();
        for (const auto severity : kAllSeverities) {
            summary.by_severity[severity] = 0;
        }
        for (const auto category : kAllCategories) {
            summary.by_category[category] = 0;
        }
        for (const auto& issue : issues) {
            ++summary.by_severity[issue.severity];
            ++summary.by_category[issue.category];
        }
        return summary;
    }
}  // namespace ppa::checker
