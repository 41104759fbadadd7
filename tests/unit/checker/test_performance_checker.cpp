//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/checker/performance_checker.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace ppa::checker
{
    namespace {
        const std::filesystem::path kFixtures = PPA_TEST_FIXTURES_DIR;

        PerformanceChecker checker_for(const std::filesystem::path& path, config::CheckerConfig config = {}) {
            auto created = PerformanceChecker::from_file(path, std::move(config));
            EXPECT_TRUE(created.is_ok()) << (created.is_err() ? created.error().to_string() : "");
            return std::move(created).value();
        }

        std::vector<std::pair<Severity, std::size_t>> severity_and_line(const std::vector<PerformanceIssue>& issues) {
            std::vector<std::pair<Severity, std::size_t>> result;
            for (const auto& issue : issues) {
                result.emplace_back(issue.severity, issue.line);
            }
            return result;
        }
    }

    TEST(PerformanceCheckerTest, BlockingOpenInAsyncFunction) {
        const auto checker = checker_for(kFixtures / "async_blocking.py");
        const auto& issues = checker.check_all();

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].category, IssueCategory::BlockingIoInAsync);
        EXPECT_EQ(issues[0].severity, Severity::Critical);
        EXPECT_EQ(issues[0].line, 5u);
        EXPECT_EQ(issues[0].function_name, "load_settings");
        EXPECT_EQ(checker.critical_issues().size(), 1u);
    }

    TEST(PerformanceCheckerTest, OrmQueryInLoop) {
        const auto checker = checker_for(kFixtures / "orm_in_loop.py");
        const auto& issues = checker.check_all();

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].category, IssueCategory::RepeatedQueryInLoop);
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].line, 7u);
    }

    TEST(PerformanceCheckerTest, StringConcatenationInLoop) {
        const auto checker = checker_for(kFixtures / "string_concat.py");
        const auto& issues = checker.check_all();

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].category, IssueCategory::InefficientLoop);
        EXPECT_EQ(issues[0].severity, Severity::Medium);
        EXPECT_EQ(issues[0].line, 4u);
    }

    TEST(PerformanceCheckerTest, WholeFileJsonLoad) {
        const auto checker = checker_for(kFixtures / "memory_load.py");
        const auto& issues = checker.check_all();

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].category, IssueCategory::MemoryLoad);
        EXPECT_EQ(issues[0].severity, Severity::Medium);
        EXPECT_EQ(issues[0].line, 6u);
    }

    TEST(PerformanceCheckerTest, CleanFileHasNoIssues) {
        const auto checker = checker_for(kFixtures / "clean.py");

        EXPECT_FALSE(checker.has_issues());
        const IssueSummary summary = checker.summary();
        EXPECT_EQ(summary.total_issues, 0u);
        EXPECT_EQ(summary.by_severity.size(), kAllSeverities.size());
        EXPECT_EQ(summary.by_category.size(), kAllCategories.size());
    }

    TEST(PerformanceCheckerTest, CheckAllOrdersBySeverityThenLine) {
        const auto checker = checker_for(kFixtures / "mixed.py");

        const std::vector<std::pair<Severity, std::size_t>> expected = {
            {Severity::Critical, 21},
            {Severity::Critical, 22},
            {Severity::High, 12},
            {Severity::Medium, 29}
        };
        EXPECT_EQ(severity_and_line(checker.check_all()), expected);
    }

    TEST(PerformanceCheckerTest, ConfigurationEnablesOptionalRules) {
        auto config = config::load_config_file(kFixtures / "ppa.toml");
        ASSERT_TRUE(config.is_ok()) << config.error().to_string();

        const auto checker = checker_for(kFixtures / "mixed.py", config.value());

        const std::vector<std::pair<Severity, std::size_t>> expected = {
            {Severity::Critical, 21},
            {Severity::Critical, 22},
            {Severity::High, 12},
            {Severity::Medium, 10},
            {Severity::Medium, 13},
            {Severity::Medium, 29}
        };
        EXPECT_EQ(severity_and_line(checker.check_all()), expected);
        EXPECT_EQ(checker.issues_by_category(IssueCategory::InefficientLoop).size(), 1u);
        EXPECT_EQ(checker.issues_by_category(IssueCategory::GlobalMutation).size(), 1u);
        EXPECT_EQ(checker.issues_by_category(IssueCategory::ExceptionInLoop).size(), 1u);
    }

    TEST(PerformanceCheckerTest, SummaryCountsEveryKey) {
        const auto checker = checker_for(kFixtures / "mixed.py");
        const IssueSummary summary = checker.summary();

        EXPECT_EQ(summary.total_issues, 4u);
        EXPECT_EQ(summary.by_severity.at(Severity::Critical), 2u);
        EXPECT_EQ(summary.by_severity.at(Severity::High), 1u);
        EXPECT_EQ(summary.by_severity.at(Severity::Medium), 1u);
        EXPECT_EQ(summary.by_severity.at(Severity::Low), 0u);
        EXPECT_EQ(summary.by_category.at(IssueCategory::BlockingIoInAsync), 2u);
        EXPECT_EQ(summary.by_category.at(IssueCategory::MemoryLoad), 0u);
        EXPECT_EQ(summary, summarize(checker.check_all()));
    }

    TEST(PerformanceCheckerTest, MinimumSeverityFiltersCheckAll) {
        config::CheckerConfig config;
        config.min_severity = Severity::High;
        const auto checker = checker_for(kFixtures / "mixed.py", config);

        EXPECT_EQ(checker.check_all().size(), 3u);
        EXPECT_TRUE(checker.issues_by_severity(Severity::Medium).empty());
        // Single-rule queries are not filtered.
        EXPECT_EQ(checker.check_inefficient_loops().size(), 1u);
    }

    TEST(PerformanceCheckerTest, DisabledRuleStillRunsOnDemand) {
        config::CheckerConfig config;
        config.set_enabled(RuleId::BlockingIo, false);
        const auto checker = checker_for(kFixtures / "mixed.py", config);

        EXPECT_TRUE(checker.issues_by_category(IssueCategory::BlockingIoInAsync).empty());
        EXPECT_EQ(checker.check_blocking_io_in_async().size(), 2u);
        EXPECT_EQ(checker.check_type_conversions_in_loops().size(), 1u);
        EXPECT_EQ(checker.run_rule(RuleId::GlobalMutation).size(), 1u);
    }

    TEST(PerformanceCheckerTest, FromSource) {
        auto checker = PerformanceChecker::from_source(
            "import time\nasync def f():\n    time.sleep(1)\n");

        ASSERT_TRUE(checker.is_ok()) << checker.error().to_string();
        ASSERT_EQ(checker.value().check_all().size(), 1u);
        EXPECT_EQ(checker.value().check_all()[0].line, 3u);
        EXPECT_EQ(checker.value().check_memory_loads().size(), 0u);
        EXPECT_EQ(checker.value().check_repeated_queries().size(), 0u);
        EXPECT_EQ(checker.value().check_exceptions_in_loops().size(), 0u);
    }

    TEST(PerformanceCheckerTest, SyntaxErrorIsParseError) {
        const auto checker = PerformanceChecker::from_file(kFixtures / "syntax_error.py");

        ASSERT_TRUE(checker.is_err());
        EXPECT_EQ(checker.error().code(), ErrorCode::ParseError);
    }

    TEST(PerformanceCheckerTest, OverlyDeepExpressionIsParseError) {
        std::string source = "value = data";
        for (int i = 0; i < 20000; ++i) {
            source += ".child";
        }

        const auto checker = PerformanceChecker::from_source(source + "\n");

        ASSERT_TRUE(checker.is_err());
        EXPECT_EQ(checker.error().code(), ErrorCode::ParseError);
    }

    TEST(PerformanceCheckerTest, MissingFileIsNotFound) {
        const auto checker = PerformanceChecker::from_file(kFixtures / "nope.py");

        ASSERT_TRUE(checker.is_err());
        EXPECT_EQ(checker.error().code(), ErrorCode::NotFound);
    }

    TEST(PerformanceCheckerTest, AmbiguousInputIsUsageError) {
        frontend::SourceInput input = frontend::SourceInput::text("x = 1\n");
        input.file_path = kFixtures / "clean.py";

        const auto checker = PerformanceChecker::create(input);

        ASSERT_TRUE(checker.is_err());
        EXPECT_TRUE(checker.error().is_usage_error());
    }

    TEST(PerformanceCheckerTest, InvalidConfigurationRejected) {
        config::CheckerConfig config;
        config.nested_loop_depth = -1;

        const auto checker = PerformanceChecker::from_source("x = 1\n", config);

        ASSERT_TRUE(checker.is_err());
        EXPECT_EQ(checker.error().code(), ErrorCode::ConfigError);
    }
}  // namespace ppa::checker
