//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/report/json_report.hpp"
#include "ppa/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace ppa::report
{
    namespace fs = std::filesystem;

    namespace {
        const fs::path kFixtures = PPA_TEST_FIXTURES_DIR;

        PerformanceIssue sample_issue() {
            PerformanceIssue issue;
            issue.category = IssueCategory::BlockingIoInAsync;
            issue.severity = Severity::Critical;
            issue.line = 4;
            issue.end_line = 4;
            issue.description = "Blocking I/O call 'open' in async function blocks event loop";
            issue.suggestion = "Replace with aiofiles.open and use await";
            issue.code_snippet = "    f = open(path)";
            issue.function_name = "load";
            return issue;
        }
    }

    TEST(JsonReportTest, IssueShape) {
        const auto j = to_json(sample_issue());

        EXPECT_EQ(j["category"], "blocking-io-in-async");
        EXPECT_EQ(j["severity"], "critical");
        EXPECT_EQ(j["line_number"], 4);
        EXPECT_EQ(j["end_line_number"], 4);
        EXPECT_EQ(j["code_snippet"], "    f = open(path)");
        EXPECT_EQ(j["function_name"], "load");
    }

    TEST(JsonReportTest, AbsentOptionalsAreNull) {
        PerformanceIssue issue = sample_issue();
        issue.code_snippet.reset();
        issue.function_name.reset();

        const auto j = to_json(issue);

        ASSERT_TRUE(j.contains("code_snippet"));
        EXPECT_TRUE(j["code_snippet"].is_null());
        EXPECT_TRUE(j["function_name"].is_null());
    }

    TEST(JsonReportTest, IssueReadsBack) {
        const PerformanceIssue issue = sample_issue();

        const auto parsed = issue_from_json(to_json(issue));

        ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();
        EXPECT_EQ(parsed.value(), issue);
    }

    TEST(JsonReportTest, IssueFromJsonRejectsBadInput) {
        auto j = to_json(sample_issue());
        j["severity"] = "urgent";
        const auto unknown = issue_from_json(j);
        ASSERT_TRUE(unknown.is_err());
        EXPECT_EQ(unknown.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(unknown.error().message(), "Unknown severity");

        auto missing = to_json(sample_issue());
        missing.erase("line_number");
        const auto malformed = issue_from_json(missing);
        ASSERT_TRUE(malformed.is_err());
        EXPECT_EQ(malformed.error().message(), "Malformed issue JSON");
    }

    TEST(JsonReportTest, SummaryHasEveryKey) {
        IssueSummary summary;
        summary.total_issues = 1;
        summary.by_severity[Severity::High] = 1;

        const auto j = to_json(summary);

        EXPECT_EQ(j["total_issues"], 1);
        EXPECT_EQ(j["by_severity"].size(), kAllSeverities.size());
        EXPECT_EQ(j["by_severity"]["high"], 1);
        EXPECT_EQ(j["by_severity"]["low"], 0);
        EXPECT_EQ(j["by_category"].size(), kAllCategories.size());
        EXPECT_EQ(j["by_category"]["memory-load"], 0);
    }

    TEST(JsonReportTest, CheckReport) {
        auto checker = checker::PerformanceChecker::from_file(kFixtures / "memory_load.py");
        ASSERT_TRUE(checker.is_ok()) << checker.error().to_string();

        const auto j = check_report(checker.value(), std::string("memory_load.py"));

        EXPECT_EQ(j["file"], "memory_load.py");
        ASSERT_EQ(j["issues"].size(), 1u);
        EXPECT_EQ(j["issues"][0]["category"], "memory-load");
        EXPECT_EQ(j["summary"]["total_issues"], 1);

        EXPECT_FALSE(check_report(checker.value()).contains("file"));
    }

    TEST(JsonReportTest, StructureShape) {
        auto analyzer = analysis::AstAnalyzer::create(frontend::SourceInput::text(
            "import os\n"
            "class Walker:\n"
            "    def run(self, root):\n"
            "        for entry in os.listdir(root):\n"
            "            print(entry)\n"));
        ASSERT_TRUE(analyzer.is_ok()) << analyzer.error().to_string();

        const auto j = structure_to_json(analyzer.value());

        ASSERT_EQ(j["functions"].size(), 1u);
        EXPECT_EQ(j["functions"][0]["name"], "run");
        EXPECT_EQ(j["functions"][0]["inferred_types"]["self"], "Walker");
        ASSERT_EQ(j["loops"].size(), 1u);
        EXPECT_EQ(j["loops"][0]["kind"], "for");
        EXPECT_EQ(j["loops"][0]["parent_function"], "run");
        EXPECT_EQ(j["imports"][0]["module"], "os");
        EXPECT_EQ(j["calls"][0]["inferred_callable"], "os.listdir");
        EXPECT_EQ(j["classes"][0]["methods"][0], "run");
        EXPECT_EQ(j["max_loop_nesting_depth"], 1);
    }

    TEST(JsonReportTest, LatinOneSnippetIsReplacedNotRejected) {
        auto checker = checker::PerformanceChecker::from_source(
            "# -*- coding: latin-1 -*-\n"
            "for u in users:\n"
            "    Post.objects.filter(name='caf\xE9')\n");
        ASSERT_TRUE(checker.is_ok()) << checker.error().to_string();

        const auto j = check_report(checker.value());
        ASSERT_EQ(j["issues"].size(), 1u);

        std::string text;
        ASSERT_NO_THROW(text = dump_json(j));
        EXPECT_NE(text.find("caf\xEF\xBF\xBD"), std::string::npos);
    }

    class WriteJsonTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = fs::temp_directory_path() / "ppa_json_report_test";
            fs::remove_all(dir_);
        }

        void TearDown() override {
            fs::remove_all(dir_);
        }

        fs::path dir_;
    };

    TEST_F(WriteJsonTest, WritesIndentedDocument) {
        const fs::path path = dir_ / "nested" / "report.json";

        const auto written = write_json(path, nlohmann::json{{"total_issues", 0}});

        ASSERT_TRUE(written.is_ok()) << written.error().to_string();
        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "{\n  \"total_issues\": 0\n}\n");
    }

    TEST_F(WriteJsonTest, WritesInvalidUtf8Snippet) {
        const fs::path path = dir_ / "report.json";

        const auto written = write_json(path, nlohmann::json{{"code_snippet", "name = '\xE9t\xE9'"}});

        ASSERT_TRUE(written.is_ok()) << written.error().to_string();
        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("\xEF\xBF\xBDt\xEF\xBF\xBD"), std::string::npos);
    }
}  // namespace ppa::report
