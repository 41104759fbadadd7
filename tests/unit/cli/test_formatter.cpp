//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/cli/formatter.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace ppa::cli
{
    class FormatterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            colors::set_enabled(false);
        }
    };

    TEST_F(FormatterTest, TableAutoWidths) {
        Table table({{"Name"}, {"Count", 0, true}});
        table.add_row({"alpha", "3"});
        table.add_row({"b", "12"});

        EXPECT_EQ(table.row_count(), 2u);
        EXPECT_EQ(table.render(),
                  "Name   Count\n"
                  "------------\n"
                  "alpha      3\n"
                  "b         12\n");
    }

    TEST_F(FormatterTest, TableWithoutHeadersTruncatesCells) {
        Table table({{"Call", 6}});
        table.set_show_headers(false);
        table.add_row({"requests.get"});

        EXPECT_EQ(table.render(), "req...\n");
    }

    TEST_F(FormatterTest, TableSeparatorAfterRow) {
        Table table({{"A"}, {"B"}});
        table.add_row({"1"});
        table.add_separator();
        table.add_row({"2", "3"});

        EXPECT_EQ(table.render(),
                  "A  B\n"
                  "----\n"
                  "1   \n"
                  "----\n"
                  "2  3\n");
    }

    TEST_F(FormatterTest, FormatPathTruncatesFromFront) {
        EXPECT_EQ(format_path("src/app.py"), "src/app.py");
        EXPECT_EQ(format_path("a/very/long/path/app.py", 12), "...th/app.py");
    }

    TEST_F(FormatterTest, SeverityLabelWithoutColor) {
        EXPECT_EQ(colorize_severity(Severity::Critical), "CRITICAL");
        EXPECT_EQ(colorize_severity(Severity::Low), "LOW");
    }

    TEST_F(FormatterTest, PrintIssues) {
        PerformanceIssue issue;
        issue.category = IssueCategory::MemoryLoad;
        issue.severity = Severity::Medium;
        issue.line = 6;
        issue.end_line = 6;
        issue.description = "Loading entire JSON file with json.load() loads all data into memory";
        issue.suggestion = "Use ijson";
        issue.code_snippet = "        return json.load(handle)";
        issue.function_name = "load_catalog";

        std::ostringstream out;
        IssuePrinter(out).print_issues({issue}, std::string("memory_load.py"));

        EXPECT_EQ(out.str(),
                  "memory_load.py:6: MEDIUM [memory-load] in load_catalog()\n"
                  "  Loading entire JSON file with json.load() loads all data into memory\n"
                  "  suggestion: Use ijson\n"
                  "    |         return json.load(handle)\n"
                  "\n");
    }

    TEST_F(FormatterTest, PrintNoIssues) {
        std::ostringstream out;
        IssuePrinter(out).print_issues({}, std::string("clean.py"));

        EXPECT_EQ(out.str(), "clean.py: no performance issues found\n");
    }

    TEST_F(FormatterTest, PrintSummaryListsNonZeroCategories) {
        IssueSummary summary;
        summary.total_issues = 2;
        summary.by_severity[Severity::Critical] = 2;
        summary.by_category[IssueCategory::BlockingIoInAsync] = 2;
        summary.by_category[IssueCategory::MemoryLoad] = 0;

        std::ostringstream out;
        IssuePrinter(out).print_summary(summary);

        const std::string text = out.str();
        EXPECT_NE(text.find("Total issues: 2"), std::string::npos);
        EXPECT_NE(text.find("blocking-io-in-async"), std::string::npos);
        EXPECT_EQ(text.find("memory-load"), std::string::npos);
    }

    TEST_F(FormatterTest, PrintStructure) {
        auto analyzer = analysis::AstAnalyzer::create(frontend::SourceInput::text(
            "def scan(rows):\n"
            "    for r in rows:\n"
            "        print(r)\n"));
        ASSERT_TRUE(analyzer.is_ok());

        std::ostringstream out;
        IssuePrinter(out).print_structure(analyzer.value());

        const std::string text = out.str();
        EXPECT_NE(text.find("Functions"), std::string::npos);
        EXPECT_NE(text.find("scan"), std::string::npos);
        EXPECT_NE(text.find("builtins.print"), std::string::npos);
        EXPECT_NE(text.find("Max loop nesting depth: 1"), std::string::npos);
    }
}  // namespace ppa::cli
