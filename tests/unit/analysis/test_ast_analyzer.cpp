//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/analysis/ast_analyzer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace ppa::analysis
{
    namespace {
        namespace fs = std::filesystem;

        const fs::path kFixtures = PPA_TEST_FIXTURES_DIR;

        AstAnalyzer analyzer_for(const std::string& source) {
            auto created = AstAnalyzer::create(frontend::SourceInput::text(source));
            EXPECT_TRUE(created.is_ok()) << (created.is_err() ? created.error().to_string() : "");
            return std::move(created).value();
        }
    }

    TEST(AstAnalyzerTest, CreateFromFile) {
        auto created = AstAnalyzer::create(frontend::SourceInput::file(kFixtures / "orm_in_loop.py"));

        ASSERT_TRUE(created.is_ok()) << created.error().to_string();
        const AstAnalyzer& analyzer = created.value();
        EXPECT_EQ(analyzer.module().path, kFixtures / "orm_in_loop.py");
        EXPECT_FALSE(analyzer.imports().empty());
        EXPECT_FALSE(analyzer.loops().empty());
    }

    TEST(AstAnalyzerTest, CreatePropagatesParseError) {
        const auto created = AstAnalyzer::create(frontend::SourceInput::text("def broken(:\n"));

        ASSERT_TRUE(created.is_err());
        EXPECT_EQ(created.error().code(), ErrorCode::ParseError);
    }

    TEST(AstAnalyzerTest, CreateRejectsMissingInput) {
        const auto created = AstAnalyzer::create(frontend::SourceInput{});

        ASSERT_TRUE(created.is_err());
        EXPECT_EQ(created.error().code(), ErrorCode::InvalidArgument);
    }

    TEST(AstAnalyzerTest, SourceSegmentClampsToFile) {
        const AstAnalyzer analyzer = analyzer_for("a = 1\nb = 2\nc = 3\n");

        EXPECT_EQ(analyzer.line_count(), 3u);
        EXPECT_EQ(analyzer.source_segment(2, 2), "b = 2");
        EXPECT_EQ(analyzer.source_segment(2, 10), "b = 2\nc = 3");
        EXPECT_EQ(analyzer.source_segment(0, 1), "a = 1");
        EXPECT_EQ(analyzer.source_segment(5, 7), "");
        EXPECT_EQ(analyzer.source_segment(3, 2), "");
    }

    TEST(AstAnalyzerTest, AsyncFunctionsAndRanges) {
        const AstAnalyzer analyzer = analyzer_for(
            "async def fetch():\n"
            "    pass\n"
            "def parse():\n"
            "    def inner():\n"
            "        pass\n"
            "    return inner\n");

        const auto async_fns = analyzer.async_functions();
        ASSERT_EQ(async_fns.size(), 1u);
        EXPECT_EQ(async_fns[0].name, "fetch");

        const auto in_range = analyzer.functions_in_range(3, 6);
        ASSERT_EQ(in_range.size(), 2u);
        EXPECT_EQ(in_range[0].name, "parse");
        EXPECT_EQ(in_range[1].name, "inner");

        EXPECT_EQ(analyzer.functions_in_range(4, 5).size(), 1u);
        // Only the def line has to fall inside the range.
        EXPECT_EQ(analyzer.functions_in_range(3, 4).size(), 2u);
        EXPECT_TRUE(analyzer.functions_in_range(7, 9).empty());
    }

    TEST(AstAnalyzerTest, LoopsInFunctionAndNestingDepth) {
        const AstAnalyzer analyzer = analyzer_for(
            "def grid(rows):\n"
            "    for r in rows:\n"
            "        for c in r:\n"
            "            for v in c:\n"
            "                pass\n"
            "def flat(xs):\n"
            "    while xs:\n"
            "        xs.pop()\n");

        EXPECT_EQ(analyzer.loops_in_function("grid").size(), 3u);
        EXPECT_EQ(analyzer.loops_in_function("flat").size(), 1u);
        EXPECT_TRUE(analyzer.loops_in_function("missing").empty());
        EXPECT_EQ(analyzer.max_loop_nesting_depth(), 3u);
    }

    TEST(AstAnalyzerTest, NoLoopsMeansZeroDepth) {
        const AstAnalyzer analyzer = analyzer_for("x = 1\n");

        EXPECT_EQ(analyzer.max_loop_nesting_depth(), 0u);
    }

    TEST(AstAnalyzerTest, BlockingCallsInAsyncHeuristic) {
        EXPECT_TRUE(analyzer_for(
            "import time\n"
            "async def tick():\n"
            "    time.sleep(1)\n").has_blocking_calls_in_async());

        EXPECT_FALSE(analyzer_for(
            "import asyncio\n"
            "async def tick():\n"
            "    await asyncio.sleep(1)\n").has_blocking_calls_in_async());

        EXPECT_FALSE(analyzer_for(
            "import time\n"
            "def tick():\n"
            "    time.sleep(1)\n").has_blocking_calls_in_async());
    }
}  // namespace ppa::analysis
