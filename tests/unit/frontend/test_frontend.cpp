//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/frontend/frontend.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace ppa::frontend
{
    namespace {
        const fs::path kFixtures = PPA_TEST_FIXTURES_DIR;
    }

    TEST(FrontendTest, ParsesSourceText) {
        const auto module = parse(SourceInput::text("x = 1\n"));

        ASSERT_TRUE(module.is_ok());
        EXPECT_EQ(module.value().source, "x = 1\n");
        EXPECT_FALSE(module.value().path.has_value());
        EXPECT_GT(module.value().semantics.scope_count(), 0u);
    }

    TEST(FrontendTest, ParsesFile) {
        const auto module = parse(SourceInput::file(kFixtures / "clean.py"));

        ASSERT_TRUE(module.is_ok()) << module.error().to_string();
        EXPECT_EQ(module.value().path, kFixtures / "clean.py");
    }

    TEST(FrontendTest, NeitherInputIsUsageError) {
        const auto module = parse(SourceInput{});

        ASSERT_TRUE(module.is_err());
        EXPECT_EQ(module.error().code(), ErrorCode::InvalidArgument);
        EXPECT_TRUE(module.error().is_usage_error());
    }

    TEST(FrontendTest, BothInputsIsUsageError) {
        SourceInput input = SourceInput::text("x = 1\n");
        input.file_path = kFixtures / "clean.py";

        const auto module = parse(input);

        ASSERT_TRUE(module.is_err());
        EXPECT_EQ(module.error().code(), ErrorCode::InvalidArgument);
    }

    TEST(FrontendTest, EmptySourceTextIsValid) {
        const auto module = parse(SourceInput::text(""));

        EXPECT_TRUE(module.is_ok());
    }

    TEST(FrontendTest, MissingFileIsNotFound) {
        const auto module = parse(SourceInput::file(kFixtures / "does_not_exist.py"));

        ASSERT_TRUE(module.is_err());
        EXPECT_EQ(module.error().code(), ErrorCode::NotFound);
        EXPECT_TRUE(module.error().is_resource_error());
    }

    TEST(FrontendTest, ParseErrorNamesFileAndPosition) {
        const auto path = kFixtures / "syntax_error.py";
        const auto module = parse(SourceInput::file(path));

        ASSERT_TRUE(module.is_err());
        EXPECT_EQ(module.error().code(), ErrorCode::ParseError);
        ASSERT_TRUE(module.error().has_context());
        EXPECT_EQ(*module.error().context(), "line 1, column 12; " + path.string());
    }
}  // namespace ppa::frontend
