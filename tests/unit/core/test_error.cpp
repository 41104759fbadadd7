//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace ppa
{
    TEST(ErrorTest, BasicConstruction) {
        const Error err(ErrorCode::NotFound, "file missing");

        EXPECT_EQ(err.code(), ErrorCode::NotFound);
        EXPECT_EQ(err.message(), "file missing");
        EXPECT_FALSE(err.has_context());
    }

    TEST(ErrorTest, SyntaxErrorCarriesPositionOnly) {
        const auto err = Error::syntax_error("invalid syntax", 3, 9);

        EXPECT_EQ(err.code(), ErrorCode::ParseError);
        ASSERT_TRUE(err.has_context());
        EXPECT_EQ(*err.context(), "line 3, column 9");
        EXPECT_EQ(err.to_string(), "[ParseError] invalid syntax (context: line 3, column 9)");
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto base = Error::config_error("Invalid configuration", "rules.foo");
        const auto extended = base.with_context("ppa.toml");

        EXPECT_EQ(*extended.context(), "rules.foo; ppa.toml");
        EXPECT_EQ(*base.context(), "rules.foo");
    }

    TEST(ErrorTest, WithContextOnBareError) {
        const auto err = Error::internal_error("broken").with_context("walker");

        EXPECT_EQ(*err.context(), "walker");
    }

    TEST(ErrorTest, Taxonomy) {
        EXPECT_TRUE(Error::invalid_argument("both given").is_usage_error());
        EXPECT_FALSE(Error::invalid_argument("both given").is_resource_error());

        EXPECT_TRUE(Error::not_found("missing", "a.py").is_resource_error());
        EXPECT_TRUE(Error::io_error("unreadable", "a.py").is_resource_error());

        EXPECT_FALSE(Error::parse_error("bad").is_usage_error());
        EXPECT_FALSE(Error::parse_error("bad").is_resource_error());
    }

    TEST(ErrorTest, Equality) {
        EXPECT_EQ(Error::parse_error("x", "ctx"), Error::parse_error("x", "ctx"));
        EXPECT_NE(Error::parse_error("x", "ctx"), Error::parse_error("x"));
        EXPECT_NE(Error::parse_error("x"), Error::config_error("x"));
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream ss;
        ss << Error::not_found("File not found", "app.py");

        EXPECT_EQ(ss.str(), "[NotFound] File not found (context: app.py)");
    }

    TEST(ErrorCodeTest, ToString) {
        EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidArgument), "InvalidArgument");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ConfigError), "ConfigError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::IoError), "IoError");
    }
}  // namespace ppa
