//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/frontend/parser.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ppa::frontend
{
    class ParserTest : public ::testing::Test {
    protected:
        const SyntaxTree& parse(const std::string& source) {
            auto result = parse_source(source);
            EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().to_string() : "");
            if (result.is_ok()) {
                tree_ = std::move(result).value();
            }
            return tree_;
        }

        [[nodiscard]] NodeId statement(const std::size_t index) const {
            const auto body = tree_.all(tree_.root(), Role::Body);
            return index < body.size() ? body[index] : kNoNode;
        }

        [[nodiscard]] std::string expression_of(const NodeId stmt) const {
            return unparse(tree_, tree_.first(stmt, Role::Value));
        }

        SyntaxTree tree_;
    };

    TEST_F(ParserTest, ModuleBody) {
        const auto& tree = parse("import os\nx = 1\nprint(x)\n");

        EXPECT_EQ(tree.node(tree.root()).kind, NodeKind::Module);
        EXPECT_EQ(tree.node(statement(0)).kind, NodeKind::Import);
        EXPECT_EQ(tree.node(statement(1)).kind, NodeKind::Assign);
        EXPECT_EQ(tree.node(statement(2)).kind, NodeKind::ExprStmt);
    }

    TEST_F(ParserTest, AsyncFunctionWithDecoratorsAndParameters) {
        const auto& tree = parse(
            "@app.route('/x')\n"
            "async def handler(request, *args, limit: int = 10, **kwargs) -> dict:\n"
            "    return {}\n");

        const NodeId fn = statement(0);
        const Node& node = tree.node(fn);
        EXPECT_EQ(node.kind, NodeKind::FunctionDef);
        EXPECT_TRUE(node.is_async);
        EXPECT_EQ(node.name, "handler");
        EXPECT_EQ(node.line, 2u);
        EXPECT_EQ(node.end_line, 3u);

        const auto decorators = tree.all(fn, Role::Decorator);
        ASSERT_EQ(decorators.size(), 1u);
        EXPECT_EQ(unparse(tree, decorators[0]), "app.route('/x')");

        const auto params = tree.all(fn, Role::Parameter);
        ASSERT_EQ(params.size(), 4u);
        EXPECT_EQ(tree.node(params[1]).text, "*");
        EXPECT_EQ(tree.node(params[2]).name, "limit");
        EXPECT_NE(tree.first(params[2], Role::Annotation), kNoNode);
        EXPECT_NE(tree.first(params[2], Role::Default), kNoNode);
        EXPECT_EQ(tree.node(params[3]).text, "**");

        EXPECT_EQ(unparse(tree, tree.first(fn, Role::Returns)), "dict");
    }

    TEST_F(ParserTest, ForLoopParts) {
        const auto& tree = parse("for i, item in enumerate(items):\n    total += item\nelse:\n    pass\n");

        const NodeId loop = statement(0);
        EXPECT_EQ(tree.node(loop).kind, NodeKind::For);
        EXPECT_EQ(unparse(tree, tree.first(loop, Role::Iter)), "enumerate(items)");
        EXPECT_EQ(tree.all(loop, Role::Body).size(), 1u);
        EXPECT_EQ(tree.all(loop, Role::OrElse).size(), 1u);

        const NodeId aug = tree.first(loop, Role::Body);
        EXPECT_EQ(tree.node(aug).kind, NodeKind::AugAssign);
        EXPECT_EQ(tree.node(aug).text, "+=");
    }

    TEST_F(ParserTest, ComprehensionGenerators) {
        const auto& tree = parse("pairs = [(a, b) for a in xs if a for b in ys]\n");

        const NodeId comp = tree.first(statement(0), Role::Value);
        ASSERT_EQ(tree.node(comp).kind, NodeKind::ListComp);

        const auto generators = tree.all(comp, Role::Generator);
        ASSERT_EQ(generators.size(), 2u);
        EXPECT_EQ(tree.node(generators[0]).kind, NodeKind::Comprehension);
        EXPECT_EQ(tree.all(generators[0], Role::Test).size(), 1u);
    }

    TEST_F(ParserTest, UnparseNormalisesCalls) {
        parse("x = User.objects.filter( id = 3 )\ny = session.query(User).all()\nz = (a+b)*c\n");

        EXPECT_EQ(expression_of(statement(0)), "User.objects.filter(id=3)");
        EXPECT_EQ(expression_of(statement(1)), "session.query(User).all()");
        EXPECT_EQ(expression_of(statement(2)), "(a + b) * c");
    }

    TEST_F(ParserTest, ImportForms) {
        const auto& tree = parse("import numpy as np, os.path\nfrom ..pkg import a as b, c\n");

        const auto aliases = tree.all(statement(0), Role::Alias);
        ASSERT_EQ(aliases.size(), 2u);
        EXPECT_EQ(tree.node(aliases[0]).name, "numpy");
        EXPECT_EQ(tree.node(aliases[0]).text, "np");
        EXPECT_EQ(tree.node(aliases[1]).name, "os.path");

        const Node& from = tree.node(statement(1));
        EXPECT_EQ(from.kind, NodeKind::ImportFrom);
        EXPECT_EQ(from.text, "..pkg");
        EXPECT_EQ(tree.all(statement(1), Role::Alias).size(), 2u);
    }

    TEST_F(ParserTest, TryHandlers) {
        const auto& tree = parse(
            "try:\n"
            "    risky()\n"
            "except (ValueError, KeyError) as exc:\n"
            "    log(exc)\n"
            "except Exception:\n"
            "    pass\n"
            "finally:\n"
            "    done()\n");

        const NodeId node = statement(0);
        EXPECT_EQ(tree.node(node).kind, NodeKind::Try);
        const auto handlers = tree.all(node, Role::Handler);
        ASSERT_EQ(handlers.size(), 2u);
        EXPECT_EQ(tree.node(handlers[0]).name, "exc");
        EXPECT_EQ(tree.all(node, Role::FinalBody).size(), 1u);
        EXPECT_EQ(tree.node(node).end_line, 8u);
    }

    TEST_F(ParserTest, ModernSyntax) {
        const auto& tree = parse(
            "async def main():\n"
            "    async with lock:\n"
            "        async for row in cursor:\n"
            "            if (n := len(row)) > 3:\n"
            "                yield n\n"
            "match command:\n"
            "    case [x, y] if x > y:\n"
            "        pass\n"
            "    case _:\n"
            "        pass\n"
            "x = f\"{value!r:>{width}}\"\n");

        EXPECT_EQ(tree.node(statement(1)).kind, NodeKind::Match);
        EXPECT_EQ(tree.node(tree.first(statement(2), Role::Value)).kind, NodeKind::JoinedStr);
    }

    TEST_F(ParserTest, SyntaxErrorReportsPosition) {
        const auto result = parse_source("def broken(:\n    pass\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        ASSERT_TRUE(result.error().has_context());
        EXPECT_EQ(*result.error().context(), "line 1, column 12");
    }

    TEST_F(ParserTest, MissingBlockIsError) {
        const auto result = parse_source("for x in y:\nprint(x)\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST_F(ParserTest, LongOperatorChainIsTooComplex) {
        std::string source = "x = a";
        for (int i = 0; i < 20000; ++i) {
            source += " + a";
        }

        const auto result = parse_source(source + "\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().message(), "expression too complex");
    }

    TEST_F(ParserTest, LongTrailerChainsAreTooComplex) {
        std::string attributes = "a";
        std::string calls = "f";
        std::string negations;
        for (int i = 0; i < 20000; ++i) {
            attributes += ".b";
            calls += "()";
            negations += "not ";
        }

        for (const auto& source : {attributes + "()\n", calls + "\n", negations + "x\n"}) {
            const auto result = parse_source(source);
            ASSERT_TRUE(result.is_err());
            EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        }
    }

    TEST_F(ParserTest, ModeratelyLongChainParses) {
        std::string source = "total = a";
        for (int i = 0; i < 500; ++i) {
            source += " + a";
        }

        const auto& tree = parse(source + "\n");

        EXPECT_EQ(tree.node(statement(0)).kind, NodeKind::Assign);
    }

    TEST_F(ParserTest, EmptyModule) {
        const auto& tree = parse("");

        EXPECT_EQ(tree.node(tree.root()).kind, NodeKind::Module);
        EXPECT_TRUE(tree.all(tree.root(), Role::Body).empty());
    }
}  // namespace ppa::frontend
