//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/analysis/extractors.hpp"
#include "ppa/frontend/frontend.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ppa::analysis
{
    class ExtractorsTest : public ::testing::Test {
    protected:
        const frontend::ParsedModule& load(const std::string& source) {
            auto parsed = frontend::parse(frontend::SourceInput::text(source));
            EXPECT_TRUE(parsed.is_ok()) << (parsed.is_err() ? parsed.error().to_string() : "");
            if (parsed.is_ok()) {
                module_ = std::move(parsed).value();
            }
            return module_;
        }

        frontend::ParsedModule module_;
    };

    TEST_F(ExtractorsTest, FunctionsWithSignatureDetails) {
        const auto functions = extract_functions(load(
            "import functools\n"
            "@app.route('/items')\n"
            "@functools.lru_cache\n"
            "async def handler(request, limit: int = 10, *rest) -> dict:\n"
            "    \"\"\"Serve items.\"\"\"\n"
            "    return {}\n"
            "def helper():\n"
            "    pass\n"));

        ASSERT_EQ(functions.size(), 2u);

        const FunctionInfo& handler = functions[0];
        EXPECT_EQ(handler.name, "handler");
        EXPECT_EQ(handler.line, 4u);
        EXPECT_EQ(handler.end_line, 6u);
        EXPECT_TRUE(handler.is_async);
        EXPECT_EQ(handler.decorators, (std::vector<std::string>{"app.route", "functools.lru_cache"}));
        ASSERT_EQ(handler.parameters.size(), 3u);
        EXPECT_EQ(handler.parameters[0], "request");
        EXPECT_EQ(handler.parameters[1], "limit");
        EXPECT_EQ(handler.parameters[2], "rest");
        EXPECT_EQ(handler.inferred_types.at("limit"), "int");
        EXPECT_EQ(handler.return_annotation, "dict");
        EXPECT_EQ(handler.docstring, "Serve items.");

        const FunctionInfo& helper = functions[1];
        EXPECT_FALSE(helper.is_async);
        EXPECT_TRUE(helper.parameters.empty());
        EXPECT_FALSE(helper.return_annotation.has_value());
        EXPECT_FALSE(helper.docstring.has_value());
    }

    TEST_F(ExtractorsTest, FunctionLocalsGetInferredTypes) {
        const auto functions = extract_functions(load(
            "def read_all(path):\n"
            "    handle = open(path)\n"
            "    return handle.readline()\n"));

        ASSERT_EQ(functions.size(), 1u);
        EXPECT_EQ(functions[0].inferred_types.at("handle"), "_io.TextIOWrapper");
    }

    TEST_F(ExtractorsTest, NestedLoopsTrackDepthAndParent) {
        const auto loops = extract_loops(load(
            "def scan(grid):\n"
            "    for row in grid:\n"
            "        while row:\n"
            "            row.pop()\n"
            "    for cell in grid:\n"
            "        pass\n"));

        ASSERT_EQ(loops.size(), 3u);

        EXPECT_EQ(loops[0].kind, LoopKind::For);
        EXPECT_EQ(loops[0].line, 2u);
        EXPECT_EQ(loops[0].end_line, 4u);
        EXPECT_EQ(loops[0].nesting_level, 0u);
        EXPECT_EQ(loops[0].parent_function, "scan");
        EXPECT_FALSE(loops[0].parent_loop.has_value());

        EXPECT_EQ(loops[1].kind, LoopKind::While);
        EXPECT_EQ(loops[1].nesting_level, 1u);
        EXPECT_EQ(loops[1].parent_loop, 0u);

        EXPECT_EQ(loops[2].nesting_level, 0u);
        EXPECT_FALSE(loops[2].parent_loop.has_value());
    }

    TEST_F(ExtractorsTest, FunctionBodyStartsOutsideLoops) {
        const auto loops = extract_loops(load(
            "for item in items:\n"
            "    def inner():\n"
            "        for x in item:\n"
            "            pass\n"));

        ASSERT_EQ(loops.size(), 2u);
        EXPECT_EQ(loops[1].nesting_level, 0u);
        EXPECT_EQ(loops[1].parent_function, "inner");
        EXPECT_FALSE(loops[1].parent_loop.has_value());
    }

    TEST_F(ExtractorsTest, ComprehensionClausesAreLoops) {
        const auto loops = extract_loops(load(
            "async def collect(rows):\n"
            "    return [c for r in rows for c in r]\n"));

        ASSERT_EQ(loops.size(), 2u);
        EXPECT_TRUE(loops[0].is_comprehension);
        EXPECT_TRUE(loops[0].is_in_async_function);
        EXPECT_EQ(loops[0].nesting_level, 0u);
        EXPECT_EQ(loops[1].nesting_level, 1u);
        EXPECT_EQ(loops[1].parent_loop, 0u);
    }

    TEST_F(ExtractorsTest, ImportsAndFromImports) {
        const auto imports = extract_imports(load(
            "import numpy as np, os\n"
            "from django.db import models as m, connection\n"
            "from .local import thing\n"));

        ASSERT_EQ(imports.size(), 4u);

        EXPECT_EQ(imports[0].module, "numpy");
        EXPECT_EQ(imports[0].aliases.at("numpy"), "np");
        EXPECT_FALSE(imports[0].is_from_import);
        EXPECT_EQ(imports[0].resolved_module, "numpy");

        EXPECT_EQ(imports[1].module, "os");
        EXPECT_TRUE(imports[1].aliases.empty());

        EXPECT_EQ(imports[2].module, "django.db");
        EXPECT_TRUE(imports[2].is_from_import);
        EXPECT_EQ(imports[2].names, (std::vector<std::string>{"models", "connection"}));
        EXPECT_EQ(imports[2].aliases.at("models"), "m");
        EXPECT_EQ(imports[2].line, 2u);

        EXPECT_EQ(imports[3].module, ".local");
        EXPECT_FALSE(imports[3].resolved_module.has_value());
    }

    TEST_F(ExtractorsTest, CallsCarryContextAndResolution) {
        const auto calls = extract_calls(load(
            "import json\n"
            "def load(paths):\n"
            "    for p in paths:\n"
            "        json.loads(p)\n"
            "    key = lambda v: str(v)\n"
            "    return factory()()\n"));

        ASSERT_GE(calls.size(), 3u);

        EXPECT_EQ(calls[0].function_name, "json.loads");
        EXPECT_EQ(calls[0].line, 4u);
        EXPECT_TRUE(calls[0].is_in_loop);
        EXPECT_EQ(calls[0].parent_function, "load");
        EXPECT_EQ(calls[0].resolved_name, "json.loads");

        EXPECT_EQ(calls[1].function_name, "str");
        EXPECT_EQ(calls[1].parent_function, "<lambda>");
        EXPECT_FALSE(calls[1].is_in_loop);
        EXPECT_EQ(calls[1].resolved_name, "builtins.str");

        // factory()() has a call as its callee and is not recorded itself.
        ASSERT_EQ(calls.size(), 3u);
        EXPECT_EQ(calls[2].function_name, "factory");
        EXPECT_FALSE(calls[2].resolved_name.has_value());
    }

    TEST_F(ExtractorsTest, DecoratorAndDefaultCallsBelongToEnclosingScope) {
        const auto calls = extract_calls(load(
            "import time\n"
            "@deco(time.sleep(1))\n"
            "async def handler(path=open('a')):\n"
            "    pass\n"
            "async def outer(items):\n"
            "    for item in items:\n"
            "        @register(item.name())\n"
            "        def inner(limit=len(items)):\n"
            "            return parse(limit)\n"));

        ASSERT_EQ(calls.size(), 7u);

        for (std::size_t i = 0; i < 3; ++i) {
            SCOPED_TRACE(calls[i].function_name);
            EXPECT_FALSE(calls[i].parent_function.has_value());
            EXPECT_FALSE(calls[i].is_in_async_function);
            EXPECT_FALSE(calls[i].is_in_loop);
        }
        EXPECT_EQ(calls[0].function_name, "deco");
        EXPECT_EQ(calls[1].function_name, "time.sleep");
        EXPECT_EQ(calls[2].function_name, "open");
        EXPECT_EQ(calls[2].line, 3u);

        for (std::size_t i = 3; i < 6; ++i) {
            SCOPED_TRACE(calls[i].function_name);
            EXPECT_EQ(calls[i].parent_function, "outer");
            EXPECT_TRUE(calls[i].is_in_async_function);
            EXPECT_TRUE(calls[i].is_in_loop);
        }
        EXPECT_EQ(calls[5].function_name, "len");

        EXPECT_EQ(calls[6].function_name, "parse");
        EXPECT_EQ(calls[6].parent_function, "inner");
        EXPECT_FALSE(calls[6].is_in_async_function);
        EXPECT_FALSE(calls[6].is_in_loop);
    }

    TEST_F(ExtractorsTest, ClassesWithBasesAndMethods) {
        const auto classes = extract_classes(load(
            "@dataclass\n"
            "class Repo(Base, metaclass=Meta):\n"
            "    \"\"\"Data access.\"\"\"\n"
            "    def load(self):\n"
            "        pass\n"
            "    async def fetch(self):\n"
            "        pass\n"));

        ASSERT_EQ(classes.size(), 1u);
        EXPECT_EQ(classes[0].name, "Repo");
        EXPECT_EQ(classes[0].line, 2u);
        EXPECT_EQ(classes[0].bases, (std::vector<std::string>{"Base"}));
        EXPECT_EQ(classes[0].methods, (std::vector<std::string>{"load", "fetch"}));
        EXPECT_EQ(classes[0].decorators, (std::vector<std::string>{"dataclass"}));
        EXPECT_EQ(classes[0].docstring, "Data access.");
    }

    TEST_F(ExtractorsTest, StringConcatenationOnOuterVariable) {
        const auto assignments = extract_augmented_assignments(load(
            "def render(rows):\n"
            "    html = ''\n"
            "    for row in rows:\n"
            "        html += '<td>' + row + '</td>'\n"
            "    return html\n"));

        ASSERT_EQ(assignments.size(), 1u);
        const AugAssignInfo& info = assignments[0];
        EXPECT_EQ(info.target, "html");
        EXPECT_EQ(info.op, "+=");
        EXPECT_EQ(info.line, 4u);
        EXPECT_EQ(info.loop_nesting, 1u);
        EXPECT_EQ(info.loop_line, 3u);
        EXPECT_TRUE(info.is_string_operation);
        EXPECT_TRUE(info.target_bound_outside_loop);
    }

    TEST_F(ExtractorsTest, AccumulatorBoundInsideLoop) {
        const auto assignments = extract_augmented_assignments(load(
            "for row in rows:\n"
            "    line = ''\n"
            "    line += row\n"));

        ASSERT_EQ(assignments.size(), 1u);
        EXPECT_TRUE(assignments[0].is_string_operation);
        EXPECT_FALSE(assignments[0].target_bound_outside_loop);
    }

    TEST_F(ExtractorsTest, ReboundThroughStrMethodIsString) {
        const auto assignments = extract_augmented_assignments(load(
            "def build(xs):\n"
            "    s = ''\n"
            "    s = s.strip()\n"
            "    for x in xs:\n"
            "        s += x\n"
            "    return s\n"));

        ASSERT_EQ(assignments.size(), 1u);
        EXPECT_EQ(assignments[0].line, 5u);
        EXPECT_TRUE(assignments[0].is_string_operation);
        EXPECT_TRUE(assignments[0].target_bound_outside_loop);
    }

    TEST_F(ExtractorsTest, ReboundThroughOtherMethodIsNotString) {
        const auto assignments = extract_augmented_assignments(load(
            "n = 0\n"
            "n = n.bit_length()\n"
            "for x in xs:\n"
            "    n += x\n"));

        ASSERT_EQ(assignments.size(), 1u);
        EXPECT_FALSE(assignments[0].is_string_operation);
    }

    TEST_F(ExtractorsTest, NumericAccumulatorIsNotString) {
        const auto assignments = extract_augmented_assignments(load(
            "total = 0\n"
            "for n in numbers:\n"
            "    total += n\n"));

        ASSERT_EQ(assignments.size(), 1u);
        EXPECT_FALSE(assignments[0].is_string_operation);
        EXPECT_TRUE(assignments[0].target_bound_outside_loop);
    }

    TEST_F(ExtractorsTest, AttributeTargetInLoopOutlivesIteration) {
        const auto assignments = extract_augmented_assignments(load(
            "for part in parts:\n"
            "    self.buffer += str(part)\n"
            "count += 1\n"));

        ASSERT_EQ(assignments.size(), 2u);
        EXPECT_EQ(assignments[0].target, "self.buffer");
        EXPECT_TRUE(assignments[0].is_string_operation);
        EXPECT_TRUE(assignments[0].target_bound_outside_loop);

        EXPECT_EQ(assignments[1].loop_nesting, 0u);
        EXPECT_FALSE(assignments[1].loop_line.has_value());
        EXPECT_FALSE(assignments[1].target_bound_outside_loop);
    }

    TEST_F(ExtractorsTest, TryAndGlobalStatements) {
        const auto& module = load(
            "def work(items):\n"
            "    global CACHE, HITS\n"
            "    for item in items:\n"
            "        try:\n"
            "            use(item)\n"
            "        except ValueError:\n"
            "            pass\n"
            "try:\n"
            "    setup()\n"
            "finally:\n"
            "    teardown()\n");

        const auto tries = extract_try_statements(module);
        ASSERT_EQ(tries.size(), 2u);
        EXPECT_EQ(tries[0].line, 4u);
        EXPECT_EQ(tries[0].end_line, 7u);
        EXPECT_TRUE(tries[0].is_in_loop);
        EXPECT_EQ(tries[0].parent_function, "work");
        EXPECT_FALSE(tries[1].is_in_loop);
        EXPECT_FALSE(tries[1].parent_function.has_value());

        const auto globals = extract_global_statements(module);
        ASSERT_EQ(globals.size(), 1u);
        EXPECT_EQ(globals[0].names, (std::vector<std::string>{"CACHE", "HITS"}));
        EXPECT_EQ(globals[0].line, 2u);
        EXPECT_EQ(globals[0].parent_function, "work");
    }

    TEST_F(ExtractorsTest, AnalyzeCombinesEveryExtractor) {
        const auto& module = load(
            "import os\n"
            "class A:\n"
            "    def run(self):\n"
            "        for f in os.listdir('.'):\n"
            "            print(f)\n");

        const AnalysisResult result = analyze(module);

        EXPECT_EQ(result.functions, extract_functions(module));
        EXPECT_EQ(result.loops.size(), 1u);
        EXPECT_EQ(result.imports.size(), 1u);
        EXPECT_EQ(result.calls.size(), 2u);
        EXPECT_EQ(result.classes.size(), 1u);
        EXPECT_TRUE(result.augmented_assignments.empty());
    }

    TEST_F(ExtractorsTest, EmptyModuleYieldsNothing) {
        const AnalysisResult result = analyze(load(""));

        EXPECT_TRUE(result.functions.empty());
        EXPECT_TRUE(result.loops.empty());
        EXPECT_TRUE(result.calls.empty());
        EXPECT_TRUE(result.imports.empty());
    }
}  // namespace ppa::analysis
