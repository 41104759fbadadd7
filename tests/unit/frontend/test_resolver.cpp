//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/frontend/parser.hpp"
#include "ppa/frontend/resolver.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ppa::frontend
{
    class ResolverTest : public ::testing::Test {
    protected:
        void build(const std::string& source) {
            auto parsed = parse_source(source);
            ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();
            tree_ = std::move(parsed).value();
            model_ = SemanticModel::build(tree_);
        }

        /// First Call node whose callee is written as `callee`.
        [[nodiscard]] NodeId find_call(const std::string& callee) const {
            for (NodeId id = 0; id < tree_.size(); ++id) {
                const Node& n = tree_.node(id);
                if (n.kind == NodeKind::Call && unparse(tree_, tree_.first(id, Role::Func)) == callee) {
                    return id;
                }
            }
            return kNoNode;
        }

        /// Scope opened by the first def named `name`.
        [[nodiscard]] std::size_t function_scope(const std::string& name) const {
            for (NodeId id = 0; id < tree_.size(); ++id) {
                const Node& n = tree_.node(id);
                if (n.kind == NodeKind::FunctionDef && n.name == name) {
                    return model_.scope_opened_by(id).value_or(kModuleScope);
                }
            }
            return kModuleScope;
        }

        [[nodiscard]] std::optional<std::string> callee_of(const std::string& callee) const {
            return model_.resolve_callee(tree_, find_call(callee));
        }

        SyntaxTree tree_;
        SemanticModel model_;
    };

    TEST_F(ResolverTest, ImportAliases) {
        build("import numpy as np\nimport os.path\nfrom requests import get as fetch\n"
              "np.array([])\nos.path.join('a')\nfetch('u')\n");

        EXPECT_EQ(model_.lookup("np", kModuleScope), (Symbol{SymbolKind::Module, "numpy"}));
        EXPECT_EQ(model_.lookup("os", kModuleScope), (Symbol{SymbolKind::Module, "os"}));

        EXPECT_EQ(callee_of("np.array"), "numpy.array");
        EXPECT_EQ(callee_of("os.path.join"), "os.path.join");
        EXPECT_EQ(callee_of("fetch"), "requests.get");
    }

    TEST_F(ResolverTest, RelativeImportStaysUnknown) {
        build("from .models import User\nUser.objects.all()\n");

        EXPECT_FALSE(model_.lookup("User", kModuleScope).known());
        EXPECT_FALSE(callee_of("User.objects.all").has_value());
    }

    TEST_F(ResolverTest, BuiltinsUnlessShadowed) {
        build("open('a')\n"
              "def f():\n"
              "    def open(path):\n"
              "        return path\n"
              "    open('b')\n");

        EXPECT_EQ(model_.resolve_callee(tree_, find_call("open")), "builtins.open");

        const std::size_t scope = function_scope("f");
        EXPECT_EQ(model_.lookup("open", scope), (Symbol{SymbolKind::Function, "f.open"}));
    }

    TEST_F(ResolverTest, InstancesFromConstructorsAndLiterals) {
        build("import io\n"
              "f = open('data.bin', 'rb')\n"
              "g = open('data.txt')\n"
              "s = 'text'\n"
              "items = [1, 2]\n"
              "joined = s + 'x'\n");

        EXPECT_EQ(model_.inferred_type("f", kModuleScope), "_io.BufferedReader");
        EXPECT_EQ(model_.inferred_type("g", kModuleScope), "_io.TextIOWrapper");
        EXPECT_EQ(model_.inferred_type("s", kModuleScope), "builtins.str");
        EXPECT_EQ(model_.inferred_type("items", kModuleScope), "builtins.list");
        EXPECT_EQ(model_.inferred_type("joined", kModuleScope), "builtins.str");
    }

    TEST_F(ResolverTest, StrMethodsReturnStr) {
        build("t = 'a b'.upper()\n"
              "parts = 'a b'.split()\n");

        EXPECT_EQ(model_.inferred_type("t", kModuleScope), "builtins.str");
        EXPECT_NE(model_.inferred_type("parts", kModuleScope), "builtins.str");
        EXPECT_TRUE(is_str_method("strip"));
        EXPECT_FALSE(is_str_method("split"));
    }

    TEST_F(ResolverTest, ConflictingBindingsAreUnknown) {
        build("x = 'a'\nx = 1\n");

        EXPECT_FALSE(model_.lookup("x", kModuleScope).known());
        EXPECT_FALSE(model_.inferred_type("x", kModuleScope).has_value());
    }

    TEST_F(ResolverTest, SelfInsideMethods) {
        build("class Repo:\n"
              "    def load(self):\n"
              "        return self.fetch()\n"
              "    def fetch(self):\n"
              "        return 1\n"
              "    @staticmethod\n"
              "    def make(x):\n"
              "        return x\n");

        EXPECT_EQ(model_.inferred_type("self", function_scope("load")), "Repo");
        EXPECT_EQ(callee_of("self.fetch"), "Repo.fetch");
        EXPECT_FALSE(model_.lookup("x", function_scope("make")).known());
    }

    TEST_F(ResolverTest, ClassScopeInvisibleToMethods) {
        build("limit = 'module'\n"
              "class C:\n"
              "    limit = 3\n"
              "    def m(self):\n"
              "        return limit\n");

        EXPECT_EQ(model_.defining_scope("limit", function_scope("m")), kModuleScope);
    }

    TEST_F(ResolverTest, GlobalDeclarationBindsModule) {
        build("counter = 0\n"
              "def bump():\n"
              "    global counter\n"
              "    counter += 1\n");

        const std::size_t scope = function_scope("bump");
        EXPECT_TRUE(model_.scope(scope).globals.contains("counter"));
        EXPECT_EQ(model_.defining_scope("counter", scope), kModuleScope);
    }

    TEST_F(ResolverTest, AnnotatedParameters) {
        build("from sqlalchemy.orm import Session\n"
              "def load(session: Session, name: str):\n"
              "    return session.query(name)\n");

        const std::size_t scope = function_scope("load");
        EXPECT_EQ(model_.inferred_type("session", scope), "sqlalchemy.orm.Session");
        EXPECT_EQ(model_.inferred_type("name", scope), "builtins.str");
        EXPECT_EQ(callee_of("session.query"), "sqlalchemy.orm.Session.query");
    }

    TEST_F(ResolverTest, ComprehensionVariablesAreLocal) {
        build("x = 'outer'\nvalues = [x for x in range(3)]\n");

        EXPECT_EQ(model_.inferred_type("x", kModuleScope), "builtins.str");
        EXPECT_EQ(model_.sites("x", kModuleScope).size(), 1u);
    }
}  // namespace ppa::frontend
