//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef PPA_WALKER_HPP
#define PPA_WALKER_HPP

/**
 * @file walker.hpp
 * @brief Context-tracking pre-order walk over a syntax tree.
 *
 * walk() calls `visit(id, context)` for every node, parents before
 * children, in source order. The context carries the enclosing function
 * stack, the loop nesting depth, the enclosing loop nodes and whether the
 * innermost function is async. The rules that change it:
 *
 * - def: decorators, defaults, annotations and the return annotation are
 *   visited in the enclosing context. The body gets the function's own
 *   async flag and starts outside any loop.
 * - lambda: defaults in the enclosing context; the body is a new
 *   non-async scope that keeps the loop depth.
 * - for / async for: the iterable and the else-block are outside the
 *   loop; target and body are one level deeper.
 * - while: the condition and body are one level deeper; the else-block is
 *   not.
 * - comprehensions: every `for` clause is a loop. The first iterable is
 *   evaluated outside the comprehension; each later clause, condition and
 *   the element run inside all preceding clauses.
 *
 * Loop nodes (For, While, Comprehension) are visited in the context that
 * encloses them, so `context.loop_depth` is their own nesting level.
 */

#include "ppa/frontend/syntax_tree.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace ppa::analysis {

    struct WalkContext {
        /// Enclosing function names, innermost last. Lambdas push "<lambda>".
        std::vector<std::string> functions;
        bool in_async = false;
        std::size_t loop_depth = 0;

        /// Enclosing loop nodes, innermost last.
        std::vector<frontend::NodeId> loops;

        [[nodiscard]] std::optional<std::string> function() const {
            if (functions.empty()) {
                return std::nullopt;
            }
            return functions.back();
        }

        [[nodiscard]] bool in_loop() const noexcept { return loop_depth > 0; }

        [[nodiscard]] std::optional<frontend::NodeId> innermost_loop() const {
            if (loops.empty()) {
                return std::nullopt;
            }
            return loops.back();
        }
    };

    template<typename Visit>
    class Walker {
    public:
        Walker(const frontend::SyntaxTree& tree, Visit& visit)
            : tree_(tree)
            , visit_(visit) {}

        void walk(const frontend::NodeId id, const WalkContext& ctx) {
            using frontend::NodeKind;
            if (id == frontend::kNoNode) {
                return;
            }
            const frontend::Node& n = tree_.node(id);
            switch (n.kind) {
                case NodeKind::FunctionDef:
                    walk_function(id, ctx);
                    return;
                case NodeKind::Lambda:
                    walk_lambda(id, ctx);
                    return;
                case NodeKind::For:
                    walk_for(id, ctx);
                    return;
                case NodeKind::While:
                    walk_while(id, ctx);
                    return;
                case NodeKind::ListComp:
                case NodeKind::SetComp:
                case NodeKind::DictComp:
                case NodeKind::GeneratorExp:
                    walk_comprehension(id, ctx);
                    return;
                default:
                    visit_(id, ctx);
                    for (const auto& child : n.children) {
                        walk(child.id, ctx);
                    }
                    return;
            }
        }

    private:
        void walk_role(const frontend::NodeId id, const frontend::Role role, const WalkContext& ctx) {
            for (const frontend::NodeId child : tree_.all(id, role)) {
                walk(child, ctx);
            }
        }

        void walk_parameters(const frontend::NodeId id, const WalkContext& ctx) {
            for (const frontend::NodeId param : tree_.all(id, frontend::Role::Parameter)) {
                visit_(param, ctx);
                walk_role(param, frontend::Role::Annotation, ctx);
                walk_role(param, frontend::Role::Default, ctx);
            }
        }

        void walk_function(const frontend::NodeId id, const WalkContext& ctx) {
            const frontend::Node& n = tree_.node(id);
            visit_(id, ctx);
            walk_role(id, frontend::Role::Decorator, ctx);
            walk_parameters(id, ctx);
            walk_role(id, frontend::Role::Returns, ctx);

            WalkContext body = ctx;
            body.functions.push_back(n.name);
            body.in_async = n.is_async;
            body.loop_depth = 0;
            body.loops.clear();
            walk_role(id, frontend::Role::Body, body);
        }

        void walk_lambda(const frontend::NodeId id, const WalkContext& ctx) {
            visit_(id, ctx);
            walk_parameters(id, ctx);

            WalkContext body = ctx;
            body.functions.emplace_back("<lambda>");
            body.in_async = false;
            walk_role(id, frontend::Role::Body, body);
        }

        void walk_for(const frontend::NodeId id, const WalkContext& ctx) {
            visit_(id, ctx);
            walk_role(id, frontend::Role::Iter, ctx);

            WalkContext inner = ctx;
            ++inner.loop_depth;
            inner.loops.push_back(id);
            walk_role(id, frontend::Role::Target, inner);
            walk_role(id, frontend::Role::Body, inner);

            walk_role(id, frontend::Role::OrElse, ctx);
        }

        void walk_while(const frontend::NodeId id, const WalkContext& ctx) {
            visit_(id, ctx);

            WalkContext inner = ctx;
            ++inner.loop_depth;
            inner.loops.push_back(id);
            walk_role(id, frontend::Role::Test, inner);
            walk_role(id, frontend::Role::Body, inner);

            walk_role(id, frontend::Role::OrElse, ctx);
        }

        void walk_comprehension(const frontend::NodeId id, const WalkContext& ctx) {
            visit_(id, ctx);
            const auto generators = tree_.all(id, frontend::Role::Generator);

            WalkContext inner = ctx;
            for (std::size_t k = 0; k < generators.size(); ++k) {
                const frontend::NodeId gen = generators[k];
                walk_role(gen, frontend::Role::Iter, k == 0 ? ctx : inner);
                visit_(gen, inner);
                ++inner.loop_depth;
                inner.loops.push_back(gen);
                walk_role(gen, frontend::Role::Target, inner);
                walk_role(gen, frontend::Role::Test, inner);
            }

            walk_role(id, frontend::Role::Element, inner);
            walk_role(id, frontend::Role::Key, inner);
            walk_role(id, frontend::Role::Value, inner);
        }

        const frontend::SyntaxTree& tree_;
        Visit& visit_;
    };

    /**
     * Walks the whole module, calling `visit(NodeId, const WalkContext&)`
     * for every node.
     */
    template<typename Visit>
    void walk(const frontend::SyntaxTree& tree, Visit&& visit) {
        using V = std::remove_reference_t<Visit>;
        Walker<V> walker(tree, visit);
        walker.walk(tree.root(), WalkContext{});
    }

}  // namespace ppa::analysis

#endif //PPA_WALKER_HPP
