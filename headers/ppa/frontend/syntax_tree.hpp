//
// Created by gregorian-rayne on 10/13/26.
//

#ifndef PPA_SYNTAX_TREE_HPP
#define PPA_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief Arena-allocated Python syntax tree.
 *
 * All nodes of one module live in a single vector and refer to each other
 * by NodeId. Every child edge carries a Role so that walkers can tell a
 * function's decorators from its body, or a loop's iterable from its
 * target, without per-kind node classes.
 *
 * Layout of the interesting node kinds (children in source order):
 *
 * | Kind          | Children                                              |
 * |---------------|-------------------------------------------------------|
 * | FunctionDef   | Decorator*, Parameter*, Returns?, Body+               |
 * | Lambda        | Parameter*, Body                                      |
 * | Parameter     | Annotation?, Default?  (name, text = "", "*" or "**") |
 * | ClassDef      | Decorator*, Base*, Keyword*, Body+                    |
 * | For           | Target, Iter, Body+, OrElse*                          |
 * | While         | Test, Body+, OrElse*                                  |
 * | Comprehension | Target, Iter, Test*                                   |
 * | ListComp etc. | Element (or Key, Value), Generator+                   |
 * | Call          | Func, Arg*, Keyword*                                  |
 * | Attribute     | Value                 (name = attribute)              |
 * | AugAssign     | Target, Value         (text = operator, e.g. "+=")    |
 * | Import        | Alias*                                                |
 * | ImportFrom    | Alias*                (text = module, dots included)  |
 * | Alias         | none                  (name = imported, text = as)    |
 * | Try           | Body+, Handler*, OrElse*, FinalBody*                  |
 */

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace ppa::frontend {

    using NodeId = std::uint32_t;

    inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

    enum class NodeKind {
        Module,

        // Statements
        FunctionDef,
        ClassDef,
        Return,
        Delete,
        Assign,
        AugAssign,
        AnnAssign,
        For,
        While,
        If,
        With,
        Match,
        Raise,
        Try,
        Assert,
        Import,
        ImportFrom,
        Global,
        Nonlocal,
        ExprStmt,
        Pass,
        Break,
        Continue,
        TypeAlias,

        // Statement parts
        Parameter,
        Keyword,
        Alias,
        ExceptHandler,
        WithItem,
        MatchCase,
        Comprehension,

        // Expressions
        BoolOp,
        NamedExpr,
        BinOp,
        UnaryOp,
        Compare,
        Lambda,
        IfExp,
        Dict,
        Set,
        List,
        Tuple,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExp,
        Await,
        Yield,
        YieldFrom,
        Call,
        Constant,
        JoinedStr,
        Attribute,
        Subscript,
        Slice,
        Starred,
        Name
    };

    const char* to_string(NodeKind kind) noexcept;

    /**
     * Relationship of a child to its parent.
     */
    enum class Role {
        Body,
        OrElse,
        FinalBody,
        Handler,
        Decorator,
        Parameter,
        Default,
        Annotation,
        Returns,
        Base,
        Keyword,
        Target,
        Value,
        Iter,
        Test,
        Func,
        Arg,
        Element,
        Key,
        Generator,
        Item,
        Case,
        Operand,
        Index,
        Lower,
        Upper,
        Step,
        Cause,
        Alias
    };

    enum class ConstantKind {
        None,
        True,
        False,
        Ellipsis,
        Number,
        String,
        Bytes
    };

    struct Child {
        Role role;
        NodeId id;
    };

    struct Node {
        NodeKind kind = NodeKind::Module;
        std::uint32_t line = 0;
        std::uint32_t end_line = 0;
        std::uint32_t column = 0;

        /// Identifier: def/class name, Name id, attribute, keyword argument,
        /// imported name, parameter name, bound exception name.
        std::string name;

        /// Operator, module path, alias, or literal spelling.
        std::string text;

        /// Decoded value of string literals.
        std::string value;

        ConstantKind constant = ConstantKind::None;
        bool is_async = false;
        bool parenthesized = false;

        std::vector<Child> children;
    };

    /**
     * Owning container for all nodes of one parsed module.
     */
    class SyntaxTree {
    public:
        SyntaxTree() = default;

        NodeId add(Node node);

        [[nodiscard]] const Node& node(NodeId id) const { return nodes_.at(id); }
        [[nodiscard]] Node& node(NodeId id) { return nodes_.at(id); }

        [[nodiscard]] NodeId root() const noexcept { return root_; }
        void set_root(const NodeId id) noexcept { root_ = id; }

        [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

        /**
         * Drops every node added after the arena had `size` nodes. Used by
         * the parser to backtrack.
         */
        void truncate(std::size_t size);

        /**
         * Returns the first child with the given role, or kNoNode.
         */
        [[nodiscard]] NodeId first(NodeId id, Role role) const;

        /**
         * Returns every child with the given role, in source order.
         */
        [[nodiscard]] std::vector<NodeId> all(NodeId id, Role role) const;

    private:
        std::vector<Node> nodes_;
        NodeId root_ = kNoNode;
    };

    /**
     * Renders an expression back to Python source, normalised the way a
     * pretty-printer would (single spaces around binary operators, none
     * inside calls). Call names are reported in this form.
     */
    [[nodiscard]] std::string unparse(const SyntaxTree& tree, NodeId id);

}  // namespace ppa::frontend

#endif //PPA_SYNTAX_TREE_HPP
