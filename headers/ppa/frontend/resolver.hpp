//
// Created by gregorian-rayne on 10/14/26.
//

#ifndef PPA_RESOLVER_HPP
#define PPA_RESOLVER_HPP

/**
 * @file resolver.hpp
 * @brief Best-effort name resolution over a parsed module.
 *
 * The resolver binds every name to the scope that defines it (module,
 * class, function, lambda or comprehension, following Python's scoping
 * rules including `global`, `nonlocal` and class-scope invisibility) and
 * infers what each binding refers to:
 *
 * - import bindings: `import a.b as c` makes `c` the module `a.b`,
 *   `from x import y` makes `y` the imported object `x.y`;
 * - local functions and classes: `f`, `C`, `C.m`, `outer.inner`;
 * - builtins not shadowed by a local binding (`builtins.open`);
 * - instances created by known constructors (`open(...)`, literal
 *   displays, calls of local or imported classes);
 * - `self` / `cls` inside methods.
 *
 * A name bound to different things in one scope is left Unknown. All
 * inference is computed when the model is built; the model is immutable
 * afterwards.
 */

#include "ppa/frontend/syntax_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ppa::frontend {

    enum class ScopeKind {
        Module,
        Class,
        Function,
        Lambda,
        Comprehension
    };

    enum class SymbolKind {
        Unknown,
        Module,     ///< an imported module
        Function,   ///< a function or method with a known qualified name
        Class,      ///< a class object
        Instance,   ///< an instance of the class named by qualified_name
        Imported    ///< something imported from a module; kind unknown
    };

    const char* to_string(SymbolKind kind) noexcept;

    struct Symbol {
        SymbolKind kind = SymbolKind::Unknown;
        std::string qualified_name;

        [[nodiscard]] bool known() const noexcept { return kind != SymbolKind::Unknown; }

        bool operator==(const Symbol&) const = default;
    };

    enum class BindingKind {
        Import,
        Def,
        Class,
        Param,
        Assign,
        AnnAssign,
        WithAs,
        AugAssign,
        Other
    };

    /**
     * One place where a name is bound.
     */
    struct Binding {
        BindingKind kind = BindingKind::Other;
        NodeId node = kNoNode;      ///< the binding statement or parameter
        NodeId value = kNoNode;     ///< assigned value, annotation or context manager
        std::uint32_t line = 0;
        Symbol fixed;               ///< known up front for imports, defs and self/cls
    };

    struct Scope {
        ScopeKind kind = ScopeKind::Module;
        NodeId node = kNoNode;
        std::optional<std::size_t> parent;

        /// "" for the module, "C.m" for a method, "outer.inner" for a closure.
        std::string qualified_name;

        std::unordered_map<std::string, std::vector<Binding>> bindings;
        std::unordered_map<std::string, Symbol> symbols;
        std::unordered_set<std::string> globals;
        std::unordered_set<std::string> nonlocals;
    };

    inline constexpr std::size_t kModuleScope = 0;

    class SemanticModel {
    public:
        SemanticModel() = default;

        /**
         * Binds and resolves every name in the tree.
         */
        [[nodiscard]] static SemanticModel build(const SyntaxTree& tree);

        [[nodiscard]] std::size_t scope_count() const noexcept { return scopes_.size(); }
        [[nodiscard]] const Scope& scope(std::size_t index) const { return scopes_.at(index); }

        /**
         * Scope in which the node is evaluated. Decorators, defaults and
         * annotations of a def belong to the enclosing scope.
         */
        [[nodiscard]] std::size_t scope_of(NodeId id) const noexcept;

        /**
         * Scope opened by a FunctionDef, ClassDef, Lambda or comprehension.
         */
        [[nodiscard]] std::optional<std::size_t> scope_opened_by(NodeId id) const;

        /**
         * Scope whose bindings a reference to `name` from `scope` sees, or
         * nullopt when the name is unbound in the module (builtin or
         * undefined).
         */
        [[nodiscard]] std::optional<std::size_t> defining_scope(std::string_view name, std::size_t scope) const;

        [[nodiscard]] Symbol lookup(std::string_view name, std::size_t scope) const;

        /**
         * Binding sites of `name` as seen from `scope`; empty when the name
         * is a builtin or undefined.
         */
        [[nodiscard]] const std::vector<Binding>& sites(std::string_view name, std::size_t scope) const;

        /**
         * Infers what an expression evaluates to.
         */
        [[nodiscard]] Symbol evaluate(const SyntaxTree& tree, NodeId expr) const;

        /**
         * Fully qualified callee of a Call node, when its target is a
         * function, a class or an imported object.
         */
        [[nodiscard]] std::optional<std::string> resolve_callee(const SyntaxTree& tree, NodeId call) const;

        /**
         * Class name of the instance `name` refers to, when known.
         */
        [[nodiscard]] std::optional<std::string> inferred_type(std::string_view name, std::size_t scope) const;

    private:
        friend class ModelBuilder;

        std::vector<Scope> scopes_;
        std::vector<std::uint32_t> scope_of_;
        std::unordered_map<NodeId, std::size_t> opened_;
    };

    /**
     * Builtin functions and types visible in every module, as qualified
     * symbols ("builtins.len" / Class "builtins.str").
     */
    [[nodiscard]] std::optional<Symbol> builtin_symbol(std::string_view name);

    /**
     * True for methods of str that return a new str ("strip", "lower", ...).
     */
    [[nodiscard]] bool is_str_method(std::string_view method);

}  // namespace ppa::frontend

#endif //PPA_RESOLVER_HPP
