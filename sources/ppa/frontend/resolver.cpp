//
// Created by gregorian-rayne on 10/14/26.
//

#include "ppa/frontend/resolver.hpp"
#include "ppa/utils/string_utils.hpp"

#include <cctype>
#include <set>
#include <utility>

namespace ppa::frontend
{
    const char* to_string(const SymbolKind kind) noexcept {
        switch (kind) {
            case SymbolKind::Unknown:  return "unknown";
            case SymbolKind::Module:   return "module";
            case SymbolKind::Function: return "function";
            case SymbolKind::Class:    return "class";
            case SymbolKind::Instance: return "instance";
            case SymbolKind::Imported: return "imported";
        }
        return "unknown";
    }

    std::optional<Symbol> builtin_symbol(const std::string_view name) {
        static const std::unordered_set<std::string_view> functions = {
            "abs", "aiter", "all", "anext", "any", "ascii", "bin", "breakpoint", "callable",
            "chr", "compile", "delattr", "dir", "divmod", "eval", "exec", "format", "getattr",
            "globals", "hasattr", "hash", "help", "hex", "id", "input", "isinstance",
            "issubclass", "iter", "len", "locals", "max", "min", "next", "oct", "open",
            "ord", "pow", "print", "repr", "round", "setattr", "sorted", "sum", "vars",
            "__import__"
        };
        static const std::unordered_set<std::string_view> types = {
            "bool", "bytearray", "bytes", "classmethod", "complex", "dict", "enumerate",
            "filter", "float", "frozenset", "int", "list", "map", "memoryview", "object",
            "property", "range", "reversed", "set", "slice", "staticmethod", "str", "super",
            "tuple", "type", "zip",
            "BaseException", "Exception", "ArithmeticError", "AssertionError",
            "AttributeError", "EOFError", "FileNotFoundError", "ImportError", "IndexError",
            "KeyError", "KeyboardInterrupt", "LookupError", "NameError",
            "NotImplementedError", "OSError", "IOError", "RuntimeError", "StopIteration",
            "TimeoutError", "TypeError", "ValueError", "ZeroDivisionError"
        };
        if (functions.count(name) != 0) {
            return Symbol{SymbolKind::Function, "builtins." + std::string(name)};
        }
        if (types.count(name) != 0) {
            return Symbol{SymbolKind::Class, "builtins." + std::string(name)};
        }
        return std::nullopt;
    }

    bool is_str_method(const std::string_view method) {
        static const std::unordered_set<std::string_view> methods = {
            "capitalize", "casefold", "center", "expandtabs", "format", "format_map", "join",
            "ljust", "lower", "lstrip", "removeprefix", "removesuffix", "replace", "rjust",
            "rstrip", "strip", "swapcase", "title", "translate", "upper", "zfill"
        };
        return methods.count(method) != 0;
    }

    namespace {

        Symbol instance_of(std::string qualified_name) {
            return Symbol{SymbolKind::Instance, std::move(qualified_name)};
        }

        bool names_a_class(const std::string_view qualified_name) {
            const auto segment = string_utils::last_segment(qualified_name);
            return !segment.empty() && std::isupper(static_cast<unsigned char>(segment.front())) != 0;
        }

        std::string_view number_type(const std::string_view spelling) {
            const std::string lowered = string_utils::to_lower(spelling);
            if (string_utils::ends_with(lowered, "j")) {
                return "builtins.complex";
            }
            if (string_utils::starts_with(lowered, "0x") || string_utils::starts_with(lowered, "0o") ||
                string_utils::starts_with(lowered, "0b")) {
                return "builtins.int";
            }
            if (lowered.find_first_of(".e") != std::string::npos) {
                return "builtins.float";
            }
            return "builtins.int";
        }

        /// Mode argument of an open() call, positional or keyword.
        std::string open_mode(const SyntaxTree& tree, const NodeId call) {
            const auto args = tree.all(call, Role::Arg);
            if (args.size() >= 2 && tree.node(args[1]).kind == NodeKind::Constant) {
                return tree.node(args[1]).value;
            }
            for (const NodeId keyword : tree.all(call, Role::Keyword)) {
                if (tree.node(keyword).name != "mode") {
                    continue;
                }
                const NodeId value = tree.first(keyword, Role::Value);
                if (value != kNoNode && tree.node(value).kind == NodeKind::Constant) {
                    return tree.node(value).value;
                }
            }
            return "r";
        }

        constexpr int kMaxEvaluationDepth = 64;

        /**
         * Expression inference shared by the builder (which resolves names
         * lazily) and the finished model (which reads resolved symbols).
         */
        template<typename Lookup>
        Symbol evaluate_with(const SyntaxTree& tree, const std::vector<std::uint32_t>& scope_of,
                             const NodeId id, const Lookup& lookup, const int depth) {
            if (id == kNoNode || depth > kMaxEvaluationDepth) {
                return {};
            }
            const auto eval = [&](const NodeId child) {
                return evaluate_with(tree, scope_of, child, lookup, depth + 1);
            };
            const Node& n = tree.node(id);
            const std::size_t scope = id < scope_of.size() ? scope_of[id] : kModuleScope;

            switch (n.kind) {
                case NodeKind::Name:
                    return lookup(n.name, scope);

                case NodeKind::Attribute: {
                    const Symbol base = eval(tree.first(id, Role::Value));
                    switch (base.kind) {
                        case SymbolKind::Module:
                        case SymbolKind::Imported:
                            return Symbol{SymbolKind::Imported, base.qualified_name + "." + n.name};
                        case SymbolKind::Instance:
                        case SymbolKind::Class:
                            return Symbol{SymbolKind::Function, base.qualified_name + "." + n.name};
                        default:
                            return {};
                    }
                }

                case NodeKind::Call: {
                    const Symbol callee = eval(tree.first(id, Role::Func));
                    if ((callee.kind == SymbolKind::Function || callee.kind == SymbolKind::Imported) &&
                        (callee.qualified_name == "builtins.open" || callee.qualified_name == "io.open")) {
                        return instance_of(open_mode(tree, id).find('b') != std::string::npos
                                               ? "_io.BufferedReader" : "_io.TextIOWrapper");
                    }
                    if (callee.kind == SymbolKind::Function &&
                        string_utils::starts_with(callee.qualified_name, "builtins.str.") &&
                        is_str_method(string_utils::last_segment(callee.qualified_name))) {
                        return instance_of("builtins.str");
                    }
                    if (callee.kind == SymbolKind::Class) {
                        return instance_of(callee.qualified_name);
                    }
                    if (callee.kind == SymbolKind::Imported && names_a_class(callee.qualified_name)) {
                        return instance_of(callee.qualified_name);
                    }
                    return {};
                }

                case NodeKind::Constant:
                    switch (n.constant) {
                        case ConstantKind::String: return instance_of("builtins.str");
                        case ConstantKind::Bytes:  return instance_of("builtins.bytes");
                        case ConstantKind::True:
                        case ConstantKind::False:  return instance_of("builtins.bool");
                        case ConstantKind::Number: return instance_of(std::string(number_type(n.text)));
                        default:                   return {};
                    }

                case NodeKind::JoinedStr:
                    return instance_of("builtins.str");
                case NodeKind::List:
                case NodeKind::ListComp:
                    return instance_of("builtins.list");
                case NodeKind::Dict:
                case NodeKind::DictComp:
                    return instance_of("builtins.dict");
                case NodeKind::Set:
                case NodeKind::SetComp:
                    return instance_of("builtins.set");
                case NodeKind::Tuple:
                    return instance_of("builtins.tuple");

                case NodeKind::BinOp: {
                    if (n.text != "+" && n.text != "%") {
                        return {};
                    }
                    const auto operands = tree.all(id, Role::Operand);
                    if (operands.size() != 2) {
                        return {};
                    }
                    const Symbol str = instance_of("builtins.str");
                    if (eval(operands[0]) == str || (n.text == "+" && eval(operands[1]) == str)) {
                        return str;
                    }
                    return {};
                }

                case NodeKind::NamedExpr:
                    return eval(tree.first(id, Role::Value));

                case NodeKind::IfExp: {
                    const Symbol body = eval(tree.first(id, Role::Body));
                    return body == eval(tree.first(id, Role::OrElse)) ? body : Symbol{};
                }

                default:
                    return {};
            }
        }

        /// Type named by an annotation, as an instance symbol.
        template<typename Evaluate>
        Symbol annotation_type(const SyntaxTree& tree, const NodeId annotation, const Evaluate& evaluate) {
            if (annotation == kNoNode) {
                return {};
            }
            NodeId target = annotation;
            if (tree.node(target).kind == NodeKind::Subscript) {
                target = tree.first(target, Role::Value);
            }
            const Symbol symbol = evaluate(target);
            if (symbol.kind == SymbolKind::Class || symbol.kind == SymbolKind::Imported) {
                return instance_of(symbol.qualified_name);
            }
            return {};
        }

    }  // namespace

    /**
     * Walks the tree once to create scopes and record bindings, then
     * resolves every bound name.
     */
    class ModelBuilder {
    public:
        ModelBuilder(const SyntaxTree& tree, SemanticModel& model)
            : tree_(tree)
            , model_(model) {}

        void run() {
            model_.scope_of_.assign(tree_.size(), static_cast<std::uint32_t>(kModuleScope));
            Scope module;
            module.kind = ScopeKind::Module;
            module.node = tree_.root();
            model_.scopes_.push_back(std::move(module));
            if (tree_.root() != kNoNode) {
                model_.opened_[tree_.root()] = kModuleScope;
                for (const NodeId stmt : tree_.all(tree_.root(), Role::Body)) {
                    visit(stmt, kModuleScope);
                }
            }

            for (std::size_t s = 0; s < model_.scopes_.size(); ++s) {
                std::vector<std::string> names;
                names.reserve(model_.scopes_[s].bindings.size());
                for (const auto& [name, sites] : model_.scopes_[s].bindings) {
                    names.push_back(name);
                }
                for (const auto& name : names) {
                    resolve(s, name);
                }
            }
        }

    private:
        std::size_t open_scope(const ScopeKind kind, const NodeId node, const std::size_t parent,
                               std::string qualified_name) {
            Scope scope;
            scope.kind = kind;
            scope.node = node;
            scope.parent = parent;
            scope.qualified_name = std::move(qualified_name);
            model_.scopes_.push_back(std::move(scope));
            const std::size_t index = model_.scopes_.size() - 1;
            model_.opened_[node] = index;
            return index;
        }

        std::string qualify(const std::size_t scope, const std::string& name) const {
            const std::string& prefix = model_.scopes_[scope].qualified_name;
            return prefix.empty() ? name : prefix + "." + name;
        }

        void mark(const NodeId id, const std::size_t scope) {
            if (id < model_.scope_of_.size()) {
                model_.scope_of_[id] = static_cast<std::uint32_t>(scope);
            }
        }

        std::size_t binding_scope(const std::size_t scope, const std::string& name) const {
            const Scope& current = model_.scopes_[scope];
            if (current.globals.count(name) != 0) {
                return kModuleScope;
            }
            if (current.nonlocals.count(name) != 0) {
                std::optional<std::size_t> s = current.parent;
                while (s) {
                    const Scope& candidate = model_.scopes_[*s];
                    if (candidate.kind == ScopeKind::Function || candidate.kind == ScopeKind::Lambda) {
                        return *s;
                    }
                    s = candidate.parent;
                }
            }
            return scope;
        }

        void bind(const std::size_t scope, const std::string& name, Binding binding) {
            model_.scopes_[binding_scope(scope, name)].bindings[name].push_back(std::move(binding));
        }

        void bind_name(const std::size_t scope, const NodeId name_node, const BindingKind kind,
                       const NodeId value, const NodeId statement) {
            mark(name_node, scope);
            Binding binding;
            binding.kind = kind;
            binding.node = statement;
            binding.value = value;
            binding.line = tree_.node(name_node).line;
            bind(scope, tree_.node(name_node).name, std::move(binding));
        }

        /// Binds every name in an assignment target. Only a bare name keeps
        /// the assigned value; unpacked names are left unknown.
        void bind_target(const NodeId target, const std::size_t scope, const BindingKind kind,
                         const NodeId value, const NodeId statement) {
            if (target == kNoNode) {
                return;
            }
            const Node& n = tree_.node(target);
            switch (n.kind) {
                case NodeKind::Name:
                    bind_name(scope, target, kind, value, statement);
                    return;
                case NodeKind::Tuple:
                case NodeKind::List:
                    mark(target, scope);
                    for (const NodeId element : tree_.all(target, Role::Element)) {
                        bind_target(element, scope, BindingKind::Other, kNoNode, statement);
                    }
                    return;
                case NodeKind::Starred:
                    mark(target, scope);
                    bind_target(tree_.first(target, Role::Value), scope, BindingKind::Other, kNoNode, statement);
                    return;
                default:
                    visit(target, scope);
                    return;
            }
        }

        void visit_children(const NodeId id, const std::size_t scope) {
            for (const auto& child : tree_.node(id).children) {
                visit(child.id, scope);
            }
        }

        void visit_role(const NodeId id, const Role role, const std::size_t scope) {
            for (const NodeId child : tree_.all(id, role)) {
                visit(child, scope);
            }
        }

        void visit(const NodeId id, const std::size_t scope) {
            if (id == kNoNode) {
                return;
            }
            mark(id, scope);
            const Node& n = tree_.node(id);

            switch (n.kind) {
                case NodeKind::FunctionDef:
                    visit_function(id, scope);
                    return;
                case NodeKind::ClassDef:
                    visit_class(id, scope);
                    return;
                case NodeKind::Lambda:
                    visit_lambda(id, scope);
                    return;
                case NodeKind::ListComp:
                case NodeKind::SetComp:
                case NodeKind::DictComp:
                case NodeKind::GeneratorExp:
                    visit_comprehension(id, scope);
                    return;

                case NodeKind::Import:
                    for (const NodeId alias : tree_.all(id, Role::Alias)) {
                        mark(alias, scope);
                        const Node& a = tree_.node(alias);
                        Binding binding;
                        binding.kind = BindingKind::Import;
                        binding.node = id;
                        binding.line = a.line;
                        if (!a.text.empty()) {
                            binding.fixed = Symbol{SymbolKind::Module, a.name};
                            bind(scope, a.text, std::move(binding));
                        } else {
                            const std::string top(string_utils::split(a.name, '.').front());
                            binding.fixed = Symbol{SymbolKind::Module, top};
                            bind(scope, top, std::move(binding));
                        }
                    }
                    return;

                case NodeKind::ImportFrom: {
                    const bool relative = string_utils::starts_with(n.text, ".");
                    for (const NodeId alias : tree_.all(id, Role::Alias)) {
                        mark(alias, scope);
                        const Node& a = tree_.node(alias);
                        if (a.name == "*") {
                            continue;
                        }
                        Binding binding;
                        binding.kind = BindingKind::Import;
                        binding.node = id;
                        binding.line = a.line;
                        if (!relative) {
                            binding.fixed = Symbol{SymbolKind::Imported, n.text + "." + a.name};
                        }
                        bind(scope, a.text.empty() ? a.name : a.text, std::move(binding));
                    }
                    return;
                }

                case NodeKind::Global:
                case NodeKind::Nonlocal: {
                    auto& names = n.kind == NodeKind::Global ? model_.scopes_[scope].globals
                                                             : model_.scopes_[scope].nonlocals;
                    for (const NodeId alias : tree_.all(id, Role::Alias)) {
                        mark(alias, scope);
                        names.insert(tree_.node(alias).name);
                    }
                    return;
                }

                case NodeKind::Assign: {
                    const NodeId value = tree_.first(id, Role::Value);
                    visit(value, scope);
                    for (const NodeId target : tree_.all(id, Role::Target)) {
                        bind_target(target, scope, BindingKind::Assign, value, id);
                    }
                    return;
                }

                case NodeKind::AugAssign: {
                    const NodeId value = tree_.first(id, Role::Value);
                    visit(value, scope);
                    const NodeId target = tree_.first(id, Role::Target);
                    if (tree_.node(target).kind == NodeKind::Name) {
                        bind_name(scope, target, BindingKind::AugAssign, value, id);
                    } else {
                        visit(target, scope);
                    }
                    return;
                }

                case NodeKind::AnnAssign: {
                    const NodeId annotation = tree_.first(id, Role::Annotation);
                    visit(annotation, scope);
                    visit(tree_.first(id, Role::Value), scope);
                    const NodeId target = tree_.first(id, Role::Target);
                    if (tree_.node(target).kind == NodeKind::Name) {
                        bind_name(scope, target, BindingKind::AnnAssign, annotation, id);
                    } else {
                        visit(target, scope);
                    }
                    return;
                }

                case NodeKind::For:
                    visit(tree_.first(id, Role::Iter), scope);
                    bind_target(tree_.first(id, Role::Target), scope, BindingKind::Other, kNoNode, id);
                    visit_role(id, Role::Body, scope);
                    visit_role(id, Role::OrElse, scope);
                    return;

                case NodeKind::With:
                    for (const NodeId item : tree_.all(id, Role::Item)) {
                        mark(item, scope);
                        const NodeId manager = tree_.first(item, Role::Value);
                        visit(manager, scope);
                        const NodeId target = tree_.first(item, Role::Target);
                        if (target != kNoNode && tree_.node(target).kind == NodeKind::Name) {
                            bind_name(scope, target, BindingKind::WithAs, manager, id);
                        } else {
                            bind_target(target, scope, BindingKind::Other, kNoNode, id);
                        }
                    }
                    visit_role(id, Role::Body, scope);
                    return;

                case NodeKind::ExceptHandler:
                    if (!n.name.empty()) {
                        Binding binding;
                        binding.kind = BindingKind::Other;
                        binding.node = id;
                        binding.line = n.line;
                        bind(scope, n.name, std::move(binding));
                    }
                    visit_children(id, scope);
                    return;

                case NodeKind::NamedExpr: {
                    const NodeId value = tree_.first(id, Role::Value);
                    visit(value, scope);
                    std::size_t target_scope = scope;
                    while (model_.scopes_[target_scope].kind == ScopeKind::Comprehension &&
                           model_.scopes_[target_scope].parent) {
                        target_scope = *model_.scopes_[target_scope].parent;
                    }
                    const NodeId target = tree_.first(id, Role::Target);
                    mark(target, scope);
                    Binding binding;
                    binding.kind = BindingKind::Assign;
                    binding.node = id;
                    binding.value = value;
                    binding.line = tree_.node(target).line;
                    bind(target_scope, tree_.node(target).name, std::move(binding));
                    return;
                }

                case NodeKind::TypeAlias:
                    bind_target(tree_.first(id, Role::Target), scope, BindingKind::Other, kNoNode, id);
                    visit(tree_.first(id, Role::Value), scope);
                    return;

                default:
                    visit_children(id, scope);
                    return;
            }
        }

        static bool has_decorator(const SyntaxTree& tree, const NodeId def, const std::string_view name) {
            for (const NodeId decorator : tree.all(def, Role::Decorator)) {
                if (tree.node(decorator).kind == NodeKind::Name && tree.node(decorator).name == name) {
                    return true;
                }
            }
            return false;
        }

        void bind_parameters(const NodeId owner, const std::size_t inner, const Symbol& first_param) {
            bool first = true;
            for (const NodeId param : tree_.all(owner, Role::Parameter)) {
                const Node& p = tree_.node(param);
                Binding binding;
                binding.kind = BindingKind::Param;
                binding.node = param;
                binding.value = tree_.first(param, Role::Annotation);
                binding.line = p.line;
                if (first && p.text.empty()) {
                    binding.fixed = first_param;
                }
                first = false;
                model_.scopes_[inner].bindings[p.name].push_back(std::move(binding));
            }
        }

        void visit_function(const NodeId id, const std::size_t scope) {
            const Node& n = tree_.node(id);
            visit_role(id, Role::Decorator, scope);
            for (const NodeId param : tree_.all(id, Role::Parameter)) {
                mark(param, scope);
                visit_children(param, scope);
            }
            visit_role(id, Role::Returns, scope);

            const std::string qualified_name = qualify(scope, n.name);
            Binding binding;
            binding.kind = BindingKind::Def;
            binding.node = id;
            binding.line = n.line;
            binding.fixed = Symbol{SymbolKind::Function, qualified_name};
            bind(scope, n.name, std::move(binding));

            Symbol first_param;
            if (model_.scopes_[scope].kind == ScopeKind::Class) {
                const std::string& class_name = model_.scopes_[scope].qualified_name;
                if (has_decorator(tree_, id, "classmethod")) {
                    first_param = Symbol{SymbolKind::Class, class_name};
                } else if (!has_decorator(tree_, id, "staticmethod")) {
                    first_param = instance_of(class_name);
                }
            }

            const std::size_t inner = open_scope(ScopeKind::Function, id, scope, qualified_name);
            bind_parameters(id, inner, first_param);
            visit_role(id, Role::Body, inner);
        }

        void visit_class(const NodeId id, const std::size_t scope) {
            const Node& n = tree_.node(id);
            visit_role(id, Role::Decorator, scope);
            visit_role(id, Role::Base, scope);
            visit_role(id, Role::Keyword, scope);

            const std::string qualified_name = qualify(scope, n.name);
            Binding binding;
            binding.kind = BindingKind::Class;
            binding.node = id;
            binding.line = n.line;
            binding.fixed = Symbol{SymbolKind::Class, qualified_name};
            bind(scope, n.name, std::move(binding));

            const std::size_t inner = open_scope(ScopeKind::Class, id, scope, qualified_name);
            visit_role(id, Role::Body, inner);
        }

        void visit_lambda(const NodeId id, const std::size_t scope) {
            for (const NodeId param : tree_.all(id, Role::Parameter)) {
                mark(param, scope);
                visit_children(param, scope);
            }
            const std::size_t inner = open_scope(ScopeKind::Lambda, id, scope, qualify(scope, "<lambda>"));
            bind_parameters(id, inner, Symbol{});
            visit_role(id, Role::Body, inner);
        }

        void visit_comprehension(const NodeId id, const std::size_t scope) {
            const auto generators = tree_.all(id, Role::Generator);
            if (!generators.empty()) {
                visit(tree_.first(generators.front(), Role::Iter), scope);
            }
            const std::size_t inner = open_scope(ScopeKind::Comprehension, id, scope,
                                                 qualify(scope, "<" + std::string(to_string(tree_.node(id).kind)) + ">"));
            for (std::size_t k = 0; k < generators.size(); ++k) {
                const NodeId gen = generators[k];
                mark(gen, inner);
                if (k > 0) {
                    visit(tree_.first(gen, Role::Iter), inner);
                }
                bind_target(tree_.first(gen, Role::Target), inner, BindingKind::Other, kNoNode, gen);
                visit_role(gen, Role::Test, inner);
            }
            visit_role(id, Role::Element, inner);
            visit_role(id, Role::Key, inner);
            visit_role(id, Role::Value, inner);
        }

        // --------------------------------------------------------------------
        // Resolution
        // --------------------------------------------------------------------

        Symbol evaluate(const NodeId expr) {
            const auto lookup = [this](const std::string& name, const std::size_t scope) {
                return lookup_lazy(name, scope);
            };
            return evaluate_with(tree_, model_.scope_of_, expr, lookup, 0);
        }

        Symbol lookup_lazy(const std::string& name, const std::size_t scope) {
            if (const auto defining = model_.defining_scope(name, scope)) {
                return resolve(*defining, name);
            }
            return builtin_symbol(name).value_or(Symbol{});
        }

        Symbol site_symbol(const Binding& binding) {
            const auto evaluate_fn = [this](const NodeId expr) { return evaluate(expr); };
            switch (binding.kind) {
                case BindingKind::Import:
                case BindingKind::Def:
                case BindingKind::Class:
                    return binding.fixed;
                case BindingKind::Param:
                    if (binding.fixed.known()) {
                        return binding.fixed;
                    }
                    return annotation_type(tree_, binding.value, evaluate_fn);
                case BindingKind::Assign:
                case BindingKind::WithAs:
                    return evaluate(binding.value);
                case BindingKind::AnnAssign: {
                    const Symbol declared = annotation_type(tree_, binding.value, evaluate_fn);
                    if (declared.known()) {
                        return declared;
                    }
                    return evaluate(tree_.first(binding.node, Role::Value));
                }
                default:
                    return {};
            }
        }

        Symbol resolve(const std::size_t scope, const std::string& name) {
            Scope& s = model_.scopes_[scope];
            if (const auto it = s.symbols.find(name); it != s.symbols.end()) {
                return it->second;
            }
            const auto key = std::make_pair(scope, name);
            if (in_progress_.count(key) != 0) {
                return {};
            }
            in_progress_.insert(key);

            std::optional<Symbol> agreed;
            bool conflict = false;
            // Copy: evaluating a site may add symbols to this scope's maps.
            const std::vector<Binding> sites = model_.scopes_[scope].bindings[name];
            for (const Binding& binding : sites) {
                if (binding.kind == BindingKind::AugAssign) {
                    continue;
                }
                Symbol symbol = site_symbol(binding);
                if (!agreed) {
                    agreed = std::move(symbol);
                } else if (*agreed != symbol) {
                    conflict = true;
                    break;
                }
            }

            in_progress_.erase(key);
            Symbol result = conflict || !agreed ? Symbol{} : *agreed;
            model_.scopes_[scope].symbols[name] = result;
            return result;
        }

        const SyntaxTree& tree_;
        SemanticModel& model_;
        std::set<std::pair<std::size_t, std::string>> in_progress_;
    };

    SemanticModel SemanticModel::build(const SyntaxTree& tree) {
        SemanticModel model;
        ModelBuilder(tree, model).run();
        return model;
    }

    std::size_t SemanticModel::scope_of(const NodeId id) const noexcept {
        return id < scope_of_.size() ? scope_of_[id] : kModuleScope;
    }

    std::optional<std::size_t> SemanticModel::scope_opened_by(const NodeId id) const {
        if (const auto it = opened_.find(id); it != opened_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::size_t> SemanticModel::defining_scope(const std::string_view name,
                                                             const std::size_t scope) const {
        if (scope >= scopes_.size()) {
            return std::nullopt;
        }
        const std::string key(name);
        if (scopes_[scope].globals.count(key) != 0) {
            if (scopes_[kModuleScope].bindings.count(key) != 0) {
                return kModuleScope;
            }
            return std::nullopt;
        }

        std::size_t current = scope;
        bool innermost = true;
        while (true) {
            const Scope& s = scopes_[current];
            // Class bodies are invisible to the functions nested in them.
            if ((innermost || s.kind != ScopeKind::Class) && s.bindings.count(key) != 0) {
                return current;
            }
            if (!s.parent) {
                return std::nullopt;
            }
            current = *s.parent;
            innermost = false;
        }
    }

    Symbol SemanticModel::lookup(const std::string_view name, const std::size_t scope) const {
        if (const auto defining = defining_scope(name, scope)) {
            const auto& symbols = scopes_[*defining].symbols;
            if (const auto it = symbols.find(std::string(name)); it != symbols.end()) {
                return it->second;
            }
            return {};
        }
        return builtin_symbol(name).value_or(Symbol{});
    }

    const std::vector<Binding>& SemanticModel::sites(const std::string_view name, const std::size_t scope) const {
        static const std::vector<Binding> none;
        if (const auto defining = defining_scope(name, scope)) {
            return scopes_[*defining].bindings.at(std::string(name));
        }
        return none;
    }

    Symbol SemanticModel::evaluate(const SyntaxTree& tree, const NodeId expr) const {
        const auto lookup_fn = [this](const std::string& name, const std::size_t scope) {
            return lookup(name, scope);
        };
        return evaluate_with(tree, scope_of_, expr, lookup_fn, 0);
    }

    std::optional<std::string> SemanticModel::resolve_callee(const SyntaxTree& tree, const NodeId call) const {
        if (call == kNoNode || tree.node(call).kind != NodeKind::Call) {
            return std::nullopt;
        }
        const Symbol callee = evaluate(tree, tree.first(call, Role::Func));
        switch (callee.kind) {
            case SymbolKind::Function:
            case SymbolKind::Class:
            case SymbolKind::Imported:
                return callee.qualified_name;
            default:
                return std::nullopt;
        }
    }

    std::optional<std::string> SemanticModel::inferred_type(const std::string_view name, const std::size_t scope) const {
        const Symbol symbol = lookup(name, scope);
        if (symbol.kind == SymbolKind::Instance) {
            return symbol.qualified_name;
        }
        return std::nullopt;
    }
}  // namespace ppa::frontend
