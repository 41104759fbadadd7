//
// Created by gregorian-rayne on 10/15/26.
//

#include "ppa/analysis/extractors.hpp"
#include "ppa/analysis/walker.hpp"
#include "ppa/frontend/resolver.hpp"

#include <unordered_map>

namespace ppa::analysis
{
    using frontend::BindingKind;
    using frontend::ConstantKind;
    using frontend::Node;
    using frontend::NodeId;
    using frontend::NodeKind;
    using frontend::Role;
    using frontend::SyntaxTree;
    using frontend::kNoNode;

    const char* to_string(const LoopKind kind) noexcept {
        switch (kind) {
            case LoopKind::For:   return "for";
            case LoopKind::While: return "while";
        }
        return "for";
    }

    namespace {

        bool is_string_literal(const SyntaxTree& tree, const NodeId id) {
            if (id == kNoNode) {
                return false;
            }
            const Node& n = tree.node(id);
            return (n.kind == NodeKind::Constant && n.constant == ConstantKind::String) ||
                   n.kind == NodeKind::JoinedStr;
        }

        /// Syntactic string-ness: literals, concatenation or %-formatting
        /// involving a literal, str(...), "...".format(...) and "...".join(...).
        bool is_string_expression(const SyntaxTree& tree, const NodeId id) {
            if (id == kNoNode) {
                return false;
            }
            const Node& n = tree.node(id);
            switch (n.kind) {
                case NodeKind::Constant:
                case NodeKind::JoinedStr:
                    return is_string_literal(tree, id);
                case NodeKind::BinOp:
                    if (n.text != "+" && n.text != "%") {
                        return false;
                    }
                    for (const NodeId operand : tree.all(id, Role::Operand)) {
                        if (is_string_expression(tree, operand)) {
                            return true;
                        }
                    }
                    return false;
                case NodeKind::Call: {
                    const NodeId func = tree.first(id, Role::Func);
                    const Node& f = tree.node(func);
                    if (f.kind == NodeKind::Name) {
                        return f.name == "str";
                    }
                    if (f.kind == NodeKind::Attribute && (f.name == "format" || f.name == "join")) {
                        return is_string_literal(tree, tree.first(func, Role::Value));
                    }
                    return false;
                }
                default:
                    return false;
            }
        }

        /**
         * True when every plain assignment to `name` in the scope produces a
         * str. A site such as `s = s.strip()` counts when its receiver is the
         * name itself, so conflicting-but-all-string bindings still qualify.
         */
        bool bound_only_to_strings(const SyntaxTree& tree, const frontend::SemanticModel& semantics,
                                   const std::string& name, const std::size_t scope) {
            const frontend::Symbol str{frontend::SymbolKind::Instance, "builtins.str"};
            bool any = false;
            for (const frontend::Binding& site : semantics.sites(name, scope)) {
                if (site.kind == BindingKind::AugAssign) {
                    continue;
                }
                if (site.kind != BindingKind::Assign && site.kind != BindingKind::AnnAssign) {
                    return false;
                }
                const NodeId value = site.value;
                if (value == kNoNode) {
                    return false;
                }
                bool is_str = is_string_expression(tree, value) || semantics.evaluate(tree, value) == str;
                if (!is_str && tree.node(value).kind == NodeKind::Call) {
                    const NodeId func = tree.first(value, Role::Func);
                    const Node& f = tree.node(func);
                    if (f.kind == NodeKind::Attribute && frontend::is_str_method(f.name)) {
                        const NodeId receiver = tree.first(func, Role::Value);
                        const Node& r = tree.node(receiver);
                        is_str = (r.kind == NodeKind::Name && r.name == name) ||
                                 is_string_expression(tree, receiver) || semantics.evaluate(tree, receiver) == str;
                    }
                }
                if (!is_str) {
                    return false;
                }
                any = true;
            }
            return any;
        }

        bool operator_binding(const BindingKind kind) {
            return kind == BindingKind::Param || kind == BindingKind::Import ||
                   kind == BindingKind::Def || kind == BindingKind::Class;
        }

    }  // namespace

    std::string decorator_name(const SyntaxTree& tree, const NodeId decorator) {
        const Node& n = tree.node(decorator);
        if (n.kind == NodeKind::Name) {
            return n.name;
        }
        if (n.kind == NodeKind::Call) {
            const NodeId func = tree.first(decorator, Role::Func);
            if (tree.node(func).kind == NodeKind::Name) {
                return tree.node(func).name;
            }
            if (tree.node(func).kind == NodeKind::Attribute) {
                return frontend::unparse(tree, func);
            }
        }
        return frontend::unparse(tree, decorator);
    }

    std::optional<std::string> docstring(const SyntaxTree& tree, const NodeId owner) {
        const NodeId first = tree.first(owner, Role::Body);
        if (first == kNoNode || tree.node(first).kind != NodeKind::ExprStmt) {
            return std::nullopt;
        }
        const NodeId value = tree.first(first, Role::Value);
        const Node& v = tree.node(value);
        if (v.kind != NodeKind::Constant || v.constant != ConstantKind::String) {
            return std::nullopt;
        }
        return v.value;
    }

    std::vector<FunctionInfo> extract_functions(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<FunctionInfo> functions;

        walk(tree, [&](const NodeId id, const WalkContext&) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::FunctionDef) {
                return;
            }
            FunctionInfo info;
            info.name = n.name;
            info.line = n.line;
            info.end_line = std::max(n.line, n.end_line);
            info.is_async = n.is_async;
            for (const NodeId decorator : tree.all(id, Role::Decorator)) {
                info.decorators.push_back(decorator_name(tree, decorator));
            }
            for (const NodeId param : tree.all(id, Role::Parameter)) {
                const Node& p = tree.node(param);
                info.parameters.push_back(p.name);
                if (const NodeId annotation = tree.first(param, Role::Annotation); annotation != kNoNode) {
                    info.inferred_types[p.name] = frontend::unparse(tree, annotation);
                }
            }
            if (const NodeId returns = tree.first(id, Role::Returns); returns != kNoNode) {
                info.return_annotation = frontend::unparse(tree, returns);
            }
            info.docstring = docstring(tree, id);

            if (const auto scope = module.semantics.scope_opened_by(id)) {
                for (const auto& [name, symbol] : module.semantics.scope(*scope).symbols) {
                    if (symbol.kind == frontend::SymbolKind::Instance && info.inferred_types.count(name) == 0) {
                        info.inferred_types[name] = symbol.qualified_name;
                    }
                }
            }
            functions.push_back(std::move(info));
        });
        return functions;
    }

    std::vector<LoopInfo> extract_loops(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<LoopInfo> loops;
        std::unordered_map<NodeId, std::size_t> index_of;

        walk(tree, [&](const NodeId id, const WalkContext& ctx) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::For && n.kind != NodeKind::While && n.kind != NodeKind::Comprehension) {
                return;
            }
            LoopInfo info;
            info.kind = n.kind == NodeKind::While ? LoopKind::While : LoopKind::For;
            info.line = n.line;
            info.end_line = std::max(n.line, n.end_line);
            info.parent_function = ctx.function();
            info.nesting_level = ctx.loop_depth;
            info.is_in_async_function = ctx.in_async;
            info.is_async = n.is_async;
            info.is_comprehension = n.kind == NodeKind::Comprehension;
            if (const auto parent = ctx.innermost_loop()) {
                if (const auto it = index_of.find(*parent); it != index_of.end()) {
                    info.parent_loop = it->second;
                }
            }
            index_of[id] = loops.size();
            loops.push_back(std::move(info));
        });
        return loops;
    }

    std::vector<ImportInfo> extract_imports(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<ImportInfo> imports;

        walk(tree, [&](const NodeId id, const WalkContext&) {
            const Node& n = tree.node(id);
            if (n.kind == NodeKind::Import) {
                for (const NodeId alias : tree.all(id, Role::Alias)) {
                    const Node& a = tree.node(alias);
                    ImportInfo info;
                    info.module = a.name;
                    info.names.push_back(a.name);
                    info.line = n.line;
                    if (!a.text.empty()) {
                        info.aliases[a.name] = a.text;
                    }
                    info.resolved_module = a.name;
                    imports.push_back(std::move(info));
                }
            } else if (n.kind == NodeKind::ImportFrom) {
                ImportInfo info;
                info.module = n.text;
                info.line = n.line;
                info.is_from_import = true;
                for (const NodeId alias : tree.all(id, Role::Alias)) {
                    const Node& a = tree.node(alias);
                    info.names.push_back(a.name);
                    if (!a.text.empty()) {
                        info.aliases[a.name] = a.text;
                    }
                }
                if (n.text.empty() || n.text.front() != '.') {
                    info.resolved_module = n.text;
                }
                imports.push_back(std::move(info));
            }
        });
        return imports;
    }

    std::vector<CallInfo> extract_calls(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<CallInfo> calls;

        walk(tree, [&](const NodeId id, const WalkContext& ctx) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::Call) {
                return;
            }
            const NodeId func = tree.first(id, Role::Func);
            const NodeKind func_kind = tree.node(func).kind;
            if (func_kind != NodeKind::Name && func_kind != NodeKind::Attribute) {
                return;
            }
            CallInfo info;
            info.function_name = frontend::unparse(tree, func);
            info.line = n.line;
            info.parent_function = ctx.function();
            info.is_in_loop = ctx.in_loop();
            info.is_in_async_function = ctx.in_async;
            info.resolved_name = module.semantics.resolve_callee(tree, id);
            calls.push_back(std::move(info));
        });
        return calls;
    }

    std::vector<ClassInfo> extract_classes(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<ClassInfo> classes;

        walk(tree, [&](const NodeId id, const WalkContext&) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::ClassDef) {
                return;
            }
            ClassInfo info;
            info.name = n.name;
            info.line = n.line;
            info.end_line = std::max(n.line, n.end_line);
            for (const NodeId base : tree.all(id, Role::Base)) {
                info.bases.push_back(frontend::unparse(tree, base));
            }
            for (const NodeId decorator : tree.all(id, Role::Decorator)) {
                info.decorators.push_back(decorator_name(tree, decorator));
            }
            for (const NodeId stmt : tree.all(id, Role::Body)) {
                if (tree.node(stmt).kind == NodeKind::FunctionDef) {
                    info.methods.push_back(tree.node(stmt).name);
                }
            }
            info.docstring = docstring(tree, id);
            classes.push_back(std::move(info));
        });
        return classes;
    }

    std::vector<AugAssignInfo> extract_augmented_assignments(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        const frontend::SemanticModel& semantics = module.semantics;
        std::vector<AugAssignInfo> result;

        walk(tree, [&](const NodeId id, const WalkContext& ctx) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::AugAssign) {
                return;
            }
            const NodeId target = tree.first(id, Role::Target);
            const NodeId value = tree.first(id, Role::Value);
            const Node& t = tree.node(target);

            AugAssignInfo info;
            info.target = frontend::unparse(tree, target);
            info.op = n.text;
            info.line = n.line;
            info.end_line = std::max(n.line, n.end_line);
            info.parent_function = ctx.function();
            info.loop_nesting = ctx.loop_depth;

            const frontend::Symbol str{frontend::SymbolKind::Instance, "builtins.str"};
            info.is_string_operation = is_string_expression(tree, value) || semantics.evaluate(tree, value) == str;

            std::optional<NodeId> loop = ctx.innermost_loop();
            if (loop) {
                info.loop_line = tree.node(*loop).line;
            }

            if (t.kind != NodeKind::Name) {
                // Attribute and subscript targets outlive any single iteration.
                info.target_bound_outside_loop = loop.has_value();
                result.push_back(std::move(info));
                return;
            }

            const std::size_t scope = semantics.scope_of(target);
            if (semantics.lookup(t.name, scope) == str ||
                bound_only_to_strings(tree, semantics, t.name, scope)) {
                info.is_string_operation = true;
            }

            if (loop) {
                const Node& l = tree.node(*loop);
                const frontend::Scope& s = semantics.scope(scope);
                const auto defining = semantics.defining_scope(t.name, scope);
                if (s.globals.count(t.name) != 0 || s.nonlocals.count(t.name) != 0 ||
                    (defining && *defining != scope)) {
                    info.target_bound_outside_loop = true;
                } else {
                    for (const frontend::Binding& site : semantics.sites(t.name, scope)) {
                        if (site.kind == BindingKind::AugAssign) {
                            continue;
                        }
                        if (operator_binding(site.kind) || site.line < l.line || site.line > l.end_line) {
                            info.target_bound_outside_loop = true;
                            break;
                        }
                    }
                }
            }
            result.push_back(std::move(info));
        });
        return result;
    }

    std::vector<TryInfo> extract_try_statements(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<TryInfo> result;

        walk(tree, [&](const NodeId id, const WalkContext& ctx) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::Try) {
                return;
            }
            TryInfo info;
            info.line = n.line;
            info.end_line = std::max(n.line, n.end_line);
            info.parent_function = ctx.function();
            info.is_in_loop = ctx.in_loop();
            result.push_back(std::move(info));
        });
        return result;
    }

    std::vector<GlobalInfo> extract_global_statements(const frontend::ParsedModule& module) {
        const SyntaxTree& tree = module.tree;
        std::vector<GlobalInfo> result;

        walk(tree, [&](const NodeId id, const WalkContext& ctx) {
            const Node& n = tree.node(id);
            if (n.kind != NodeKind::Global) {
                return;
            }
            GlobalInfo info;
            for (const NodeId alias : tree.all(id, Role::Alias)) {
                info.names.push_back(tree.node(alias).name);
            }
            info.line = n.line;
            info.parent_function = ctx.function();
            result.push_back(std::move(info));
        });
        return result;
    }

    AnalysisResult analyze(const frontend::ParsedModule& module) {
        AnalysisResult result;
        result.functions = extract_functions(module);
        result.loops = extract_loops(module);
        result.imports = extract_imports(module);
        result.calls = extract_calls(module);
        result.classes = extract_classes(module);
        result.augmented_assignments = extract_augmented_assignments(module);
        result.try_statements = extract_try_statements(module);
        result.global_statements = extract_global_statements(module);
        return result;
    }
}  // namespace ppa::analysis
