//
// Created by gregorian-rayne on 10/13/26.
//

#include "ppa/frontend/syntax_tree.hpp"

#include <stdexcept>

namespace ppa::frontend
{
    const char* to_string(const NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::Module:        return "Module";
            case NodeKind::FunctionDef:   return "FunctionDef";
            case NodeKind::ClassDef:      return "ClassDef";
            case NodeKind::Return:        return "Return";
            case NodeKind::Delete:        return "Delete";
            case NodeKind::Assign:        return "Assign";
            case NodeKind::AugAssign:     return "AugAssign";
            case NodeKind::AnnAssign:     return "AnnAssign";
            case NodeKind::For:           return "For";
            case NodeKind::While:         return "While";
            case NodeKind::If:            return "If";
            case NodeKind::With:          return "With";
            case NodeKind::Match:         return "Match";
            case NodeKind::Raise:         return "Raise";
            case NodeKind::Try:           return "Try";
            case NodeKind::Assert:        return "Assert";
            case NodeKind::Import:        return "Import";
            case NodeKind::ImportFrom:    return "ImportFrom";
            case NodeKind::Global:        return "Global";
            case NodeKind::Nonlocal:      return "Nonlocal";
            case NodeKind::ExprStmt:      return "Expr";
            case NodeKind::Pass:          return "Pass";
            case NodeKind::Break:         return "Break";
            case NodeKind::Continue:      return "Continue";
            case NodeKind::TypeAlias:     return "TypeAlias";
            case NodeKind::Parameter:     return "Parameter";
            case NodeKind::Keyword:       return "Keyword";
            case NodeKind::Alias:         return "Alias";
            case NodeKind::ExceptHandler: return "ExceptHandler";
            case NodeKind::WithItem:      return "WithItem";
            case NodeKind::MatchCase:     return "MatchCase";
            case NodeKind::Comprehension: return "Comprehension";
            case NodeKind::BoolOp:        return "BoolOp";
            case NodeKind::NamedExpr:     return "NamedExpr";
            case NodeKind::BinOp:         return "BinOp";
            case NodeKind::UnaryOp:       return "UnaryOp";
            case NodeKind::Compare:       return "Compare";
            case NodeKind::Lambda:        return "Lambda";
            case NodeKind::IfExp:         return "IfExp";
            case NodeKind::Dict:          return "Dict";
            case NodeKind::Set:           return "Set";
            case NodeKind::List:          return "List";
            case NodeKind::Tuple:         return "Tuple";
            case NodeKind::ListComp:      return "ListComp";
            case NodeKind::SetComp:       return "SetComp";
            case NodeKind::DictComp:      return "DictComp";
            case NodeKind::GeneratorExp:  return "GeneratorExp";
            case NodeKind::Await:         return "Await";
            case NodeKind::Yield:         return "Yield";
            case NodeKind::YieldFrom:     return "YieldFrom";
            case NodeKind::Call:          return "Call";
            case NodeKind::Constant:      return "Constant";
            case NodeKind::JoinedStr:     return "JoinedStr";
            case NodeKind::Attribute:     return "Attribute";
            case NodeKind::Subscript:     return "Subscript";
            case NodeKind::Slice:         return "Slice";
            case NodeKind::Starred:       return "Starred";
            case NodeKind::Name:          return "Name";
        }
        return "Unknown";
    }

    NodeId SyntaxTree::add(Node node) {
        if (nodes_.size() >= kNoNode) {
            throw std::length_error("syntax tree is full");
        }
        nodes_.push_back(std::move(node));
        return static_cast<NodeId>(nodes_.size() - 1);
    }

    void SyntaxTree::truncate(const std::size_t size) {
        if (size < nodes_.size()) {
            nodes_.resize(size);
        }
    }

    NodeId SyntaxTree::first(const NodeId id, const Role role) const {
        for (const auto& child : node(id).children) {
            if (child.role == role) {
                return child.id;
            }
        }
        return kNoNode;
    }

    std::vector<NodeId> SyntaxTree::all(const NodeId id, const Role role) const {
        std::vector<NodeId> result;
        for (const auto& child : node(id).children) {
            if (child.role == role) {
                result.push_back(child.id);
            }
        }
        return result;
    }

    // ============================================================================
    // Unparser
    // ============================================================================

    namespace {

        class Unparser {
        public:
            explicit Unparser(const SyntaxTree& tree) : tree_(tree) {}

            std::string expr(const NodeId id) const {
                if (id == kNoNode) {
                    return "";
                }
                const Node& n = tree_.node(id);
                std::string text = render(id);
                if (n.parenthesized && needs_parens_when_grouped(n.kind)) {
                    return "(" + text + ")";
                }
                return text;
            }

        private:
            static bool needs_parens_when_grouped(const NodeKind kind) {
                switch (kind) {
                    case NodeKind::BoolOp:
                    case NodeKind::NamedExpr:
                    case NodeKind::BinOp:
                    case NodeKind::UnaryOp:
                    case NodeKind::Compare:
                    case NodeKind::Lambda:
                    case NodeKind::IfExp:
                    case NodeKind::Await:
                    case NodeKind::Yield:
                    case NodeKind::YieldFrom:
                        return true;
                    default:
                        return false;
                }
            }

            std::string join_role(const NodeId id, const Role role, const char* separator = ", ") const {
                std::string out;
                bool first = true;
                for (const auto& child : tree_.node(id).children) {
                    if (child.role != role) {
                        continue;
                    }
                    if (!first) {
                        out += separator;
                    }
                    out += expr(child.id);
                    first = false;
                }
                return out;
            }

            std::string parameters(const NodeId id) const {
                std::string out;
                bool first = true;
                for (const auto& child : tree_.node(id).children) {
                    if (child.role != Role::Parameter) {
                        continue;
                    }
                    const Node& param = tree_.node(child.id);
                    if (!first) {
                        out += ", ";
                    }
                    out += param.text + param.name;
                    if (const NodeId def = tree_.first(child.id, Role::Default); def != kNoNode) {
                        out += "=" + expr(def);
                    }
                    first = false;
                }
                return out;
            }

            std::string generators(const NodeId id) const {
                std::string out;
                for (const auto& child : tree_.node(id).children) {
                    if (child.role != Role::Generator) {
                        continue;
                    }
                    const Node& gen = tree_.node(child.id);
                    out += gen.is_async ? " async for " : " for ";
                    out += expr(tree_.first(child.id, Role::Target));
                    out += " in ";
                    out += expr(tree_.first(child.id, Role::Iter));
                    for (const NodeId test : tree_.all(child.id, Role::Test)) {
                        out += " if " + expr(test);
                    }
                }
                return out;
            }

            std::string call_arguments(const NodeId id) const {
                std::string out;
                bool first = true;
                for (const auto& child : tree_.node(id).children) {
                    if (child.role != Role::Arg && child.role != Role::Keyword) {
                        continue;
                    }
                    if (!first) {
                        out += ", ";
                    }
                    out += expr(child.id);
                    first = false;
                }
                return out;
            }

            std::string tuple_body(const NodeId id) const {
                const auto elements = tree_.all(id, Role::Element);
                std::string out = join_role(id, Role::Element);
                if (elements.size() == 1) {
                    out += ",";
                }
                return out;
            }

            std::string render(const NodeId id) const {
                const Node& n = tree_.node(id);
                switch (n.kind) {
                    case NodeKind::Name:
                        return n.name;
                    case NodeKind::Constant:
                    case NodeKind::JoinedStr:
                        return n.text;
                    case NodeKind::Attribute: {
                        return expr(tree_.first(id, Role::Value)) + "." + n.name;
                    }
                    case NodeKind::Call:
                        return expr(tree_.first(id, Role::Func)) + "(" + call_arguments(id) + ")";
                    case NodeKind::Keyword: {
                        const std::string value = expr(tree_.first(id, Role::Value));
                        return n.name.empty() ? "**" + value : n.name + "=" + value;
                    }
                    case NodeKind::Subscript: {
                        const NodeId index = tree_.first(id, Role::Index);
                        std::string inner;
                        if (index != kNoNode && tree_.node(index).kind == NodeKind::Tuple &&
                            !tree_.node(index).parenthesized) {
                            inner = tuple_body(index);
                        } else {
                            inner = expr(index);
                        }
                        return expr(tree_.first(id, Role::Value)) + "[" + inner + "]";
                    }
                    case NodeKind::Slice: {
                        std::string out = expr(tree_.first(id, Role::Lower)) + ":" +
                                          expr(tree_.first(id, Role::Upper));
                        if (const NodeId step = tree_.first(id, Role::Step); step != kNoNode) {
                            out += ":" + expr(step);
                        }
                        return out;
                    }
                    case NodeKind::BinOp:
                    case NodeKind::Compare: {
                        const auto operands = tree_.all(id, Role::Operand);
                        if (operands.size() != 2) {
                            return n.text;
                        }
                        return expr(operands[0]) + " " + n.text + " " + expr(operands[1]);
                    }
                    case NodeKind::BoolOp:
                        return join_role(id, Role::Operand, n.text == "and" ? " and " : " or ");
                    case NodeKind::UnaryOp: {
                        const std::string operand = expr(tree_.first(id, Role::Operand));
                        return n.text == "not" ? "not " + operand : n.text + operand;
                    }
                    case NodeKind::IfExp:
                        return expr(tree_.first(id, Role::Body)) + " if " +
                               expr(tree_.first(id, Role::Test)) + " else " +
                               expr(tree_.first(id, Role::OrElse));
                    case NodeKind::Lambda: {
                        const std::string params = parameters(id);
                        return "lambda" + (params.empty() ? std::string() : " " + params) + ": " +
                               expr(tree_.first(id, Role::Body));
                    }
                    case NodeKind::NamedExpr:
                        return expr(tree_.first(id, Role::Target)) + " := " + expr(tree_.first(id, Role::Value));
                    case NodeKind::Await:
                        return "await " + expr(tree_.first(id, Role::Value));
                    case NodeKind::Yield: {
                        const NodeId value = tree_.first(id, Role::Value);
                        return value == kNoNode ? "yield" : "yield " + expr(value);
                    }
                    case NodeKind::YieldFrom:
                        return "yield from " + expr(tree_.first(id, Role::Value));
                    case NodeKind::Starred:
                        return (n.text.empty() ? "*" : n.text) + expr(tree_.first(id, Role::Value));
                    case NodeKind::List:
                        return "[" + join_role(id, Role::Element) + "]";
                    case NodeKind::Set:
                        return "{" + join_role(id, Role::Element) + "}";
                    case NodeKind::Tuple:
                        return "(" + tuple_body(id) + ")";
                    case NodeKind::Dict: {
                        std::string out = "{";
                        bool first = true;
                        NodeId pending_key = kNoNode;
                        for (const auto& child : n.children) {
                            if (child.role == Role::Key) {
                                pending_key = child.id;
                                continue;
                            }
                            if (!first) {
                                out += ", ";
                            }
                            if (pending_key != kNoNode) {
                                out += expr(pending_key) + ": ";
                                pending_key = kNoNode;
                            }
                            out += expr(child.id);
                            first = false;
                        }
                        return out + "}";
                    }
                    case NodeKind::ListComp:
                        return "[" + expr(tree_.first(id, Role::Element)) + generators(id) + "]";
                    case NodeKind::SetComp:
                        return "{" + expr(tree_.first(id, Role::Element)) + generators(id) + "}";
                    case NodeKind::GeneratorExp:
                        return "(" + expr(tree_.first(id, Role::Element)) + generators(id) + ")";
                    case NodeKind::DictComp:
                        return "{" + expr(tree_.first(id, Role::Key)) + ": " +
                               expr(tree_.first(id, Role::Value)) + generators(id) + "}";
                    default:
                        return std::string("<") + to_string(n.kind) + ">";
                }
            }

            const SyntaxTree& tree_;
        };

    }  // namespace

    std::string unparse(const SyntaxTree& tree, const NodeId id) {
        return Unparser(tree).expr(id);
    }
}  // namespace ppa::frontend
