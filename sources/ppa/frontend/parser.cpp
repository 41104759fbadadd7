//
// Created by gregorian-rayne on 10/13/26.
//

#include "ppa/frontend/parser.hpp"
#include "ppa/frontend/lexer.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ppa::frontend
{
    namespace {

        const std::unordered_set<std::string_view>& hard_keywords() {
            static const std::unordered_set<std::string_view> keywords = {
                "False", "None", "True", "and", "as", "assert", "async", "await",
                "break", "class", "continue", "def", "del", "elif", "else", "except",
                "finally", "for", "from", "global", "if", "import", "in", "is",
                "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
                "while", "with", "yield"
            };
            return keywords;
        }

        constexpr std::array<std::string_view, 13> kAugmentedOps = {
            "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="
        };

        constexpr std::size_t kMaxNesting = 200;

        // Left-deep chains (a + a + ..., a.b.b..., f()()...) are built
        // iteratively, so only the finished tree shows how deep they go.
        constexpr std::size_t kMaxTreeDepth = 2500;

        bool is_augmented_op(const Token& tok) {
            if (tok.kind != TokenKind::Operator) {
                return false;
            }
            for (const auto op : kAugmentedOps) {
                if (tok.text == op) {
                    return true;
                }
            }
            return false;
        }

        /// Length of the prefix plus opening quotes of a string token.
        std::size_t string_opening_length(const Token& tok) {
            const std::size_t quote_pos = tok.prefix.size();
            const char quote = tok.text[quote_pos];
            const bool triple = tok.text.size() >= quote_pos + 6 &&
                                tok.text[quote_pos + 1] == quote && tok.text[quote_pos + 2] == quote;
            return quote_pos + (triple ? 3 : 1);
        }

        std::string_view string_body(const Token& tok) {
            const std::size_t open = string_opening_length(tok);
            const std::size_t quotes = open - tok.prefix.size();
            return std::string_view(tok.text).substr(open, tok.text.size() - open - quotes);
        }

        bool is_octal(const char c) {
            return c >= '0' && c <= '7';
        }

        int hex_value(const char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        /**
         * Decodes backslash escapes of a non-raw literal body. \N{...}, \u
         * and \U sequences are kept as written.
         */
        std::string decode_escapes(const std::string_view body) {
            std::string out;
            out.reserve(body.size());
            for (std::size_t i = 0; i < body.size(); ++i) {
                const char c = body[i];
                if (c != '\\' || i + 1 >= body.size()) {
                    out += c;
                    continue;
                }
                const char e = body[++i];
                switch (e) {
                    case '\n': break;
                    case 'n':  out += '\n'; break;
                    case 't':  out += '\t'; break;
                    case 'r':  out += '\r'; break;
                    case 'a':  out += '\a'; break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'v':  out += '\v'; break;
                    case '\\': out += '\\'; break;
                    case '\'': out += '\''; break;
                    case '"':  out += '"'; break;
                    case 'x': {
                        if (i + 2 < body.size() && hex_value(body[i + 1]) >= 0 && hex_value(body[i + 2]) >= 0) {
                            out += static_cast<char>(hex_value(body[i + 1]) * 16 + hex_value(body[i + 2]));
                            i += 2;
                        } else {
                            out += "\\x";
                        }
                        break;
                    }
                    default:
                        if (is_octal(e)) {
                            int value = e - '0';
                            for (int k = 0; k < 2 && i + 1 < body.size() && is_octal(body[i + 1]); ++k) {
                                value = value * 8 + (body[++i] - '0');
                            }
                            out += static_cast<char>(value & 0xFF);
                        } else {
                            out += '\\';
                            out += e;
                        }
                        break;
                }
            }
            return out;
        }

        std::string decode_string(const Token& tok) {
            const std::string_view body = string_body(tok);
            if (tok.prefix.find('r') != std::string::npos) {
                return std::string(body);
            }
            return decode_escapes(body);
        }

        /// Replacement field of an f-string: expression text and its offset
        /// inside the token spelling.
        struct FieldText {
            std::string expression;
            std::size_t offset;
        };

        class FStringScanner {
        public:
            FStringScanner(const Token& tok, std::vector<FieldText>& fields)
                : tok_(tok)
                , body_(string_body(tok))
                , base_(string_opening_length(tok))
                , raw_(tok.prefix.find('r') != std::string::npos)
                , fields_(fields) {}

            void scan() {
                std::size_t i = 0;
                while (i < body_.size()) {
                    const char c = body_[i];
                    if (c == '{') {
                        if (i + 1 < body_.size() && body_[i + 1] == '{') {
                            i += 2;
                            continue;
                        }
                        i = field(i + 1);
                    } else if (c == '}') {
                        i += (i + 1 < body_.size() && body_[i + 1] == '}') ? 2 : 1;
                    } else if (c == '\\' && !raw_) {
                        if (i + 2 < body_.size() && body_[i + 1] == 'N' && body_[i + 2] == '{') {
                            const std::size_t close = body_.find('}', i);
                            i = close == std::string_view::npos ? body_.size() : close + 1;
                        } else {
                            i += 2;
                        }
                    } else {
                        ++i;
                    }
                }
            }

        private:
            [[noreturn]] void fail(const std::string& message) const {
                throw SyntaxError("f-string: " + message, tok_.line, tok_.column);
            }

            std::size_t skip_quoted(std::size_t k) const {
                const char quote = body_[k];
                const bool triple = k + 2 < body_.size() && body_[k + 1] == quote && body_[k + 2] == quote;
                k += triple ? 3 : 1;
                while (k < body_.size()) {
                    if (body_[k] == '\\') {
                        k += 2;
                        continue;
                    }
                    if (body_[k] == quote) {
                        if (!triple) {
                            return k + 1;
                        }
                        if (k + 2 < body_.size() && body_[k + 1] == quote && body_[k + 2] == quote) {
                            return k + 3;
                        }
                    }
                    ++k;
                }
                fail("unterminated string");
            }

            bool ends_self_documenting(std::size_t k) const {
                ++k;
                while (k < body_.size() && (body_[k] == ' ' || body_[k] == '\t')) {
                    ++k;
                }
                return k < body_.size() && (body_[k] == '}' || body_[k] == '!' || body_[k] == ':');
            }

            std::size_t expression_end(const std::size_t start) const {
                int depth = 0;
                std::size_t k = start;
                while (k < body_.size()) {
                    const char ch = body_[k];
                    if (ch == '(' || ch == '[' || ch == '{') {
                        ++depth;
                    } else if (ch == ')' || ch == ']' || ch == '}') {
                        if (depth == 0) {
                            if (ch != '}') {
                                fail(std::string("unmatched '") + ch + "'");
                            }
                            return k;
                        }
                        --depth;
                    } else if (ch == '"' || ch == '\'') {
                        k = skip_quoted(k);
                        continue;
                    } else if (depth == 0 && ch == '!' && (k + 1 >= body_.size() || body_[k + 1] != '=')) {
                        return k;
                    } else if (depth == 0 && ch == ':') {
                        return k;
                    } else if (depth == 0 && ch == '=' && (k + 1 >= body_.size() || body_[k + 1] != '=') &&
                               k > start && std::string_view("=!<>").find(body_[k - 1]) == std::string_view::npos &&
                               ends_self_documenting(k)) {
                        return k;
                    }
                    ++k;
                }
                fail("expecting '}'");
            }

            /// Parses one replacement field starting after its '{'; returns
            /// the index after the closing '}'.
            std::size_t field(const std::size_t start) {
                const std::size_t end = expression_end(start);
                fields_.push_back({std::string(body_.substr(start, end - start)), base_ + start});

                std::size_t k = end;
                if (body_[k] == '=') {
                    ++k;
                    while (k < body_.size() && (body_[k] == ' ' || body_[k] == '\t')) {
                        ++k;
                    }
                }
                if (k < body_.size() && body_[k] == '!') {
                    k += 2;
                }
                if (k < body_.size() && body_[k] == ':') {
                    ++k;
                    while (k < body_.size() && body_[k] != '}') {
                        if (body_[k] == '{') {
                            k = field(k + 1);
                        } else {
                            ++k;
                        }
                    }
                }
                if (k >= body_.size() || body_[k] != '}') {
                    fail("expecting '}'");
                }
                return k + 1;
            }

            const Token& tok_;
            std::string_view body_;
            std::size_t base_;
            bool raw_;
            std::vector<FieldText>& fields_;
        };

        class Parser {
        public:
            Parser(std::vector<Token> tokens, SyntaxTree& tree)
                : tokens_(std::move(tokens))
                , tree_(tree) {}

            NodeId parse_module() {
                Node module;
                module.kind = NodeKind::Module;
                module.line = 1;
                const NodeId root = tree_.add(std::move(module));
                while (!at(TokenKind::EndOfFile)) {
                    parse_statement_into(root, Role::Body);
                }
                tree_.node(root).end_line = last_end_line_ == 0 ? 1 : last_end_line_;
                return root;
            }

            /// Parses "(expression)" produced for an f-string field.
            NodeId parse_fstring_field() {
                if (current().is_op("(") && peek(1).is_op(")")) {
                    fail(current(), "f-string: valid expression required before '}'");
                }
                advance();
                NodeId expr;
                if (is_keyword("yield")) {
                    expr = parse_yield();
                } else {
                    expr = parse_star_expressions();
                }
                expect_op(")");
                if (at(TokenKind::Newline)) {
                    advance();
                }
                if (!at(TokenKind::EndOfFile)) {
                    fail(current(), "f-string: invalid syntax");
                }
                return expr;
            }

        private:
            // ----------------------------------------------------------------
            // Token access
            // ----------------------------------------------------------------

            const Token& current() const { return tokens_[pos_]; }

            const Token& peek(const std::size_t ahead) const {
                const std::size_t index = pos_ + ahead;
                return index < tokens_.size() ? tokens_[index] : tokens_.back();
            }

            bool at(const TokenKind kind) const { return current().kind == kind; }

            const Token& advance() {
                const Token& tok = tokens_[pos_];
                if (tok.kind != TokenKind::Newline && tok.kind != TokenKind::Indent &&
                    tok.kind != TokenKind::Dedent && tok.kind != TokenKind::EndOfFile) {
                    last_end_line_ = tok.end_line;
                }
                if (pos_ + 1 < tokens_.size()) {
                    ++pos_;
                }
                return tok;
            }

            bool check_op(const std::string_view op) const { return current().is_op(op); }

            bool is_keyword(const std::string_view word) const { return current().is_name(word); }

            bool accept_op(const std::string_view op) {
                if (check_op(op)) {
                    advance();
                    return true;
                }
                return false;
            }

            bool accept_keyword(const std::string_view word) {
                if (is_keyword(word)) {
                    advance();
                    return true;
                }
                return false;
            }

            void expect_op(const std::string_view op) {
                if (!accept_op(op)) {
                    if (op == ":") {
                        fail(current(), "expected ':'");
                    }
                    fail(current(), "invalid syntax");
                }
            }

            void expect_keyword(const std::string_view word) {
                if (!accept_keyword(word)) {
                    fail(current(), "invalid syntax");
                }
            }

            static bool is_identifier(const Token& tok) {
                return tok.kind == TokenKind::Name && hard_keywords().count(tok.text) == 0;
            }

            std::string expect_identifier() {
                if (!is_identifier(current())) {
                    fail(current(), "invalid syntax");
                }
                return advance().text;
            }

            void expect_newline() {
                if (at(TokenKind::Newline)) {
                    advance();
                    return;
                }
                if (at(TokenKind::EndOfFile)) {
                    return;
                }
                fail(current(), "invalid syntax");
            }

            [[noreturn]] static void fail(const Token& tok, const std::string& message) {
                throw SyntaxError(message, tok.line, tok.column);
            }

            // ----------------------------------------------------------------
            // Node construction
            // ----------------------------------------------------------------

            NodeId make(const NodeKind kind, const Token& at_token) {
                Node node;
                node.kind = kind;
                node.line = at_token.line;
                node.column = at_token.column;
                node.end_line = at_token.end_line;
                return tree_.add(std::move(node));
            }

            /// Creates a node positioned at an existing node.
            NodeId make_at(const NodeKind kind, const NodeId position) {
                Node node;
                node.kind = kind;
                node.line = tree_.node(position).line;
                node.column = tree_.node(position).column;
                node.end_line = tree_.node(position).end_line;
                return tree_.add(std::move(node));
            }

            void attach(const NodeId parent, const Role role, const NodeId child) {
                tree_.node(parent).children.push_back({role, child});
            }

            void close(const NodeId id) {
                Node& node = tree_.node(id);
                if (last_end_line_ > node.end_line) {
                    node.end_line = last_end_line_;
                }
            }

            struct DepthGuard {
                DepthGuard(Parser& parser, const Token& tok) : parser_(parser) {
                    if (parser_.depth_ >= kMaxNesting) {
                        fail(tok, "too many nested parentheses");
                    }
                    ++parser_.depth_;
                }
                ~DepthGuard() { --parser_.depth_; }
                DepthGuard(const DepthGuard&) = delete;
                DepthGuard& operator=(const DepthGuard&) = delete;

                Parser& parser_;
            };

            void validate_target(const NodeId id, const bool allow_unpacking) {
                const Node& node = tree_.node(id);
                switch (node.kind) {
                    case NodeKind::Name:
                    case NodeKind::Attribute:
                    case NodeKind::Subscript:
                        return;
                    case NodeKind::Starred:
                        if (allow_unpacking) {
                            validate_target(tree_.first(id, Role::Value), true);
                            return;
                        }
                        break;
                    case NodeKind::Tuple:
                    case NodeKind::List:
                        if (allow_unpacking) {
                            for (const NodeId element : tree_.all(id, Role::Element)) {
                                validate_target(element, true);
                            }
                            return;
                        }
                        break;
                    default:
                        break;
                }
                throw SyntaxError(std::string("cannot assign to ") + describe(node.kind),
                                  node.line, node.column);
            }

            static const char* describe(const NodeKind kind) {
                switch (kind) {
                    case NodeKind::Call:     return "function call";
                    case NodeKind::Constant: return "literal";
                    case NodeKind::Tuple:    return "tuple";
                    case NodeKind::List:     return "list";
                    case NodeKind::Lambda:   return "lambda";
                    default:                 return "expression";
                }
            }

            // ----------------------------------------------------------------
            // Statements
            // ----------------------------------------------------------------

            void parse_statement_into(const NodeId parent, const Role role) {
                const Token& tok = current();
                DepthGuard guard(*this, tok);
                if (tok.kind == TokenKind::Newline) {
                    advance();
                    return;
                }
                if (tok.kind == TokenKind::Indent) {
                    fail(tok, "unexpected indent");
                }
                if (tok.kind == TokenKind::Dedent) {
                    fail(tok, "unindent does not match any outer indentation level");
                }
                if (const NodeId compound = parse_compound_statement(); compound != kNoNode) {
                    attach(parent, role, compound);
                    return;
                }
                parse_simple_statements(parent, role);
            }

            void parse_block(const NodeId parent, const Role role) {
                expect_op(":");
                if (at(TokenKind::Newline)) {
                    advance();
                    if (!at(TokenKind::Indent)) {
                        fail(current(), "expected an indented block");
                    }
                    advance();
                    while (!at(TokenKind::Dedent) && !at(TokenKind::EndOfFile)) {
                        parse_statement_into(parent, role);
                    }
                    if (at(TokenKind::Dedent)) {
                        advance();
                    }
                    return;
                }
                parse_simple_statements(parent, role);
            }

            void parse_simple_statements(const NodeId parent, const Role role) {
                while (true) {
                    attach(parent, role, parse_simple_statement());
                    if (!accept_op(";")) {
                        break;
                    }
                    if (at(TokenKind::Newline) || at(TokenKind::EndOfFile)) {
                        break;
                    }
                }
                expect_newline();
            }

            NodeId parse_compound_statement() {
                const Token& tok = current();
                if (tok.is_op("@")) {
                    return parse_decorated();
                }
                if (tok.kind != TokenKind::Name) {
                    return kNoNode;
                }
                if (tok.text == "def") {
                    return parse_function_def({}, false);
                }
                if (tok.text == "class") {
                    return parse_class_def({});
                }
                if (tok.text == "if") {
                    return parse_if();
                }
                if (tok.text == "while") {
                    return parse_while();
                }
                if (tok.text == "for") {
                    return parse_for(false);
                }
                if (tok.text == "try") {
                    return parse_try();
                }
                if (tok.text == "with") {
                    return parse_with(false);
                }
                if (tok.text == "async") {
                    return parse_async();
                }
                if (tok.text == "match") {
                    return try_parse_match();
                }
                return kNoNode;
            }

            NodeId parse_async() {
                const Token& next = peek(1);
                if (next.is_name("def")) {
                    advance();
                    return parse_function_def({}, true);
                }
                if (next.is_name("for")) {
                    advance();
                    return parse_for(true);
                }
                if (next.is_name("with")) {
                    advance();
                    return parse_with(true);
                }
                fail(next, "invalid syntax");
            }

            NodeId parse_decorated() {
                std::vector<NodeId> decorators;
                while (accept_op("@")) {
                    decorators.push_back(parse_named_expression());
                    expect_newline();
                }
                if (is_keyword("def")) {
                    return parse_function_def(decorators, false);
                }
                if (is_keyword("async") && peek(1).is_name("def")) {
                    advance();
                    return parse_function_def(decorators, true);
                }
                if (is_keyword("class")) {
                    return parse_class_def(decorators);
                }
                fail(current(), "invalid syntax");
            }

            NodeId parse_function_def(const std::vector<NodeId>& decorators, const bool is_async) {
                const NodeId fn = make(NodeKind::FunctionDef, current());
                expect_keyword("def");
                tree_.node(fn).is_async = is_async;
                tree_.node(fn).name = expect_identifier();
                for (const NodeId decorator : decorators) {
                    attach(fn, Role::Decorator, decorator);
                }
                if (check_op("[")) {
                    skip_brackets();
                }
                expect_op("(");
                parse_parameters(fn, ")", true);
                expect_op(")");
                if (accept_op("->")) {
                    attach(fn, Role::Returns, parse_expression());
                }
                parse_block(fn, Role::Body);
                close(fn);
                return fn;
            }

            void parse_parameters(const NodeId owner, const std::string_view closing, const bool annotated) {
                while (!check_op(closing)) {
                    if (accept_op("/")) {
                        if (!accept_op(",")) {
                            break;
                        }
                        continue;
                    }
                    std::string marker;
                    if (accept_op("**")) {
                        marker = "**";
                    } else if (accept_op("*")) {
                        marker = "*";
                        if (check_op(",") || check_op(closing)) {
                            if (!accept_op(",")) {
                                break;
                            }
                            continue;
                        }
                    }
                    const NodeId param = make(NodeKind::Parameter, current());
                    tree_.node(param).name = expect_identifier();
                    tree_.node(param).text = marker;
                    if (annotated && accept_op(":")) {
                        attach(param, Role::Annotation,
                               marker == "*" && check_op("*") ? parse_star_expression() : parse_expression());
                    }
                    if (marker.empty() && accept_op("=")) {
                        attach(param, Role::Default, parse_expression());
                    }
                    close(param);
                    attach(owner, Role::Parameter, param);
                    if (!accept_op(",")) {
                        break;
                    }
                }
            }

            NodeId parse_class_def(const std::vector<NodeId>& decorators) {
                const NodeId cls = make(NodeKind::ClassDef, current());
                expect_keyword("class");
                tree_.node(cls).name = expect_identifier();
                for (const NodeId decorator : decorators) {
                    attach(cls, Role::Decorator, decorator);
                }
                if (check_op("[")) {
                    skip_brackets();
                }
                if (accept_op("(")) {
                    parse_call_arguments(cls, Role::Base);
                    expect_op(")");
                }
                parse_block(cls, Role::Body);
                close(cls);
                return cls;
            }

            NodeId parse_if() {
                const NodeId node = make(NodeKind::If, current());
                advance();
                attach(node, Role::Test, parse_named_expression());
                parse_block(node, Role::Body);
                if (is_keyword("elif")) {
                    attach(node, Role::OrElse, parse_if());
                } else if (accept_keyword("else")) {
                    parse_block(node, Role::OrElse);
                }
                close(node);
                return node;
            }

            NodeId parse_while() {
                const NodeId node = make(NodeKind::While, current());
                advance();
                attach(node, Role::Test, parse_named_expression());
                parse_block(node, Role::Body);
                if (accept_keyword("else")) {
                    parse_block(node, Role::OrElse);
                }
                close(node);
                return node;
            }

            NodeId parse_for(const bool is_async) {
                const NodeId node = make(NodeKind::For, current());
                expect_keyword("for");
                tree_.node(node).is_async = is_async;
                const NodeId target = parse_target_list();
                validate_target(target, true);
                attach(node, Role::Target, target);
                expect_keyword("in");
                attach(node, Role::Iter, parse_star_expressions());
                parse_block(node, Role::Body);
                if (accept_keyword("else")) {
                    parse_block(node, Role::OrElse);
                }
                close(node);
                return node;
            }

            NodeId parse_try() {
                const NodeId node = make(NodeKind::Try, current());
                advance();
                parse_block(node, Role::Body);
                bool has_handler = false;
                while (is_keyword("except")) {
                    const NodeId handler = make(NodeKind::ExceptHandler, current());
                    advance();
                    if (accept_op("*")) {
                        tree_.node(handler).text = "*";
                    }
                    if (!check_op(":")) {
                        attach(handler, Role::Test, parse_expression());
                        if (accept_op(",")) {
                            fail(current(), "multiple exception types must be parenthesized");
                        }
                        if (accept_keyword("as")) {
                            tree_.node(handler).name = expect_identifier();
                        }
                    }
                    parse_block(handler, Role::Body);
                    close(handler);
                    attach(node, Role::Handler, handler);
                    has_handler = true;
                }
                if (has_handler && accept_keyword("else")) {
                    parse_block(node, Role::OrElse);
                }
                bool has_finally = false;
                if (accept_keyword("finally")) {
                    parse_block(node, Role::FinalBody);
                    has_finally = true;
                }
                if (!has_handler && !has_finally) {
                    fail(current(), "expected 'except' or 'finally' block");
                }
                close(node);
                return node;
            }

            NodeId parse_with_item() {
                const NodeId item = make(NodeKind::WithItem, current());
                attach(item, Role::Value, parse_expression());
                if (accept_keyword("as")) {
                    const NodeId target = parse_star_target();
                    validate_target(target, true);
                    attach(item, Role::Target, target);
                }
                close(item);
                return item;
            }

            NodeId parse_with(const bool is_async) {
                const NodeId node = make(NodeKind::With, current());
                expect_keyword("with");
                tree_.node(node).is_async = is_async;

                bool parsed = false;
                if (check_op("(")) {
                    const std::size_t saved_pos = pos_;
                    const std::size_t saved_size = tree_.size();
                    const std::uint32_t saved_end = last_end_line_;
                    try {
                        advance();
                        std::vector<NodeId> items;
                        while (!check_op(")")) {
                            items.push_back(parse_with_item());
                            if (!accept_op(",")) {
                                break;
                            }
                        }
                        expect_op(")");
                        if (!check_op(":") || items.empty()) {
                            fail(current(), "invalid syntax");
                        }
                        for (const NodeId item : items) {
                            attach(node, Role::Item, item);
                        }
                        parsed = true;
                    } catch (const SyntaxError&) {
                        pos_ = saved_pos;
                        tree_.truncate(saved_size);
                        last_end_line_ = saved_end;
                    }
                }
                if (!parsed) {
                    do {
                        attach(node, Role::Item, parse_with_item());
                    } while (accept_op(","));
                }
                parse_block(node, Role::Body);
                close(node);
                return node;
            }

            /// "match" is a soft keyword: anything that does not look like a
            /// match statement is re-parsed as a simple statement.
            NodeId try_parse_match() {
                const std::size_t saved_pos = pos_;
                const std::size_t saved_size = tree_.size();
                const std::uint32_t saved_end = last_end_line_;

                NodeId node = kNoNode;
                try {
                    node = make(NodeKind::Match, current());
                    advance();
                    attach(node, Role::Value, parse_star_named_expressions());
                    expect_op(":");
                    if (!at(TokenKind::Newline)) {
                        fail(current(), "invalid syntax");
                    }
                    advance();
                    if (!at(TokenKind::Indent) || !peek(1).is_name("case")) {
                        fail(current(), "invalid syntax");
                    }
                    advance();
                } catch (const SyntaxError&) {
                    pos_ = saved_pos;
                    tree_.truncate(saved_size);
                    last_end_line_ = saved_end;
                    return kNoNode;
                }

                while (is_keyword("case")) {
                    const NodeId match_case = make(NodeKind::MatchCase, current());
                    advance();
                    skip_pattern();
                    if (accept_keyword("if")) {
                        attach(match_case, Role::Test, parse_named_expression());
                    }
                    parse_block(match_case, Role::Body);
                    close(match_case);
                    attach(node, Role::Case, match_case);
                }
                if (at(TokenKind::Dedent)) {
                    advance();
                } else if (!at(TokenKind::EndOfFile)) {
                    fail(current(), "invalid syntax");
                }
                close(node);
                return node;
            }

            void skip_pattern() {
                int depth = 0;
                bool empty = true;
                while (true) {
                    const Token& tok = current();
                    if (tok.kind == TokenKind::Newline || tok.kind == TokenKind::EndOfFile) {
                        fail(tok, "expected ':'");
                    }
                    if (depth == 0 && (tok.is_op(":") || tok.is_name("if"))) {
                        break;
                    }
                    if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{")) {
                        ++depth;
                    } else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}")) {
                        --depth;
                    }
                    advance();
                    empty = false;
                }
                if (empty) {
                    fail(current(), "invalid syntax");
                }
            }

            void skip_brackets() {
                int depth = 0;
                do {
                    const Token& tok = current();
                    if (tok.kind == TokenKind::EndOfFile) {
                        fail(tok, "invalid syntax");
                    }
                    if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{")) {
                        ++depth;
                    } else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}")) {
                        --depth;
                    }
                    advance();
                } while (depth > 0);
            }

            bool at_statement_end() const {
                return at(TokenKind::Newline) || at(TokenKind::EndOfFile) || check_op(";");
            }

            NodeId parse_simple_statement() {
                const Token& tok = current();
                if (tok.kind == TokenKind::Name) {
                    if (tok.text == "pass") {
                        const NodeId node = make(NodeKind::Pass, tok);
                        advance();
                        return node;
                    }
                    if (tok.text == "break") {
                        const NodeId node = make(NodeKind::Break, tok);
                        advance();
                        return node;
                    }
                    if (tok.text == "continue") {
                        const NodeId node = make(NodeKind::Continue, tok);
                        advance();
                        return node;
                    }
                    if (tok.text == "return") {
                        const NodeId node = make(NodeKind::Return, tok);
                        advance();
                        if (!at_statement_end()) {
                            attach(node, Role::Value, parse_star_expressions());
                        }
                        close(node);
                        return node;
                    }
                    if (tok.text == "raise") {
                        const NodeId node = make(NodeKind::Raise, tok);
                        advance();
                        if (!at_statement_end()) {
                            attach(node, Role::Value, parse_expression());
                            if (accept_keyword("from")) {
                                attach(node, Role::Cause, parse_expression());
                            }
                        }
                        close(node);
                        return node;
                    }
                    if (tok.text == "global" || tok.text == "nonlocal") {
                        const NodeId node = make(tok.text == "global" ? NodeKind::Global : NodeKind::Nonlocal, tok);
                        advance();
                        do {
                            const NodeId alias = make(NodeKind::Alias, current());
                            tree_.node(alias).name = expect_identifier();
                            attach(node, Role::Alias, alias);
                        } while (accept_op(","));
                        close(node);
                        return node;
                    }
                    if (tok.text == "del") {
                        const NodeId node = make(NodeKind::Delete, tok);
                        advance();
                        do {
                            attach(node, Role::Target, parse_bitwise_or());
                        } while (accept_op(",") && !at_statement_end());
                        close(node);
                        return node;
                    }
                    if (tok.text == "assert") {
                        const NodeId node = make(NodeKind::Assert, tok);
                        advance();
                        attach(node, Role::Test, parse_expression());
                        if (accept_op(",")) {
                            attach(node, Role::Value, parse_expression());
                        }
                        close(node);
                        return node;
                    }
                    if (tok.text == "import") {
                        return parse_import();
                    }
                    if (tok.text == "from") {
                        return parse_from_import();
                    }
                    if (tok.text == "type" && peek(1).kind == TokenKind::Name &&
                        (peek(2).is_op("=") || peek(2).is_op("["))) {
                        return parse_type_alias();
                    }
                }
                return parse_expression_statement();
            }

            std::string parse_dotted_name() {
                std::string name = expect_identifier();
                while (accept_op(".")) {
                    name += "." + expect_identifier();
                }
                return name;
            }

            NodeId parse_import() {
                const NodeId node = make(NodeKind::Import, current());
                advance();
                do {
                    const NodeId alias = make(NodeKind::Alias, current());
                    tree_.node(alias).name = parse_dotted_name();
                    if (accept_keyword("as")) {
                        tree_.node(alias).text = expect_identifier();
                    }
                    attach(node, Role::Alias, alias);
                } while (accept_op(","));
                close(node);
                return node;
            }

            NodeId parse_import_alias() {
                const NodeId alias = make(NodeKind::Alias, current());
                tree_.node(alias).name = expect_identifier();
                if (accept_keyword("as")) {
                    tree_.node(alias).text = expect_identifier();
                }
                return alias;
            }

            NodeId parse_from_import() {
                const NodeId node = make(NodeKind::ImportFrom, current());
                advance();
                std::string module;
                while (check_op(".") || check_op("...")) {
                    module += advance().text;
                }
                if (!is_keyword("import")) {
                    module += parse_dotted_name();
                }
                if (module.empty()) {
                    fail(current(), "invalid syntax");
                }
                tree_.node(node).text = module;
                expect_keyword("import");
                if (check_op("*")) {
                    const NodeId alias = make(NodeKind::Alias, current());
                    advance();
                    tree_.node(alias).name = "*";
                    attach(node, Role::Alias, alias);
                } else if (accept_op("(")) {
                    while (!check_op(")")) {
                        attach(node, Role::Alias, parse_import_alias());
                        if (!accept_op(",")) {
                            break;
                        }
                    }
                    expect_op(")");
                    if (tree_.node(node).children.empty()) {
                        fail(current(), "invalid syntax");
                    }
                } else {
                    do {
                        attach(node, Role::Alias, parse_import_alias());
                    } while (accept_op(","));
                }
                close(node);
                return node;
            }

            NodeId parse_type_alias() {
                const NodeId node = make(NodeKind::TypeAlias, current());
                advance();
                const NodeId name = make(NodeKind::Name, current());
                tree_.node(name).name = expect_identifier();
                attach(node, Role::Target, name);
                if (check_op("[")) {
                    skip_brackets();
                }
                expect_op("=");
                attach(node, Role::Value, parse_expression());
                close(node);
                return node;
            }

            NodeId parse_assignment_value() {
                return is_keyword("yield") ? parse_yield() : parse_star_expressions();
            }

            NodeId parse_expression_statement() {
                const NodeId first = parse_assignment_value();

                if (check_op(":")) {
                    advance();
                    validate_target(first, false);
                    const NodeId node = make_at(NodeKind::AnnAssign, first);
                    attach(node, Role::Target, first);
                    attach(node, Role::Annotation, parse_expression());
                    if (accept_op("=")) {
                        attach(node, Role::Value, parse_assignment_value());
                    }
                    close(node);
                    return node;
                }

                if (is_augmented_op(current())) {
                    validate_target(first, false);
                    const NodeId node = make_at(NodeKind::AugAssign, first);
                    tree_.node(node).text = advance().text;
                    attach(node, Role::Target, first);
                    attach(node, Role::Value, parse_assignment_value());
                    close(node);
                    return node;
                }

                if (check_op("=")) {
                    const NodeId node = make_at(NodeKind::Assign, first);
                    validate_target(first, true);
                    attach(node, Role::Target, first);
                    while (accept_op("=")) {
                        const NodeId value = parse_assignment_value();
                        if (check_op("=")) {
                            validate_target(value, true);
                            attach(node, Role::Target, value);
                        } else {
                            attach(node, Role::Value, value);
                        }
                    }
                    close(node);
                    return node;
                }

                const NodeId node = make_at(NodeKind::ExprStmt, first);
                attach(node, Role::Value, first);
                close(node);
                return node;
            }

            // ----------------------------------------------------------------
            // Expressions
            // ----------------------------------------------------------------

            bool at_expression_list_end() const {
                const Token& tok = current();
                if (tok.kind == TokenKind::Newline || tok.kind == TokenKind::EndOfFile) {
                    return true;
                }
                if (tok.kind == TokenKind::Operator) {
                    return tok.text == ")" || tok.text == "]" || tok.text == "}" || tok.text == "=" ||
                           tok.text == ":" || tok.text == ";" || is_augmented_op(tok);
                }
                return tok.is_name("in");
            }

            NodeId parse_star_expression() {
                if (check_op("*")) {
                    const NodeId node = make(NodeKind::Starred, current());
                    advance();
                    attach(node, Role::Value, parse_bitwise_or());
                    close(node);
                    return node;
                }
                return parse_expression();
            }

            NodeId parse_star_expressions() {
                const NodeId first = parse_star_expression();
                if (!check_op(",")) {
                    return first;
                }
                const NodeId tuple = make_at(NodeKind::Tuple, first);
                attach(tuple, Role::Element, first);
                while (accept_op(",")) {
                    if (at_expression_list_end()) {
                        break;
                    }
                    attach(tuple, Role::Element, parse_star_expression());
                }
                close(tuple);
                return tuple;
            }

            NodeId parse_star_named_expression() {
                if (check_op("*")) {
                    return parse_star_expression();
                }
                return parse_named_expression();
            }

            NodeId parse_star_named_expressions() {
                const NodeId first = parse_star_named_expression();
                if (!check_op(",")) {
                    return first;
                }
                const NodeId tuple = make_at(NodeKind::Tuple, first);
                attach(tuple, Role::Element, first);
                while (accept_op(",")) {
                    if (at_expression_list_end()) {
                        break;
                    }
                    attach(tuple, Role::Element, parse_star_named_expression());
                }
                close(tuple);
                return tuple;
            }

            NodeId parse_named_expression() {
                if (is_identifier(current()) && peek(1).is_op(":=")) {
                    const NodeId node = make(NodeKind::NamedExpr, current());
                    const NodeId target = make(NodeKind::Name, current());
                    tree_.node(target).name = advance().text;
                    advance();
                    attach(node, Role::Target, target);
                    attach(node, Role::Value, parse_expression());
                    close(node);
                    return node;
                }
                return parse_expression();
            }

            NodeId parse_expression() {
                DepthGuard guard(*this, current());
                if (is_keyword("lambda")) {
                    return parse_lambda();
                }
                const NodeId condition = parse_disjunction();
                if (!is_keyword("if")) {
                    return condition;
                }
                advance();
                const NodeId node = make_at(NodeKind::IfExp, condition);
                attach(node, Role::Body, condition);
                attach(node, Role::Test, parse_disjunction());
                expect_keyword("else");
                attach(node, Role::OrElse, parse_expression());
                close(node);
                return node;
            }

            NodeId parse_lambda() {
                const NodeId node = make(NodeKind::Lambda, current());
                advance();
                parse_parameters(node, ":", false);
                expect_op(":");
                attach(node, Role::Body, parse_expression());
                close(node);
                return node;
            }

            template<typename Next>
            NodeId parse_bool_op(const std::string_view keyword, Next next) {
                const NodeId first = (this->*next)();
                if (!is_keyword(keyword)) {
                    return first;
                }
                const NodeId node = make_at(NodeKind::BoolOp, first);
                tree_.node(node).text = std::string(keyword);
                attach(node, Role::Operand, first);
                while (accept_keyword(keyword)) {
                    attach(node, Role::Operand, (this->*next)());
                }
                close(node);
                return node;
            }

            NodeId parse_disjunction() {
                return parse_bool_op("or", &Parser::parse_conjunction);
            }

            NodeId parse_conjunction() {
                return parse_bool_op("and", &Parser::parse_inversion);
            }

            NodeId parse_inversion() {
                if (is_keyword("not")) {
                    DepthGuard guard(*this, current());
                    const NodeId node = make(NodeKind::UnaryOp, current());
                    advance();
                    tree_.node(node).text = "not";
                    attach(node, Role::Operand, parse_inversion());
                    close(node);
                    return node;
                }
                return parse_comparison();
            }

            std::string comparison_operator() {
                const Token& tok = current();
                if (tok.kind == TokenKind::Operator) {
                    static constexpr std::array<std::string_view, 6> ops = {"<", ">", "==", ">=", "<=", "!="};
                    for (const auto op : ops) {
                        if (tok.text == op) {
                            return advance().text;
                        }
                    }
                    return "";
                }
                if (tok.is_name("in")) {
                    advance();
                    return "in";
                }
                if (tok.is_name("not") && peek(1).is_name("in")) {
                    advance();
                    advance();
                    return "not in";
                }
                if (tok.is_name("is")) {
                    advance();
                    return accept_keyword("not") ? "is not" : "is";
                }
                return "";
            }

            NodeId parse_comparison() {
                NodeId left = parse_bitwise_or();
                while (true) {
                    std::string op = comparison_operator();
                    if (op.empty()) {
                        return left;
                    }
                    const NodeId node = make_at(NodeKind::Compare, left);
                    tree_.node(node).text = std::move(op);
                    attach(node, Role::Operand, left);
                    attach(node, Role::Operand, parse_bitwise_or());
                    close(node);
                    left = node;
                }
            }

            template<std::size_t N, typename Next>
            NodeId parse_binary(const std::array<std::string_view, N>& ops, Next next) {
                NodeId left = (this->*next)();
                while (true) {
                    std::string op;
                    for (const auto candidate : ops) {
                        if (check_op(candidate)) {
                            op = std::string(candidate);
                            break;
                        }
                    }
                    if (op.empty()) {
                        return left;
                    }
                    advance();
                    const NodeId node = make_at(NodeKind::BinOp, left);
                    tree_.node(node).text = std::move(op);
                    attach(node, Role::Operand, left);
                    attach(node, Role::Operand, (this->*next)());
                    close(node);
                    left = node;
                }
            }

            NodeId parse_bitwise_or() {
                static constexpr std::array<std::string_view, 1> ops = {"|"};
                return parse_binary(ops, &Parser::parse_bitwise_xor);
            }

            NodeId parse_bitwise_xor() {
                static constexpr std::array<std::string_view, 1> ops = {"^"};
                return parse_binary(ops, &Parser::parse_bitwise_and);
            }

            NodeId parse_bitwise_and() {
                static constexpr std::array<std::string_view, 1> ops = {"&"};
                return parse_binary(ops, &Parser::parse_shift);
            }

            NodeId parse_shift() {
                static constexpr std::array<std::string_view, 2> ops = {"<<", ">>"};
                return parse_binary(ops, &Parser::parse_sum);
            }

            NodeId parse_sum() {
                static constexpr std::array<std::string_view, 2> ops = {"+", "-"};
                return parse_binary(ops, &Parser::parse_term);
            }

            NodeId parse_term() {
                static constexpr std::array<std::string_view, 5> ops = {"*", "/", "//", "%", "@"};
                return parse_binary(ops, &Parser::parse_factor);
            }

            NodeId parse_factor() {
                if (check_op("+") || check_op("-") || check_op("~")) {
                    DepthGuard guard(*this, current());
                    const NodeId node = make(NodeKind::UnaryOp, current());
                    tree_.node(node).text = advance().text;
                    attach(node, Role::Operand, parse_factor());
                    close(node);
                    return node;
                }
                return parse_power();
            }

            NodeId parse_power() {
                const NodeId base = parse_await_primary();
                if (!accept_op("**")) {
                    return base;
                }
                const NodeId node = make_at(NodeKind::BinOp, base);
                tree_.node(node).text = "**";
                attach(node, Role::Operand, base);
                attach(node, Role::Operand, parse_factor());
                close(node);
                return node;
            }

            NodeId parse_await_primary() {
                if (is_keyword("await")) {
                    const NodeId node = make(NodeKind::Await, current());
                    advance();
                    attach(node, Role::Value, parse_primary());
                    close(node);
                    return node;
                }
                return parse_primary();
            }

            NodeId parse_primary() {
                NodeId node = parse_atom();
                while (true) {
                    if (check_op(".")) {
                        advance();
                        const NodeId attr = make_at(NodeKind::Attribute, node);
                        tree_.node(attr).name = expect_identifier();
                        attach(attr, Role::Value, node);
                        close(attr);
                        node = attr;
                    } else if (check_op("(")) {
                        advance();
                        const NodeId call = make_at(NodeKind::Call, node);
                        attach(call, Role::Func, node);
                        parse_call_arguments(call, Role::Arg);
                        expect_op(")");
                        close(call);
                        node = call;
                    } else if (check_op("[")) {
                        advance();
                        const NodeId sub = make_at(NodeKind::Subscript, node);
                        attach(sub, Role::Value, node);
                        attach(sub, Role::Index, parse_slices());
                        expect_op("]");
                        close(sub);
                        node = sub;
                    } else {
                        return node;
                    }
                }
            }

            bool at_for_clause() const {
                return is_keyword("for") || (is_keyword("async") && peek(1).is_name("for"));
            }

            /// Arguments of a call or the base list of a class, up to ")".
            void parse_call_arguments(const NodeId owner, const Role positional) {
                DepthGuard guard(*this, current());
                while (!check_op(")")) {
                    if (check_op("*")) {
                        attach(owner, positional, parse_star_expression());
                    } else if (check_op("**")) {
                        const NodeId keyword = make(NodeKind::Keyword, current());
                        advance();
                        attach(keyword, Role::Value, parse_expression());
                        close(keyword);
                        attach(owner, Role::Keyword, keyword);
                    } else if (is_identifier(current()) && peek(1).is_op("=")) {
                        const NodeId keyword = make(NodeKind::Keyword, current());
                        tree_.node(keyword).name = advance().text;
                        advance();
                        attach(keyword, Role::Value, parse_expression());
                        close(keyword);
                        attach(owner, Role::Keyword, keyword);
                    } else {
                        NodeId arg = parse_named_expression();
                        if (at_for_clause()) {
                            arg = parse_comprehension(NodeKind::GeneratorExp, arg, kNoNode, arg);
                        }
                        attach(owner, positional, arg);
                    }
                    if (!accept_op(",")) {
                        break;
                    }
                }
            }

            NodeId parse_slice() {
                if (check_op("*")) {
                    return parse_star_expression();
                }
                NodeId lower = kNoNode;
                if (!check_op(":")) {
                    lower = parse_named_expression();
                    if (!check_op(":")) {
                        return lower;
                    }
                }
                const NodeId slice = lower == kNoNode ? make(NodeKind::Slice, current())
                                                      : make_at(NodeKind::Slice, lower);
                if (lower != kNoNode) {
                    attach(slice, Role::Lower, lower);
                }
                expect_op(":");
                if (!check_op(":") && !check_op("]") && !check_op(",")) {
                    attach(slice, Role::Upper, parse_expression());
                }
                if (accept_op(":")) {
                    if (!check_op("]") && !check_op(",")) {
                        attach(slice, Role::Step, parse_expression());
                    }
                }
                close(slice);
                return slice;
            }

            NodeId parse_slices() {
                const NodeId first = parse_slice();
                if (!check_op(",")) {
                    return first;
                }
                const NodeId tuple = make_at(NodeKind::Tuple, first);
                attach(tuple, Role::Element, first);
                while (accept_op(",")) {
                    if (check_op("]")) {
                        break;
                    }
                    attach(tuple, Role::Element, parse_slice());
                }
                close(tuple);
                return tuple;
            }

            NodeId parse_atom() {
                const Token& tok = current();
                switch (tok.kind) {
                    case TokenKind::Name: {
                        if (tok.text == "True" || tok.text == "False" || tok.text == "None") {
                            const NodeId node = make(NodeKind::Constant, tok);
                            tree_.node(node).text = tok.text;
                            tree_.node(node).constant = tok.text == "True" ? ConstantKind::True
                                                      : tok.text == "False" ? ConstantKind::False
                                                                            : ConstantKind::None;
                            advance();
                            return node;
                        }
                        if (!is_identifier(tok)) {
                            fail(tok, "invalid syntax");
                        }
                        const NodeId node = make(NodeKind::Name, tok);
                        tree_.node(node).name = tok.text;
                        advance();
                        return node;
                    }
                    case TokenKind::Number: {
                        const NodeId node = make(NodeKind::Constant, tok);
                        tree_.node(node).text = tok.text;
                        tree_.node(node).constant = ConstantKind::Number;
                        advance();
                        return node;
                    }
                    case TokenKind::String:
                        return parse_strings();
                    case TokenKind::Operator:
                        if (tok.text == "...") {
                            const NodeId node = make(NodeKind::Constant, tok);
                            tree_.node(node).text = "...";
                            tree_.node(node).constant = ConstantKind::Ellipsis;
                            advance();
                            return node;
                        }
                        if (tok.text == "(") {
                            return parse_paren();
                        }
                        if (tok.text == "[") {
                            return parse_list();
                        }
                        if (tok.text == "{") {
                            return parse_brace();
                        }
                        break;
                    case TokenKind::Indent:
                        fail(tok, "unexpected indent");
                    default:
                        break;
                }
                fail(tok, "invalid syntax");
            }

            NodeId parse_paren() {
                const Token& open = current();
                const NodeId position = make(NodeKind::Tuple, open);
                advance();
                if (accept_op(")")) {
                    tree_.node(position).parenthesized = true;
                    close(position);
                    return position;
                }
                NodeId first;
                if (is_keyword("yield")) {
                    first = parse_yield();
                } else {
                    first = parse_star_named_expression();
                }
                if (at_for_clause()) {
                    tree_.node(position).kind = NodeKind::GeneratorExp;
                    const NodeId gen = parse_comprehension_into(position, first, kNoNode);
                    expect_op(")");
                    close(gen);
                    return gen;
                }
                if (check_op(",")) {
                    attach(position, Role::Element, first);
                    while (accept_op(",")) {
                        if (check_op(")")) {
                            break;
                        }
                        attach(position, Role::Element, parse_star_named_expression());
                    }
                    expect_op(")");
                    tree_.node(position).parenthesized = true;
                    close(position);
                    return position;
                }
                expect_op(")");
                // The placeholder stays unreferenced in the arena.
                tree_.node(first).parenthesized = true;
                return first;
            }

            NodeId parse_list() {
                const NodeId list = make(NodeKind::List, current());
                advance();
                if (accept_op("]")) {
                    close(list);
                    return list;
                }
                const NodeId first = parse_star_named_expression();
                if (at_for_clause()) {
                    tree_.node(list).kind = NodeKind::ListComp;
                    parse_comprehension_into(list, first, kNoNode);
                    expect_op("]");
                    close(list);
                    return list;
                }
                attach(list, Role::Element, first);
                while (accept_op(",")) {
                    if (check_op("]")) {
                        break;
                    }
                    attach(list, Role::Element, parse_star_named_expression());
                }
                expect_op("]");
                close(list);
                return list;
            }

            void parse_dict_unpack(const NodeId dict) {
                const NodeId starred = make(NodeKind::Starred, current());
                advance();
                tree_.node(starred).text = "**";
                attach(starred, Role::Value, parse_bitwise_or());
                close(starred);
                attach(dict, Role::Value, starred);
            }

            NodeId parse_brace() {
                const NodeId node = make(NodeKind::Dict, current());
                advance();
                if (accept_op("}")) {
                    close(node);
                    return node;
                }

                if (check_op("**")) {
                    parse_dict_unpack(node);
                } else {
                    const NodeId first = parse_star_named_expression();
                    if (accept_op(":")) {
                        const NodeId value = parse_expression();
                        if (at_for_clause()) {
                            tree_.node(node).kind = NodeKind::DictComp;
                            parse_comprehension_into(node, first, value);
                            expect_op("}");
                            close(node);
                            return node;
                        }
                        attach(node, Role::Key, first);
                        attach(node, Role::Value, value);
                    } else {
                        tree_.node(node).kind = NodeKind::Set;
                        if (at_for_clause()) {
                            tree_.node(node).kind = NodeKind::SetComp;
                            parse_comprehension_into(node, first, kNoNode);
                            expect_op("}");
                            close(node);
                            return node;
                        }
                        attach(node, Role::Element, first);
                        while (accept_op(",")) {
                            if (check_op("}")) {
                                break;
                            }
                            attach(node, Role::Element, parse_star_named_expression());
                        }
                        expect_op("}");
                        close(node);
                        return node;
                    }
                }

                while (accept_op(",")) {
                    if (check_op("}")) {
                        break;
                    }
                    if (check_op("**")) {
                        parse_dict_unpack(node);
                        continue;
                    }
                    const NodeId key = parse_expression();
                    expect_op(":");
                    attach(node, Role::Key, key);
                    attach(node, Role::Value, parse_expression());
                }
                expect_op("}");
                close(node);
                return node;
            }

            /// Builds a comprehension of `kind` positioned at `position`.
            NodeId parse_comprehension(const NodeKind kind, const NodeId element, const NodeId value,
                                       const NodeId position) {
                const NodeId node = make_at(kind, position);
                return parse_comprehension_into(node, element, value);
            }

            /// Attaches the element(s) and the for/if clauses to `node`.
            NodeId parse_comprehension_into(const NodeId node, const NodeId element, const NodeId value) {
                if (value == kNoNode) {
                    attach(node, Role::Element, element);
                } else {
                    attach(node, Role::Key, element);
                    attach(node, Role::Value, value);
                }
                while (at_for_clause()) {
                    const NodeId gen = make(NodeKind::Comprehension, current());
                    if (accept_keyword("async")) {
                        tree_.node(gen).is_async = true;
                    }
                    expect_keyword("for");
                    const NodeId target = parse_target_list();
                    validate_target(target, true);
                    attach(gen, Role::Target, target);
                    expect_keyword("in");
                    attach(gen, Role::Iter, parse_disjunction());
                    while (accept_keyword("if")) {
                        attach(gen, Role::Test, parse_disjunction());
                    }
                    close(gen);
                    attach(node, Role::Generator, gen);
                }
                close(node);
                return node;
            }

            NodeId parse_star_target() {
                if (check_op("*")) {
                    const NodeId node = make(NodeKind::Starred, current());
                    advance();
                    attach(node, Role::Value, parse_bitwise_or());
                    close(node);
                    return node;
                }
                return parse_bitwise_or();
            }

            NodeId parse_target_list() {
                const NodeId first = parse_star_target();
                if (!check_op(",")) {
                    return first;
                }
                const NodeId tuple = make_at(NodeKind::Tuple, first);
                attach(tuple, Role::Element, first);
                while (accept_op(",")) {
                    if (is_keyword("in") || check_op("=")) {
                        break;
                    }
                    attach(tuple, Role::Element, parse_star_target());
                }
                close(tuple);
                return tuple;
            }

            NodeId parse_yield() {
                const NodeId node = make(NodeKind::Yield, current());
                advance();
                if (accept_keyword("from")) {
                    tree_.node(node).kind = NodeKind::YieldFrom;
                    attach(node, Role::Value, parse_expression());
                } else if (!at_expression_list_end()) {
                    attach(node, Role::Value, parse_star_expressions());
                }
                close(node);
                return node;
            }

            NodeId parse_strings() {
                const NodeId node = make(NodeKind::Constant, current());
                std::vector<Token> parts;
                while (at(TokenKind::String)) {
                    parts.push_back(advance());
                }

                bool formatted = false;
                bool bytes = false;
                std::string text;
                std::string value;
                for (const Token& part : parts) {
                    if (!text.empty()) {
                        text += " ";
                    }
                    text += part.text;
                    value += decode_string(part);
                    formatted = formatted || part.prefix.find('f') != std::string::npos;
                    bytes = bytes || part.prefix.find('b') != std::string::npos;
                }

                {
                    Node& n = tree_.node(node);
                    n.text = std::move(text);
                    n.value = std::move(value);
                    n.constant = bytes ? ConstantKind::Bytes : ConstantKind::String;
                    if (formatted) {
                        n.kind = NodeKind::JoinedStr;
                    }
                }

                if (formatted) {
                    for (const Token& part : parts) {
                        if (part.prefix.find('f') != std::string::npos) {
                            parse_fstring_fields(node, part);
                        }
                    }
                }
                close(node);
                return node;
            }

            void parse_fstring_fields(const NodeId owner, const Token& part) {
                std::vector<FieldText> fields;
                FStringScanner(part, fields).scan();
                for (const FieldText& field : fields) {
                    std::uint32_t line = part.line;
                    for (std::size_t i = 0; i < field.offset && i < part.text.size(); ++i) {
                        if (part.text[i] == '\n') {
                            ++line;
                        }
                    }
                    std::vector<Token> tokens = Lexer("(" + field.expression + ")", line).tokenize();
                    Parser sub(std::move(tokens), tree_);
                    sub.depth_ = depth_;
                    const NodeId expr = sub.parse_fstring_field();
                    attach(owner, Role::Value, expr);
                }
            }

            std::vector<Token> tokens_;
            SyntaxTree& tree_;
            std::size_t pos_ = 0;
            std::uint32_t last_end_line_ = 0;
            std::size_t depth_ = 0;
        };

        /// Rejects trees too deep for the recursive passes that follow.
        void check_tree_depth(const SyntaxTree& tree) {
            if (tree.root() == kNoNode) {
                return;
            }
            std::vector<std::pair<NodeId, std::size_t>> pending = {{tree.root(), 1}};
            while (!pending.empty()) {
                const auto [id, depth] = pending.back();
                pending.pop_back();
                const Node& node = tree.node(id);
                if (depth > kMaxTreeDepth) {
                    throw SyntaxError("expression too complex", node.line, node.column);
                }
                for (const Child& child : node.children) {
                    pending.emplace_back(child.id, depth + 1);
                }
            }
        }

    }  // namespace

    Result<SyntaxTree, Error> parse_source(const std::string_view source) {
        try {
            std::vector<Token> tokens = Lexer(source).tokenize();
            SyntaxTree tree;
            Parser parser(std::move(tokens), tree);
            tree.set_root(parser.parse_module());
            check_tree_depth(tree);
            return Result<SyntaxTree, Error>::success(std::move(tree));
        } catch (const SyntaxError& e) {
            return Result<SyntaxTree, Error>::failure(
                Error::syntax_error(e.what(), e.line(), e.column())
            );
        } catch (const std::length_error& e) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error(e.what()));
        }
    }
}  // namespace ppa::frontend
