//
// Created by gregorian-rayne on 10/13/26.
//

#include "ppa/frontend/lexer.hpp"

#include <array>
#include <cctype>

namespace ppa::frontend
{
    namespace {

        bool is_name_start(const char c) {
            const auto u = static_cast<unsigned char>(c);
            return std::isalpha(u) || c == '_' || u >= 0x80;
        }

        bool is_name_char(const char c) {
            return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
        }

        bool is_digit(const char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_string_prefix(const std::string_view word) {
            static constexpr std::array<std::string_view, 8> prefixes = {
                "r", "u", "b", "f", "br", "rb", "fr", "rf"
            };
            if (word.size() > 2) {
                return false;
            }
            std::string lowered;
            for (const char c : word) {
                lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            for (const auto p : prefixes) {
                if (lowered == p) {
                    return true;
                }
            }
            return false;
        }

        constexpr std::array<std::string_view, 4> kThreeCharOps = {
            "**=", "//=", ">>=", "<<="
        };

        constexpr std::array<std::string_view, 19> kTwoCharOps = {
            "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==", "!=",
            "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
        };

        constexpr std::string_view kOneCharOps = "+-*/%@&|^~<>()[]{},:;.=";

        char closing_for(const char open) {
            switch (open) {
                case '(': return ')';
                case '[': return ']';
                default:  return '}';
            }
        }

        std::string normalize_newlines(const std::string_view source) {
            std::string out;
            out.reserve(source.size());
            std::size_t i = 0;
            if (source.size() >= 3 && source.substr(0, 3) == "\xEF\xBB\xBF") {
                i = 3;
            }
            for (; i < source.size(); ++i) {
                if (source[i] == '\r') {
                    out += '\n';
                    if (i + 1 < source.size() && source[i + 1] == '\n') {
                        ++i;
                    }
                } else {
                    out += source[i];
                }
            }
            return out;
        }

    }  // namespace

    const char* to_string(const TokenKind kind) noexcept {
        switch (kind) {
            case TokenKind::Name:      return "NAME";
            case TokenKind::Number:    return "NUMBER";
            case TokenKind::String:    return "STRING";
            case TokenKind::Operator:  return "OP";
            case TokenKind::Newline:   return "NEWLINE";
            case TokenKind::Indent:    return "INDENT";
            case TokenKind::Dedent:    return "DEDENT";
            case TokenKind::EndOfFile: return "ENDMARKER";
        }
        return "UNKNOWN";
    }

    Lexer::Lexer(const std::string_view source, const std::uint32_t first_line)
        : src_(normalize_newlines(source))
        , line_(first_line) {}

    char Lexer::peek(const std::size_t ahead) const noexcept {
        const std::size_t index = pos_ + ahead;
        return index < src_.size() ? src_[index] : '\0';
    }

    char Lexer::advance() {
        const char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            line_start_ = pos_;
        }
        return c;
    }

    std::uint32_t Lexer::column() const noexcept {
        return static_cast<std::uint32_t>(pos_ - line_start_ + 1);
    }

    void Lexer::fail(const std::string& message) const {
        fail(message, line_, column());
    }

    void Lexer::fail(const std::string& message, const std::uint32_t line, const std::uint32_t col) const {
        throw SyntaxError(message, line, col);
    }

    void Lexer::emit(const TokenKind kind, std::string text, const std::uint32_t line, const std::uint32_t col) {
        Token token;
        token.kind = kind;
        token.text = std::move(text);
        token.line = line;
        token.column = col;
        token.end_line = line_;
        tokens_.push_back(std::move(token));
    }

    bool Lexer::ends_logical_line() const noexcept {
        if (tokens_.empty()) {
            return false;
        }
        const TokenKind last = tokens_.back().kind;
        return last != TokenKind::Newline && last != TokenKind::Indent && last != TokenKind::Dedent;
    }

    std::vector<Token> Lexer::tokenize() {
        while (!at_end()) {
            if (at_line_start_ && brackets_.empty()) {
                at_line_start_ = false;
                read_indentation();
                continue;
            }

            const char c = peek();

            if (c == ' ' || c == '\t' || c == '\f') {
                advance();
                continue;
            }

            if (c == '#') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                continue;
            }

            if (c == '\\') {
                if (peek(1) != '\n') {
                    fail("unexpected character after line continuation character");
                }
                advance();
                advance();
                continue;
            }

            if (c == '\n') {
                const std::uint32_t line = line_;
                const std::uint32_t col = column();
                if (brackets_.empty() && ends_logical_line()) {
                    emit(TokenKind::Newline, "", line, col);
                }
                advance();
                at_line_start_ = brackets_.empty();
                continue;
            }

            if (is_name_start(c)) {
                read_name();
                continue;
            }

            if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                read_number();
                continue;
            }

            if (c == '"' || c == '\'') {
                read_string("", pos_, line_, column());
                continue;
            }

            read_operator();
        }

        if (!brackets_.empty()) {
            const auto& open = brackets_.back();
            fail(std::string("'") + open.symbol + "' was never closed", open.line, open.column);
        }

        if (ends_logical_line()) {
            emit(TokenKind::Newline, "", line_, column());
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokenKind::Dedent, "", line_, column());
        }
        emit(TokenKind::EndOfFile, "", line_, column());

        return std::move(tokens_);
    }

    void Lexer::read_indentation() {
        std::size_t width = 0;
        while (!at_end()) {
            const char c = peek();
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / 8 + 1) * 8;
            } else if (c == '\f') {
                width = 0;
            } else {
                break;
            }
            advance();
        }

        if (at_end() || peek() == '#' || peek() == '\n') {
            return;
        }
        if (peek() == '\\' && peek(1) == '\n') {
            return;
        }

        if (width > indents_.back()) {
            indents_.push_back(width);
            emit(TokenKind::Indent, "", line_, column());
            return;
        }

        while (width < indents_.back()) {
            indents_.pop_back();
            emit(TokenKind::Dedent, "", line_, column());
        }
        if (width != indents_.back()) {
            fail("unindent does not match any outer indentation level");
        }
    }

    void Lexer::read_name() {
        const std::size_t start = pos_;
        const std::uint32_t line = line_;
        const std::uint32_t col = column();
        while (!at_end() && is_name_char(peek())) {
            advance();
        }
        std::string word = src_.substr(start, pos_ - start);

        if ((peek() == '"' || peek() == '\'') && is_string_prefix(word)) {
            std::string prefix;
            for (const char ch : word) {
                prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            read_string(std::move(prefix), start, line, col);
            return;
        }

        emit(TokenKind::Name, std::move(word), line, col);
    }

    void Lexer::read_number() {
        const std::size_t start = pos_;
        const std::uint32_t line = line_;
        const std::uint32_t col = column();

        auto consume_digits = [this](const bool hex) {
            while (!at_end()) {
                const char c = peek();
                if (is_digit(c) || c == '_' ||
                    (hex && std::isxdigit(static_cast<unsigned char>(c)))) {
                    advance();
                } else {
                    break;
                }
            }
        };

        if (peek() == '0' && std::string_view("xXoObB").find(peek(1)) != std::string_view::npos &&
            peek(1) != '\0') {
            advance();
            advance();
            consume_digits(true);
        } else {
            consume_digits(false);
            if (peek() == '.') {
                advance();
                consume_digits(false);
            }
            if ((peek() == 'e' || peek() == 'E') &&
                (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                advance();
                if (peek() == '+' || peek() == '-') {
                    advance();
                }
                consume_digits(false);
            }
            if (peek() == 'j' || peek() == 'J') {
                advance();
            }
        }

        emit(TokenKind::Number, src_.substr(start, pos_ - start), line, col);
    }

    void Lexer::skip_nested_string() {
        const char quote = peek();
        const bool triple = peek(1) == quote && peek(2) == quote;
        const std::uint32_t line = line_;
        const std::uint32_t col = column();
        advance();
        if (triple) {
            advance();
            advance();
        }
        while (true) {
            if (at_end()) {
                fail("unterminated string literal", line, col);
            }
            const char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) {
                    advance();
                }
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    advance();
                    return;
                }
                if (peek(1) == quote && peek(2) == quote) {
                    advance();
                    advance();
                    advance();
                    return;
                }
            }
            if (c == '\n' && !triple) {
                fail("unterminated string literal", line, col);
            }
            advance();
        }
    }

    void Lexer::read_string(std::string prefix, const std::size_t start,
                            const std::uint32_t line, const std::uint32_t col) {
        const char quote = peek();
        const bool triple = peek(1) == quote && peek(2) == quote;
        const bool fstring = prefix.find('f') != std::string::npos;

        advance();
        if (triple) {
            advance();
            advance();
        }

        int depth = 0;
        while (true) {
            if (at_end()) {
                fail(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                     line, col);
            }
            const char c = peek();

            if (c == '\\') {
                advance();
                if (!at_end()) {
                    advance();
                }
                continue;
            }

            if (fstring) {
                if (c == '{') {
                    if (depth == 0 && peek(1) == '{') {
                        advance();
                        advance();
                        continue;
                    }
                    ++depth;
                    advance();
                    continue;
                }
                if (c == '}' && depth > 0) {
                    --depth;
                    advance();
                    continue;
                }
                if (depth > 0 && (c == '"' || c == '\'')) {
                    skip_nested_string();
                    continue;
                }
            }

            if (c == '\n' && !triple && depth == 0) {
                fail("unterminated string literal", line, col);
            }

            if (c == quote) {
                if (!triple) {
                    advance();
                    break;
                }
                if (peek(1) == quote && peek(2) == quote) {
                    advance();
                    advance();
                    advance();
                    break;
                }
            }
            advance();
        }

        Token token;
        token.kind = TokenKind::String;
        token.text = src_.substr(start, pos_ - start);
        token.line = line;
        token.column = col;
        token.end_line = line_;
        token.prefix = std::move(prefix);
        tokens_.push_back(std::move(token));
    }

    void Lexer::read_operator() {
        const std::uint32_t line = line_;
        const std::uint32_t col = column();
        const std::string_view rest = std::string_view(src_).substr(pos_);

        for (const auto op : kThreeCharOps) {
            if (rest.substr(0, 3) == op) {
                pos_ += 3;
                emit(TokenKind::Operator, std::string(op), line, col);
                return;
            }
        }

        if (rest.substr(0, 3) == "...") {
            pos_ += 3;
            emit(TokenKind::Operator, "...", line, col);
            return;
        }

        for (const auto op : kTwoCharOps) {
            if (rest.substr(0, 2) == op) {
                pos_ += 2;
                emit(TokenKind::Operator, std::string(op), line, col);
                return;
            }
        }

        const char c = peek();
        if (kOneCharOps.find(c) == std::string_view::npos) {
            fail("invalid character in identifier");
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets_.push_back({c, line, col});
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets_.empty()) {
                fail(std::string("unmatched '") + c + "'");
            }
            if (closing_for(brackets_.back().symbol) != c) {
                fail(std::string("closing parenthesis '") + c +
                     "' does not match opening parenthesis '" + brackets_.back().symbol + "'");
            }
            brackets_.pop_back();
        }

        advance();
        emit(TokenKind::Operator, std::string(1, c), line, col);
    }

    Result<std::vector<Token>, Error> tokenize(const std::string_view source) {
        try {
            Lexer lexer(source);
            return Result<std::vector<Token>, Error>::success(lexer.tokenize());
        } catch (const SyntaxError& e) {
            return Result<std::vector<Token>, Error>::failure(
                Error::syntax_error(e.what(), e.line(), e.column())
            );
        }
    }
}  // namespace ppa::frontend
