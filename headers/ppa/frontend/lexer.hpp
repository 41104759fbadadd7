//
// Created by gregorian-rayne on 10/13/26.
//

#ifndef PPA_LEXER_HPP
#define PPA_LEXER_HPP

/**
 * @file lexer.hpp
 * @brief Python 3 tokenizer.
 *
 * Produces the token stream the parser consumes, including the synthetic
 * NEWLINE, INDENT and DEDENT tokens. Newlines inside brackets and after a
 * backslash continuation are joined, blank and comment-only lines are
 * dropped. String literals (any prefix, single or triple quoted, f-strings
 * with nested quotes) become a single String token spelled exactly as in
 * the source.
 */

#include "ppa/error.hpp"
#include "ppa/result.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ppa::frontend {

    enum class TokenKind {
        Name,
        Number,
        String,
        Operator,
        Newline,
        Indent,
        Dedent,
        EndOfFile
    };

    const char* to_string(TokenKind kind) noexcept;

    struct Token {
        TokenKind kind = TokenKind::EndOfFile;
        std::string text;
        std::uint32_t line = 0;
        std::uint32_t column = 0;
        std::uint32_t end_line = 0;

        /// Lower-cased string prefix ("", "f", "rb", ...); String tokens only.
        std::string prefix;

        [[nodiscard]] bool is(const TokenKind k, const std::string_view t) const noexcept {
            return kind == k && text == t;
        }

        [[nodiscard]] bool is_op(const std::string_view t) const noexcept {
            return is(TokenKind::Operator, t);
        }

        [[nodiscard]] bool is_name(const std::string_view t) const noexcept {
            return is(TokenKind::Name, t);
        }
    };

    /**
     * Raised inside the front end on malformed input. It never leaves the
     * front end: parse() turns it into Error::syntax_error.
     */
    class SyntaxError : public std::runtime_error {
    public:
        SyntaxError(const std::string& message, const std::size_t line, const std::size_t column)
            : std::runtime_error(message)
            , line_(line)
            , column_(column) {}

        [[nodiscard]] std::size_t line() const noexcept { return line_; }
        [[nodiscard]] std::size_t column() const noexcept { return column_; }

    private:
        std::size_t line_;
        std::size_t column_;
    };

    class Lexer {
    public:
        /**
         * @param source Python source text.
         * @param first_line Line number of the first character, for
         *        sub-lexing f-string replacement fields in place.
         */
        explicit Lexer(std::string_view source, std::uint32_t first_line = 1);

        /**
         * Tokenizes the whole input.
         *
         * @throws SyntaxError on malformed input.
         */
        [[nodiscard]] std::vector<Token> tokenize();

    private:
        [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }
        [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;
        char advance();
        [[nodiscard]] std::uint32_t column() const noexcept;

        void read_indentation();
        void read_name();
        void read_number();
        void read_string(std::string prefix, std::size_t start, std::uint32_t line, std::uint32_t col);
        void skip_nested_string();
        void read_operator();

        void emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t col);
        [[nodiscard]] bool ends_logical_line() const noexcept;

        [[noreturn]] void fail(const std::string& message) const;
        [[noreturn]] void fail(const std::string& message, std::uint32_t line, std::uint32_t col) const;

        std::string src_;
        std::size_t pos_ = 0;
        std::size_t line_start_ = 0;
        std::uint32_t line_;
        bool at_line_start_ = true;

        std::vector<Token> tokens_;
        std::vector<std::size_t> indents_{0};

        struct OpenBracket {
            char symbol;
            std::uint32_t line;
            std::uint32_t column;
        };
        std::vector<OpenBracket> brackets_;
    };

    /**
     * Tokenizes source text, reporting malformed input as a ParseError.
     */
    [[nodiscard]] Result<std::vector<Token>, Error> tokenize(std::string_view source);

}  // namespace ppa::frontend

#endif //PPA_LEXER_HPP
