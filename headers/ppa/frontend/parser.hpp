//
// Created by gregorian-rayne on 10/13/26.
//

#ifndef PPA_PARSER_HPP
#define PPA_PARSER_HPP

/**
 * @file parser.hpp
 * @brief Recursive-descent parser for Python 3 source.
 *
 * Covers the statement and expression grammar of current CPython:
 * decorators, async def/for/with, lambdas, comprehensions, assignment
 * expressions, star targets, slices, try/except* / finally, parenthesized
 * with-items, match statements (case patterns are skipped, guards are
 * parsed), global/nonlocal and type aliases. Replacement fields of
 * f-strings are parsed as expressions and attached to the JoinedStr node.
 *
 * The tree is purely syntactic; see resolver.hpp for name resolution.
 */

#include "ppa/error.hpp"
#include "ppa/frontend/syntax_tree.hpp"
#include "ppa/result.hpp"

#include <string_view>

namespace ppa::frontend {

    /**
     * Parses one module.
     *
     * @param source Python source text.
     * @return The syntax tree, or a ParseError whose context is the
     *         "line N, column M" of the offending token.
     */
    [[nodiscard]] Result<SyntaxTree, Error> parse_source(std::string_view source);

}  // namespace ppa::frontend

#endif //PPA_PARSER_HPP
