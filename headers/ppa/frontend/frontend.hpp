//
// Created by gregorian-rayne on 10/14/26.
//

#ifndef PPA_FRONTEND_HPP
#define PPA_FRONTEND_HPP

/**
 * @file frontend.hpp
 * @brief Entry point of the front end: source in, annotated tree out.
 */

#include "ppa/error.hpp"
#include "ppa/frontend/resolver.hpp"
#include "ppa/frontend/syntax_tree.hpp"
#include "ppa/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ppa::frontend {

    namespace fs = std::filesystem;

    /**
     * What to analyze. Exactly one of the two members must be set.
     */
    struct SourceInput {
        std::optional<std::string> source_text;
        std::optional<fs::path> file_path;

        static SourceInput text(std::string source) {
            SourceInput input;
            input.source_text = std::move(source);
            return input;
        }

        static SourceInput file(fs::path path) {
            SourceInput input;
            input.file_path = std::move(path);
            return input;
        }
    };

    /**
     * A parsed module together with its resolved names.
     */
    struct ParsedModule {
        std::string source;
        std::optional<fs::path> path;
        SyntaxTree tree;
        SemanticModel semantics;
    };

    /**
     * Reads (when given a path), parses and resolves one module.
     *
     * @return InvalidArgument when both or neither input is given,
     *         NotFound / IoError for an unusable path, ParseError for
     *         source that does not parse.
     */
    [[nodiscard]] Result<ParsedModule, Error> parse(const SourceInput& input);

}  // namespace ppa::frontend

#endif //PPA_FRONTEND_HPP
