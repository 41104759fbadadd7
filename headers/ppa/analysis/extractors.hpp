//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef PPA_EXTRACTORS_HPP
#define PPA_EXTRACTORS_HPP

/**
 * @file extractors.hpp
 * @brief One pure extraction pass per record kind.
 *
 * Each function walks the parsed module once and returns its records in
 * source order. They share no state, so each pass can be tested on its
 * own; analyze() runs them all.
 */

#include "ppa/analysis/records.hpp"
#include "ppa/frontend/frontend.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ppa::analysis {

    [[nodiscard]] std::vector<FunctionInfo> extract_functions(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<LoopInfo> extract_loops(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<ImportInfo> extract_imports(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<CallInfo> extract_calls(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<ClassInfo> extract_classes(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<AugAssignInfo> extract_augmented_assignments(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<TryInfo> extract_try_statements(const frontend::ParsedModule& module);
    [[nodiscard]] std::vector<GlobalInfo> extract_global_statements(const frontend::ParsedModule& module);

    /**
     * Runs every extraction pass.
     */
    [[nodiscard]] AnalysisResult analyze(const frontend::ParsedModule& module);

    /**
     * Name of a decorator: `name` for `@name` and `@name(...)`, the dotted
     * path for `@a.b` and `@a.b(...)`, the unparsed expression otherwise.
     */
    [[nodiscard]] std::string decorator_name(const frontend::SyntaxTree& tree, frontend::NodeId decorator);

    /**
     * Docstring of a def, class or module: the first statement of its body
     * when that is a string literal.
     */
    [[nodiscard]] std::optional<std::string> docstring(const frontend::SyntaxTree& tree, frontend::NodeId owner);

}  // namespace ppa::analysis

#endif //PPA_EXTRACTORS_HPP
