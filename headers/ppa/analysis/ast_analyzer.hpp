//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef PPA_AST_ANALYZER_HPP
#define PPA_AST_ANALYZER_HPP

/**
 * @file ast_analyzer.hpp
 * @brief Structural model of one Python module.
 *
 * An AstAnalyzer owns the parsed module and everything the extractor
 * derived from it. All collections are computed once, in the constructor,
 * and handed out by const reference; a constructed analyzer never changes
 * and can be read from several threads.
 *
 * @code
 *     auto analyzer = analysis::AstAnalyzer::create(frontend::SourceInput::file("app.py"));
 *     if (analyzer.is_ok()) {
 *         for (const auto& loop : analyzer.value().loops()) {
 *             ...
 *         }
 *     }
 * @endcode
 */

#include "ppa/analysis/records.hpp"
#include "ppa/error.hpp"
#include "ppa/frontend/frontend.hpp"
#include "ppa/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ppa::analysis {

    class AstAnalyzer {
    public:
        /**
         * Parses the input and runs every extraction pass.
         *
         * @return the front end's error when the input is unusable.
         */
        [[nodiscard]] static Result<AstAnalyzer, Error> create(const frontend::SourceInput& input);

        explicit AstAnalyzer(frontend::ParsedModule module);

        [[nodiscard]] const std::vector<FunctionInfo>& functions() const noexcept { return result_.functions; }
        [[nodiscard]] const std::vector<LoopInfo>& loops() const noexcept { return result_.loops; }
        [[nodiscard]] const std::vector<ImportInfo>& imports() const noexcept { return result_.imports; }
        [[nodiscard]] const std::vector<CallInfo>& calls() const noexcept { return result_.calls; }
        [[nodiscard]] const std::vector<ClassInfo>& classes() const noexcept { return result_.classes; }

        [[nodiscard]] const std::vector<AugAssignInfo>& augmented_assignments() const noexcept {
            return result_.augmented_assignments;
        }

        [[nodiscard]] const std::vector<TryInfo>& try_statements() const noexcept {
            return result_.try_statements;
        }

        [[nodiscard]] const std::vector<GlobalInfo>& global_statements() const noexcept {
            return result_.global_statements;
        }

        [[nodiscard]] const AnalysisResult& result() const noexcept { return result_; }
        [[nodiscard]] const frontend::ParsedModule& module() const noexcept { return module_; }

        [[nodiscard]] std::size_t line_count() const noexcept { return lines_.size(); }

        /**
         * Literal source of lines [start_line, end_line], 1-based and
         * inclusive, joined with '\n'. The range is clamped to the module;
         * an empty or inverted range gives an empty string.
         */
        [[nodiscard]] std::string source_segment(std::size_t start_line, std::size_t end_line) const;

        [[nodiscard]] std::vector<FunctionInfo> async_functions() const;

        /**
         * Functions whose def line lies within [start_line, end_line]. The
         * body may extend past end_line.
         */
        [[nodiscard]] std::vector<FunctionInfo> functions_in_range(std::size_t start_line, std::size_t end_line) const;

        [[nodiscard]] std::vector<LoopInfo> loops_in_function(std::string_view function_name) const;

        /**
         * Deepest loop nesting as a depth (1 for a single loop, 0 without
         * loops).
         */
        [[nodiscard]] std::size_t max_loop_nesting_depth() const noexcept;

        /**
         * Quick name-based check for I/O-looking calls inside async
         * functions. The checker's blocking-I/O rule is the precise version.
         */
        [[nodiscard]] bool has_blocking_calls_in_async() const;

    private:
        frontend::ParsedModule module_;
        AnalysisResult result_;
        std::vector<std::string> lines_;
    };

}  // namespace ppa::analysis

#endif //PPA_AST_ANALYZER_HPP
