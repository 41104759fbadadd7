//
// Created by gregorian-rayne on 10/16/26.
//

#include "ppa/rules/rule.hpp"
#include "ppa/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>

namespace ppa::rules
{
    namespace {

        /// try statements show the header and the first lines of the block.
        constexpr std::size_t kTrySnippetLines = 3;

        std::size_t nest_root(const std::vector<analysis::LoopInfo>& loops, std::size_t index) {
            while (loops[index].parent_loop.has_value()) {
                index = *loops[index].parent_loop;
            }
            return index;
        }

    }  // namespace

    // ============================================================================
    // InefficientLoopRule
    // ============================================================================

    std::vector<PerformanceIssue> InefficientLoopRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues = check_string_concatenation(context);
        auto nesting = check_nesting(context);
        issues.insert(issues.end(), std::make_move_iterator(nesting.begin()), std::make_move_iterator(nesting.end()));
        return issues;
    }

    std::vector<PerformanceIssue> InefficientLoopRule::check_string_concatenation(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& assignment : context.analyzer.augmented_assignments()) {
            if (assignment.op != "+=" || assignment.loop_nesting == 0 || !assignment.is_string_operation ||
                !assignment.target_bound_outside_loop) {
                continue;
            }
            PerformanceIssue issue;
            issue.category = category();
            issue.severity = severity();
            issue.line = assignment.line;
            issue.end_line = assignment.end_line;
            issue.description = "String concatenation in loop creates new string object each iteration";
            issue.suggestion = "Use list.append() and ''.join(list) or io.StringIO for better performance";
            issue.code_snippet = context.snippet(assignment.line, assignment.line);
            issue.function_name = assignment.parent_function;
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<PerformanceIssue> InefficientLoopRule::check_nesting(const RuleContext& context) const {
        const auto& loops = context.analyzer.loops();
        const auto threshold = static_cast<std::size_t>(std::max(context.config.nested_loop_depth, 1));

        // Deepest level per nest, keyed by the nest's outermost loop.
        std::map<std::size_t, std::size_t> deepest;
        for (std::size_t i = 0; i < loops.size(); ++i) {
            auto& level = deepest[nest_root(loops, i)];
            level = std::max(level, loops[i].nesting_level);
        }

        std::vector<PerformanceIssue> issues;
        for (const auto& [root, level] : deepest) {
            const std::size_t depth = level + 1;
            if (depth < threshold) {
                continue;
            }
            for (std::size_t i = root; i < loops.size(); ++i) {
                const auto& loop = loops[i];
                if (loop.nesting_level != level || nest_root(loops, i) != root) {
                    continue;
                }
                const std::size_t context_lines = static_cast<std::size_t>(context.config.snippet_context_lines);
                const std::string depth_text = std::to_string(depth);

                PerformanceIssue issue;
                issue.category = category();
                issue.severity = severity();
                issue.line = loop.line;
                issue.end_line = loop.end_line;
                issue.description = "Deeply nested loop (depth " + depth_text + ") has O(n^" + depth_text +
                                    ") complexity";
                issue.suggestion = "Consider if the algorithm can be optimized with better data structures or caching";
                issue.code_snippet = context.snippet(loop.line, std::min(loop.line + context_lines, loop.end_line));
                issue.function_name = loop.parent_function;
                issues.push_back(std::move(issue));
                break;
            }
        }

        std::ranges::stable_sort(issues, [](const PerformanceIssue& a, const PerformanceIssue& b) {
            return a.line < b.line;
        });
        return issues;
    }

    // ============================================================================
    // ExceptionInLoopRule
    // ============================================================================

    std::vector<PerformanceIssue> ExceptionInLoopRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& statement : context.analyzer.try_statements()) {
            if (!statement.is_in_loop) {
                continue;
            }
            PerformanceIssue issue;
            issue.category = category();
            issue.severity = severity();
            issue.line = statement.line;
            issue.end_line = statement.end_line;
            issue.description = "Try/except block inside loop incurs exception handling overhead on each iteration";
            issue.suggestion = "Move try/except outside the loop, or use conditional checks (if/else) for expected cases";
            issue.code_snippet = context.snippet(statement.line,
                                                 std::min(statement.line + kTrySnippetLines, statement.end_line));
            issue.function_name = statement.parent_function;
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    // ============================================================================
    // GlobalMutationRule
    // ============================================================================

    std::vector<PerformanceIssue> GlobalMutationRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& statement : context.analyzer.global_statements()) {
            // Module-level global statements are no-ops.
            if (!statement.parent_function) {
                continue;
            }
            PerformanceIssue issue;
            issue.category = category();
            issue.severity = severity();
            issue.line = statement.line;
            issue.end_line = statement.line;
            issue.description = "Function modifies global variable(s): " + string_utils::join(statement.names, ", ");
            issue.suggestion = "Pass values as parameters and return results instead of using global state";
            issue.code_snippet = context.snippet(statement.line, statement.line);
            issue.function_name = statement.parent_function;
            issues.push_back(std::move(issue));
        }
        return issues;
    }
}  // namespace ppa::rules
