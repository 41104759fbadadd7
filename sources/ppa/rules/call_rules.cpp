//
// Created by gregorian-rayne on 10/16/26.
//

#include "ppa/rules/rule.hpp"

namespace ppa::rules
{
    namespace {

        /// Issue on the single line of a call.
        PerformanceIssue call_issue(const IRule& rule, const RuleContext& context, const analysis::CallInfo& call) {
            PerformanceIssue issue;
            issue.category = rule.category();
            issue.severity = rule.severity();
            issue.line = call.line;
            issue.end_line = call.line;
            issue.code_snippet = context.snippet(call.line, call.line);
            issue.function_name = call.parent_function;
            return issue;
        }

    }  // namespace

    std::vector<PerformanceIssue> RepeatedQueryRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& call : context.analyzer.calls()) {
            if (!call.is_in_loop) {
                continue;
            }
            const auto framework = context.catalog.classify_orm_query(call.function_name, call.resolved_name);
            if (!framework) {
                continue;
            }
            PerformanceIssue issue = call_issue(*this, context, call);
            issue.description = "Potential N+1 query: " + call.function_name + " called inside a loop";
            issue.suggestion = patterns::orm_suggestion(framework);
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<PerformanceIssue> BlockingIoRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& call : context.analyzer.calls()) {
            if (!call.is_in_async_function) {
                continue;
            }
            const auto match = context.catalog.classify_blocking_io(call.function_name, call.resolved_name);
            if (!match) {
                continue;
            }
            PerformanceIssue issue = call_issue(*this, context, call);
            issue.description = "Blocking I/O call '" + call.function_name + "' in async function blocks event loop";
            issue.suggestion = patterns::blocking_io_suggestion(*match);
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<PerformanceIssue> MemoryLoadRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& call : context.analyzer.calls()) {
            const auto kind = context.catalog.classify_memory_load(call.function_name, call.resolved_name);
            if (!kind) {
                continue;
            }
            PerformanceIssue issue = call_issue(*this, context, call);
            issue.description = patterns::memory_load_description(*kind, call.function_name);
            issue.suggestion = patterns::memory_load_suggestion(*kind);
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<PerformanceIssue> TypeConversionRule::check(const RuleContext& context) const {
        std::vector<PerformanceIssue> issues;

        for (const auto& call : context.analyzer.calls()) {
            if (!call.is_in_loop ||
                !context.catalog.classify_type_conversion(call.function_name, call.resolved_name)) {
                continue;
            }
            PerformanceIssue issue = call_issue(*this, context, call);
            issue.description = "Type conversion '" + call.function_name +
                                "()' called inside loop creates new objects each iteration";
            issue.suggestion = "If converting the same value repeatedly, move the conversion outside the loop";
            issues.push_back(std::move(issue));
        }
        return issues;
    }
}  // namespace ppa::rules
