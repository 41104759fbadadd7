//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef PPA_RULE_HPP
#define PPA_RULE_HPP

/**
 * @file rule.hpp
 * @brief Interface for detection rules.
 *
 * A rule reads the structural model and produces findings of one fixed
 * category and severity:
 *
 * - RepeatedQueryRule: ORM queries issued inside loops (high)
 * - BlockingIoRule: blocking calls inside async functions (critical)
 * - InefficientLoopRule: string building with += and deep loop nests (medium)
 * - MemoryLoadRule: calls that load a whole file or document (medium)
 * - ExceptionInLoopRule, TypeConversionRule, GlobalMutationRule: optional
 *   checks, off unless enabled in the configuration (medium)
 *
 * Rules are stateless; they neither modify the model nor see each other's
 * findings.
 */

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/config/checker_config.hpp"
#include "ppa/patterns/catalog.hpp"
#include "ppa/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ppa::rules {

    /**
     * Everything a rule may read.
     */
    struct RuleContext {
        const analysis::AstAnalyzer& analyzer;
        const patterns::PatternCatalog& catalog;
        const config::CheckerConfig& config;

        /**
         * Snippet for lines [start, end] when snippets are enabled.
         */
        [[nodiscard]] std::optional<std::string> snippet(std::size_t start, std::size_t end) const;
    };

    class IRule {
    public:
        virtual ~IRule() = default;

        [[nodiscard]] virtual RuleId id() const noexcept = 0;

        /**
         * Returns a short human-readable name.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual IssueCategory category() const noexcept = 0;

        [[nodiscard]] virtual Severity severity() const noexcept = 0;

        /**
         * Runs the rule over the model, returning findings in source order.
         */
        [[nodiscard]] virtual std::vector<PerformanceIssue> check(const RuleContext& context) const = 0;
    };

    /**
     * Every rule, in the order check_all() runs them.
     */
    [[nodiscard]] std::vector<std::unique_ptr<IRule>> builtin_rules();

    [[nodiscard]] std::unique_ptr<IRule> make_rule(RuleId id);

    class RepeatedQueryRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::RepeatedQuery; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Repeated query in loop"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "ORM or database query issued once per loop iteration (N+1 queries)";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::RepeatedQueryInLoop; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::High; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

    class BlockingIoRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::BlockingIo; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Blocking I/O in async"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Synchronous I/O or sleep inside an async function stalls the event loop";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::BlockingIoInAsync; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Critical; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

    /**
     * Two checks share the inefficient-loop category:
     *
     * - `s += "..."` inside a loop, where `s` is bound outside the innermost
     *   loop and the operand or the binding is a string: one issue per
     *   statement.
     * - a loop nest reaching config.nested_loop_depth levels: one issue per
     *   outermost loop, at the first loop that reaches the nest's deepest
     *   level.
     */
    class InefficientLoopRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::InefficientLoop; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Inefficient loop"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Quadratic string building and deeply nested loops";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::InefficientLoop; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Medium; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;

        [[nodiscard]] std::vector<PerformanceIssue> check_string_concatenation(const RuleContext& context) const;
        [[nodiscard]] std::vector<PerformanceIssue> check_nesting(const RuleContext& context) const;
    };

    class MemoryLoadRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::MemoryLoad; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Memory load"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Whole file or document loaded into memory at once";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::MemoryLoad; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Medium; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

    class ExceptionInLoopRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::ExceptionInLoop; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Exception handling in loop"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "try/except set up on every loop iteration";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::ExceptionInLoop; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Medium; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

    class TypeConversionRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::TypeConversionInLoop; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Type conversion in loop"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Builtin conversions such as int() or str() repeated inside a loop";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::TypeConversionInLoop; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Medium; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

    class GlobalMutationRule final : public IRule {
    public:
        [[nodiscard]] RuleId id() const noexcept override { return RuleId::GlobalMutation; }
        [[nodiscard]] std::string_view name() const noexcept override { return "Global mutation"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Functions rebinding module globals through a global statement";
        }
        [[nodiscard]] IssueCategory category() const noexcept override { return IssueCategory::GlobalMutation; }
        [[nodiscard]] Severity severity() const noexcept override { return Severity::Medium; }
        [[nodiscard]] std::vector<PerformanceIssue> check(const RuleContext& context) const override;
    };

}  // namespace ppa::rules

#endif //PPA_RULE_HPP
