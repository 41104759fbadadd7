//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_TYPES_HPP
#define PPA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Issue model shared by the rule engine, reporting and the CLI.
 *
 * - Severity: closed, totally ordered set {critical, high, medium, low}
 * - IssueCategory: closed set of finding kinds
 * - RuleId: the detection rules that can be enabled or disabled
 * - PerformanceIssue / IssueSummary: what the checker hands back
 */

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ppa {

    // ============================================================================
    // Severity
    // ============================================================================

    enum class Severity {
        Critical,
        High,
        Medium,
        Low
    };

    inline constexpr std::array<Severity, 4> kAllSeverities = {
        Severity::Critical, Severity::High, Severity::Medium, Severity::Low
    };

    inline const char* to_string(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Critical: return "critical";
            case Severity::High:     return "high";
            case Severity::Medium:   return "medium";
            case Severity::Low:      return "low";
        }
        return "low";
    }

    /**
     * Numeric rank, higher is more severe (critical = 3, low = 0).
     */
    constexpr int severity_rank(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Critical: return 3;
            case Severity::High:     return 2;
            case Severity::Medium:   return 1;
            case Severity::Low:      return 0;
        }
        return 0;
    }

    /**
     * Parses "critical", "high", "medium" or "low" (case-insensitive).
     */
    std::optional<Severity> parse_severity(std::string_view text);

    // ============================================================================
    // Issue categories
    // ============================================================================

    enum class IssueCategory {
        RepeatedQueryInLoop,
        BlockingIoInAsync,
        InefficientLoop,
        MemoryLoad,
        ExceptionInLoop,
        TypeConversionInLoop,
        GlobalMutation
    };

    inline constexpr std::array<IssueCategory, 7> kAllCategories = {
        IssueCategory::RepeatedQueryInLoop,
        IssueCategory::BlockingIoInAsync,
        IssueCategory::InefficientLoop,
        IssueCategory::MemoryLoad,
        IssueCategory::ExceptionInLoop,
        IssueCategory::TypeConversionInLoop,
        IssueCategory::GlobalMutation
    };

    inline const char* to_string(const IssueCategory category) noexcept {
        switch (category) {
            case IssueCategory::RepeatedQueryInLoop:  return "repeated-query-in-loop";
            case IssueCategory::BlockingIoInAsync:    return "blocking-io-in-async";
            case IssueCategory::InefficientLoop:      return "inefficient-loop";
            case IssueCategory::MemoryLoad:           return "memory-load";
            case IssueCategory::ExceptionInLoop:      return "exception-in-loop";
            case IssueCategory::TypeConversionInLoop: return "type-conversion-in-loop";
            case IssueCategory::GlobalMutation:       return "global-mutation";
        }
        return "unknown";
    }

    /**
     * Parses a category name. Underscores are accepted in place of dashes.
     */
    std::optional<IssueCategory> parse_category(std::string_view text);

    // ============================================================================
    // Rules
    // ============================================================================

    enum class RuleId {
        RepeatedQuery,
        BlockingIo,
        InefficientLoop,
        MemoryLoad,
        ExceptionInLoop,
        TypeConversionInLoop,
        GlobalMutation
    };

    inline constexpr std::array<RuleId, 7> kAllRules = {
        RuleId::RepeatedQuery,
        RuleId::BlockingIo,
        RuleId::InefficientLoop,
        RuleId::MemoryLoad,
        RuleId::ExceptionInLoop,
        RuleId::TypeConversionInLoop,
        RuleId::GlobalMutation
    };

    /**
     * Configuration key of a rule (e.g. "repeated_query").
     */
    inline const char* to_string(const RuleId rule) noexcept {
        switch (rule) {
            case RuleId::RepeatedQuery:        return "repeated_query";
            case RuleId::BlockingIo:           return "blocking_io";
            case RuleId::InefficientLoop:      return "inefficient_loop";
            case RuleId::MemoryLoad:           return "memory_load";
            case RuleId::ExceptionInLoop:      return "exception_in_loop";
            case RuleId::TypeConversionInLoop: return "type_conversion_in_loop";
            case RuleId::GlobalMutation:       return "global_mutation";
        }
        return "unknown";
    }

    std::optional<RuleId> parse_rule_id(std::string_view text);

    // ============================================================================
    // Findings
    // ============================================================================

    /**
     * A single detected anti-pattern.
     *
     * Lines are 1-based and inclusive. The snippet is the literal source of
     * the reported lines, when snippets are enabled.
     */
    struct PerformanceIssue {
        IssueCategory category = IssueCategory::InefficientLoop;
        Severity severity = Severity::Low;
        std::size_t line = 0;
        std::size_t end_line = 0;
        std::string description;
        std::string suggestion;
        std::optional<std::string> code_snippet;
        std::optional<std::string> function_name;

        bool operator==(const PerformanceIssue&) const = default;
    };

    /**
     * Issue counts. Every severity and category key is present, so both
     * breakdowns always sum to total_issues.
     */
    struct IssueSummary {
        std::size_t total_issues = 0;
        std::map<Severity, std::size_t> by_severity;
        std::map<IssueCategory, std::size_t> by_category;

        bool operator==(const IssueSummary&) const = default;
    };

    /**
     * Orders issues critical first, then by ascending line.
     */
    inline bool issue_order(const PerformanceIssue& a, const PerformanceIssue& b) noexcept {
        if (a.severity != b.severity) {
            return severity_rank(a.severity) > severity_rank(b.severity);
        }
        return a.line < b.line;
    }

}  // namespace ppa

#endif //PPA_TYPES_HPP
