//
// Created by gregorian-rayne on 10/16/26.
//

#include "ppa/rules/rule.hpp"

namespace ppa::rules
{
    std::optional<std::string> RuleContext::snippet(const std::size_t start, const std::size_t end) const {
        if (!config.include_snippets) {
            return std::nullopt;
        }
        return analyzer.source_segment(start, end);
    }

    std::unique_ptr<IRule> make_rule(const RuleId id) {
        switch (id) {
            case RuleId::RepeatedQuery:        return std::make_unique<RepeatedQueryRule>();
            case RuleId::BlockingIo:           return std::make_unique<BlockingIoRule>();
            case RuleId::InefficientLoop:      return std::make_unique<InefficientLoopRule>();
            case RuleId::MemoryLoad:           return std::make_unique<MemoryLoadRule>();
            case RuleId::ExceptionInLoop:      return std::make_unique<ExceptionInLoopRule>();
            case RuleId::TypeConversionInLoop: return std::make_unique<TypeConversionRule>();
            case RuleId::GlobalMutation:       return std::make_unique<GlobalMutationRule>();
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<IRule>> builtin_rules() {
        std::vector<std::unique_ptr<IRule>> rules;
        rules.reserve(kAllRules.size());
        for (const auto id : kAllRules) {
            rules.push_back(make_rule(id));
        }
        return rules;
    }
}  // namespace ppa::rules
