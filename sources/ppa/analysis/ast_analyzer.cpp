//
// Created by gregorian-rayne on 10/15/26.
//

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/analysis/extractors.hpp"
#include "ppa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace ppa::analysis
{
    Result<AstAnalyzer, Error> AstAnalyzer::create(const frontend::SourceInput& input) {
        auto parsed = frontend::parse(input);
        if (parsed.is_err()) {
            return Result<AstAnalyzer, Error>::failure(parsed.error());
        }
        return Result<AstAnalyzer, Error>::success(AstAnalyzer(std::move(parsed).value()));
    }

    AstAnalyzer::AstAnalyzer(frontend::ParsedModule module)
        : module_(std::move(module)) {
        result_ = analyze(module_);
        for (const auto line : string_utils::split_lines(module_.source)) {
            lines_.emplace_back(line);
        }
    }

    std::string AstAnalyzer::source_segment(const std::size_t start_line, const std::size_t end_line) const {
        const std::size_t first = std::max<std::size_t>(start_line, 1);
        const std::size_t last = std::min(end_line, lines_.size());
        if (first > last) {
            return {};
        }
        std::string segment;
        for (std::size_t i = first; i <= last; ++i) {
            if (i != first) {
                segment += '\n';
            }
            segment += lines_[i - 1];
        }
        return segment;
    }

    std::vector<FunctionInfo> AstAnalyzer::async_functions() const {
        std::vector<FunctionInfo> result;
        std::ranges::copy_if(result_.functions, std::back_inserter(result),
                             [](const FunctionInfo& f) { return f.is_async; });
        return result;
    }

    std::vector<FunctionInfo> AstAnalyzer::functions_in_range(const std::size_t start_line,
                                                              const std::size_t end_line) const {
        std::vector<FunctionInfo> result;
        std::ranges::copy_if(result_.functions, std::back_inserter(result), [&](const FunctionInfo& f) {
            return f.line >= start_line && f.line <= end_line;
        });
        return result;
    }

    std::vector<LoopInfo> AstAnalyzer::loops_in_function(const std::string_view function_name) const {
        std::vector<LoopInfo> result;
        std::ranges::copy_if(result_.loops, std::back_inserter(result), [&](const LoopInfo& loop) {
            return loop.parent_function.has_value() && *loop.parent_function == function_name;
        });
        return result;
    }

    std::size_t AstAnalyzer::max_loop_nesting_depth() const noexcept {
        std::size_t depth = 0;
        for (const auto& loop : result_.loops) {
            depth = std::max(depth, loop.nesting_level + 1);
        }
        return depth;
    }

    bool AstAnalyzer::has_blocking_calls_in_async() const {
        static constexpr std::array<std::string_view, 4> kIoWords = {"open", "read", "write", "sleep"};

        return std::ranges::any_of(result_.calls, [](const CallInfo& call) {
            if (!call.is_in_async_function) {
                return false;
            }
            const std::string lowered = string_utils::to_lower(call.function_name);
            if (string_utils::starts_with(lowered, "aio") || string_utils::starts_with(lowered, "async") ||
                string_utils::contains(lowered, "asyncio")) {
                return false;
            }
            return std::ranges::any_of(kIoWords, [&](const std::string_view word) {
                return string_utils::contains(lowered, word);
            });
        });
    }
}  // namespace ppa::analysis
