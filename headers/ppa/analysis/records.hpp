//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef PPA_RECORDS_HPP
#define PPA_RECORDS_HPP

/**
 * @file records.hpp
 * @brief Flat records produced by the structural extractor.
 *
 * Every record is derived from one parse of one module and never changes
 * afterwards. Line numbers are 1-based and inclusive.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ppa::analysis {

    enum class LoopKind {
        For,    ///< iteration (for, async for, comprehension clause)
        While   ///< conditional repeat
    };

    const char* to_string(LoopKind kind) noexcept;

    /**
     * A def or async def, at any nesting depth.
     */
    struct FunctionInfo {
        std::string name;
        std::size_t line = 0;
        std::size_t end_line = 0;
        bool is_async = false;
        std::vector<std::string> parameters;
        std::vector<std::string> decorators;
        std::optional<std::string> return_annotation;
        std::optional<std::string> docstring;

        /// Parameter annotations as written, plus locals whose class the
        /// resolver inferred.
        std::map<std::string, std::string> inferred_types;

        bool operator==(const FunctionInfo&) const = default;
    };

    struct LoopInfo {
        LoopKind kind = LoopKind::For;
        std::size_t line = 0;
        std::size_t end_line = 0;
        std::optional<std::string> parent_function;

        /// Number of enclosing loops (0 for an outermost loop).
        std::size_t nesting_level = 0;
        bool is_in_async_function = false;

        bool is_async = false;
        bool is_comprehension = false;

        /// Index in loops() of the directly enclosing loop.
        std::optional<std::size_t> parent_loop;

        bool operator==(const LoopInfo&) const = default;
    };

    struct ImportInfo {
        std::string module;
        std::vector<std::string> names;
        std::size_t line = 0;
        bool is_from_import = false;
        std::map<std::string, std::string> aliases;

        /// Absolute module path; empty for relative imports.
        std::optional<std::string> resolved_module;

        bool operator==(const ImportInfo&) const = default;
    };

    struct CallInfo {
        /// Callee as written, e.g. "User.objects.filter".
        std::string function_name;
        std::size_t line = 0;
        std::optional<std::string> parent_function;
        bool is_in_loop = false;
        bool is_in_async_function = false;

        /// Fully qualified callee when the resolver could determine it.
        std::optional<std::string> resolved_name;

        bool operator==(const CallInfo&) const = default;
    };

    struct ClassInfo {
        std::string name;
        std::size_t line = 0;
        std::size_t end_line = 0;
        std::vector<std::string> bases;
        std::vector<std::string> methods;
        std::vector<std::string> decorators;
        std::optional<std::string> docstring;

        bool operator==(const ClassInfo&) const = default;
    };

    /**
     * An augmented assignment (`x += ...`).
     */
    struct AugAssignInfo {
        std::string target;
        std::string op;
        std::size_t line = 0;
        std::size_t end_line = 0;
        std::optional<std::string> parent_function;

        /// Enclosing loops; 0 outside any loop.
        std::size_t loop_nesting = 0;
        std::optional<std::size_t> loop_line;

        /// The operand or the target's binding is a string.
        bool is_string_operation = false;

        /// The target is bound somewhere other than inside the innermost
        /// enclosing loop (before it, a parameter, a global, an outer scope).
        bool target_bound_outside_loop = false;

        bool operator==(const AugAssignInfo&) const = default;
    };

    struct TryInfo {
        std::size_t line = 0;
        std::size_t end_line = 0;
        std::optional<std::string> parent_function;
        bool is_in_loop = false;

        bool operator==(const TryInfo&) const = default;
    };

    struct GlobalInfo {
        std::vector<std::string> names;
        std::size_t line = 0;
        std::optional<std::string> parent_function;

        bool operator==(const GlobalInfo&) const = default;
    };

    /**
     * Everything the extractor produces for one module.
     */
    struct AnalysisResult {
        std::vector<FunctionInfo> functions;
        std::vector<LoopInfo> loops;
        std::vector<ImportInfo> imports;
        std::vector<CallInfo> calls;
        std::vector<ClassInfo> classes;
        std::vector<AugAssignInfo> augmented_assignments;
        std::vector<TryInfo> try_statements;
        std::vector<GlobalInfo> global_statements;
    };

}  // namespace ppa::analysis

#endif //PPA_RECORDS_HPP
