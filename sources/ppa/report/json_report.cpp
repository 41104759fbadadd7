//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/report/json_report.hpp"
#include "ppa/utils/file_utils.hpp"

namespace ppa::report
{
    using json = nlohmann::json;

    namespace {

        template<typename T>
        json optional_json(const std::optional<T>& value) {
            if (value.has_value()) {
                return json(*value);
            }
            return nullptr;
        }

        json function_json(const analysis::FunctionInfo& function) {
            return {
                {"name", function.name},
                {"line_number", function.line},
                {"end_line_number", function.end_line},
                {"is_async", function.is_async},
                {"parameters", function.parameters},
                {"decorators", function.decorators},
                {"return_annotation", optional_json(function.return_annotation)},
                {"docstring", optional_json(function.docstring)},
                {"inferred_types", function.inferred_types}
            };
        }

        json loop_json(const analysis::LoopInfo& loop) {
            return {
                {"kind", analysis::to_string(loop.kind)},
                {"line_number", loop.line},
                {"end_line_number", loop.end_line},
                {"parent_function", optional_json(loop.parent_function)},
                {"nesting_level", loop.nesting_level},
                {"is_in_async_function", loop.is_in_async_function},
                {"is_async", loop.is_async},
                {"is_comprehension", loop.is_comprehension}
            };
        }

        json import_json(const analysis::ImportInfo& import) {
            return {
                {"module", import.module},
                {"names", import.names},
                {"line_number", import.line},
                {"is_from_import", import.is_from_import},
                {"aliases", import.aliases},
                {"resolved_module", optional_json(import.resolved_module)}
            };
        }

        json call_json(const analysis::CallInfo& call) {
            return {
                {"function_name", call.function_name},
                {"line_number", call.line},
                {"parent_function", optional_json(call.parent_function)},
                {"is_in_loop", call.is_in_loop},
                {"is_in_async_function", call.is_in_async_function},
                {"inferred_callable", optional_json(call.resolved_name)}
            };
        }

        json class_json(const analysis::ClassInfo& cls) {
            return {
                {"name", cls.name},
                {"line_number", cls.line},
                {"end_line_number", cls.end_line},
                {"bases", cls.bases},
                {"methods", cls.methods},
                {"decorators", cls.decorators},
                {"docstring", optional_json(cls.docstring)}
            };
        }

        template<typename Record, typename Convert>
        json array_of(const std::vector<Record>& records, Convert convert) {
            json array = json::array();
            for (const auto& record : records) {
                array.push_back(convert(record));
            }
            return array;
        }

        std::optional<std::string> optional_string(const json& object, const char* key) {
            const auto it = object.find(key);
            if (it == object.end() || it->is_null()) {
                return std::nullopt;
            }
            return it->get<std::string>();
        }

    }  // namespace

    json to_json(const PerformanceIssue& issue) {
        return {
            {"category", to_string(issue.category)},
            {"severity", to_string(issue.severity)},
            {"line_number", issue.line},
            {"end_line_number", issue.end_line},
            {"description", issue.description},
            {"suggestion", issue.suggestion},
            {"code_snippet", optional_json(issue.code_snippet)},
            {"function_name", optional_json(issue.function_name)}
        };
    }

    json to_json(const std::vector<PerformanceIssue>& issues) {
        return array_of(issues, [](const PerformanceIssue& issue) { return to_json(issue); });
    }

    json to_json(const IssueSummary& summary) {
        json by_severity = json::object();
        for (const auto severity : kAllSeverities) {
            const auto it = summary.by_severity.find(severity);
            by_severity[to_string(severity)] = it != summary.by_severity.end() ? it->second : 0;
        }

        json by_category = json::object();
        for (const auto category : kAllCategories) {
            const auto it = summary.by_category.find(category);
            by_category[to_string(category)] = it != summary.by_category.end() ? it->second : 0;
        }

        return {
            {"total_issues", summary.total_issues},
            {"by_severity", by_severity},
            {"by_category", by_category}
        };
    }

    json structure_to_json(const analysis::AstAnalyzer& analyzer) {
        json j;
        j["functions"] = array_of(analyzer.functions(), function_json);
        j["loops"] = array_of(analyzer.loops(), loop_json);
        j["imports"] = array_of(analyzer.imports(), import_json);
        j["calls"] = array_of(analyzer.calls(), call_json);
        j["classes"] = array_of(analyzer.classes(), class_json);
        j["max_loop_nesting_depth"] = analyzer.max_loop_nesting_depth();
        return j;
    }

    json check_report(const checker::PerformanceChecker& checker, const std::optional<std::string>& file) {
        json j;
        if (file) {
            j["file"] = *file;
        }
        j["issues"] = to_json(checker.check_all());
        j["summary"] = to_json(checker.summary());
        return j;
    }

    Result<PerformanceIssue, Error> issue_from_json(const json& j) {
        try {
            PerformanceIssue issue;

            const auto category_name = j.at("category").get<std::string>();
            const auto category = parse_category(category_name);
            if (!category) {
                return Result<PerformanceIssue, Error>::failure(
                    Error::parse_error("Unknown issue category", category_name));
            }

            const auto severity_name = j.at("severity").get<std::string>();
            const auto severity = parse_severity(severity_name);
            if (!severity) {
                return Result<PerformanceIssue, Error>::failure(
                    Error::parse_error("Unknown severity", severity_name));
            }

            issue.category = *category;
            issue.severity = *severity;
            issue.line = j.at("line_number").get<std::size_t>();
            issue.end_line = j.at("end_line_number").get<std::size_t>();
            issue.description = j.at("description").get<std::string>();
            issue.suggestion = j.at("suggestion").get<std::string>();
            issue.code_snippet = optional_string(j, "code_snippet");
            issue.function_name = optional_string(j, "function_name");

            return Result<PerformanceIssue, Error>::success(std::move(issue));

        } catch (const json::exception& e) {
            return Result<PerformanceIssue, Error>::failure(
                Error::parse_error("Malformed issue JSON", e.what()));
        }
    }

    std::string dump_json(const json& j, const int indent) {
        return j.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    Result<void, Error> write_json(const std::filesystem::path& path, const json& j, const int indent) {
        return file_utils::write_file(path, dump_json(j, indent) + "\n");
    }
}  // namespace ppa::report
