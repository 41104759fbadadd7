//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/cli/command.hpp"
#include "ppa/cli/formatter.hpp"

#include "ppa/ppa.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>

namespace ppa::cli
{
    namespace fs = std::filesystem;

    /**
     * Check command - runs the detection rules over Python sources.
     */
    class CheckCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "check";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detect performance anti-patterns in Python source files";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: ppa check [OPTIONS] <files-or-dirs...>\n"
                   "       ppa check [OPTIONS] --source TEXT\n"
                   "\n"
                   "Examples:\n"
                   "  ppa check app.py\n"
                   "  ppa check --min-severity high --summary src/\n"
                   "  ppa check --enable exception_in_loop --json --output report.json app.py\n"
                   "  ppa check --fail-on critical services/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"source", 's', "Analyze this source text instead of files", false, true, "", "TEXT"},
                {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
                {"output", 'o', "Write the JSON report to FILE", false, true, "", "FILE"},
                {"min-severity", 0, "Drop issues below this severity (low, medium, high, critical)", false, true, "", "SEVERITY"},
                {"category", 0, "Only show issues of this category", false, true, "", "CATEGORY", true},
                {"enable", 0, "Enable a rule", false, true, "", "RULE", true},
                {"disable", 0, "Disable a rule", false, true, "", "RULE", true},
                {"no-snippets", 0, "Omit code snippets", false, false, "", ""},
                {"summary", 0, "Print counts per severity and category", false, false, "", ""},
                {"fail-on", 0, "Exit with 2 when an issue at or above SEVERITY is found", false, true, "", "SEVERITY"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            const bool has_source = args.has("source");
            if (has_source && !args.positional().empty()) {
                return "Give either --source or files, not both";
            }
            if (!has_source && args.positional().empty()) {
                return "No input specified. Use 'ppa check <files...>' or 'ppa check --source TEXT'";
            }
            for (const auto& key : {"min-severity", "fail-on"}) {
                if (const auto value = args.get(key); value && !parse_severity(*value)) {
                    return "Unknown severity for --" + std::string(key) + ": " + *value;
                }
            }
            for (const auto& value : args.get_all("category")) {
                if (!parse_category(value)) {
                    return "Unknown category: " + value;
                }
            }
            for (const auto& key : {"enable", "disable"}) {
                for (const auto& value : args.get_all(key)) {
                    if (!parse_rule_id(value)) {
                        return "Unknown rule: " + value;
                    }
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_options(args);

            if (const auto error = validate(args); !error.empty()) {
                print_error(error);
                return 1;
            }

            auto config = build_config(args);
            if (config.is_err()) {
                print_error(config.error());
                return 1;
            }

            std::vector<IssueCategory> categories;
            for (const auto& value : args.get_all("category")) {
                categories.push_back(*parse_category(value));
            }

            std::vector<std::pair<std::optional<std::string>, frontend::SourceInput>> inputs;
            if (const auto source = args.get("source")) {
                inputs.emplace_back(std::nullopt, frontend::SourceInput::text(*source));
            } else {
                for (const auto& file : collect_files(args.positional())) {
                    inputs.emplace_back(file.string(), frontend::SourceInput::file(file));
                }
            }

            if (inputs.empty()) {
                print_error("No Python files found");
                return 1;
            }

            print_verbose("Checking " + std::to_string(inputs.size()) + " input(s)");

            nlohmann::json reports = nlohmann::json::array();
            std::vector<PerformanceIssue> all_issues;
            bool failed = false;

            IssuePrinter printer(std::cout);

            for (const auto& [label, input] : inputs) {
                print_debug("Parsing " + label.value_or("<source>"));

                auto checked = checker::PerformanceChecker::create(input, config.value());
                if (checked.is_err()) {
                    print_error(checked.error());
                    failed = true;
                    continue;
                }

                auto issues = filter_categories(checked.value().check_all(), categories);
                print_debug(std::to_string(issues.size()) + " issue(s) in " + label.value_or("<source>"));

                nlohmann::json entry;
                if (label) {
                    entry["file"] = *label;
                }
                entry["issues"] = report::to_json(issues);
                entry["summary"] = report::to_json(checker::summarize(issues));
                reports.push_back(std::move(entry));

                if (!is_json() && !is_quiet()) {
                    printer.print_issues(issues, label);
                }

                all_issues.insert(all_issues.end(), issues.begin(), issues.end());
            }

            const nlohmann::json document = reports.size() == 1 ? reports.front() : reports;

            if (is_json()) {
                std::cout << report::dump_json(document) << "\n";
            } else if (args.get_flag("summary") && !is_quiet()) {
                printer.print_summary(checker::summarize(all_issues));
            }

            if (const auto output_file = args.get("output")) {
                if (auto written = report::write_json(*output_file, document); written.is_err()) {
                    print_error(written.error());
                    return 1;
                }
                print_verbose("Report written to " + *output_file);
            }

            if (failed) {
                return 1;
            }

            if (const auto fail_on = args.get("fail-on")) {
                const int threshold = severity_rank(*parse_severity(*fail_on));
                const bool hit = std::ranges::any_of(all_issues, [&](const PerformanceIssue& issue) {
                    return severity_rank(issue.severity) >= threshold;
                });
                if (hit) {
                    return 2;
                }
            }

            return 0;
        }

    private:
        [[nodiscard]] Result<config::CheckerConfig, Error> build_config(const ParsedArgs& args) const {
            config::CheckerConfig config;

            if (const auto path = args.get("config")) {
                auto loaded = config::load_config_file(*path);
                if (loaded.is_err()) {
                    return loaded;
                }
                config = std::move(loaded.value());
                print_verbose("Loaded configuration from " + *path);
            }

            for (const auto& rule : args.get_all("enable")) {
                config.set_enabled(*parse_rule_id(rule), true);
            }
            for (const auto& rule : args.get_all("disable")) {
                config.set_enabled(*parse_rule_id(rule), false);
            }
            if (args.get_flag("no-snippets")) {
                config.include_snippets = false;
            }
            if (const auto severity = args.get("min-severity")) {
                config.min_severity = *parse_severity(*severity);
            }

            return Result<config::CheckerConfig, Error>::success(std::move(config));
        }

        /// Expands directories to the .py files below them. Missing paths
        /// pass through so the checker reports them.
        [[nodiscard]] std::vector<fs::path> collect_files(const std::vector<std::string>& paths) const {
            std::vector<fs::path> files;
            for (const auto& path_str : paths) {
                const fs::path path(path_str);
                std::error_code ec;
                if (!fs::is_directory(path, ec)) {
                    files.push_back(path);
                    continue;
                }

                std::vector<fs::path> found;
                for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
                    if (entry.is_regular_file() && entry.path().extension() == ".py") {
                        found.push_back(entry.path());
                    }
                }
                if (ec) {
                    print_warning("Failed to scan " + path_str + ": " + ec.message());
                }
                std::ranges::sort(found);
                print_verbose("Found " + std::to_string(found.size()) + " Python files in " + path_str);
                files.insert(files.end(), found.begin(), found.end());
            }
            return files;
        }

        [[nodiscard]] static std::vector<PerformanceIssue> filter_categories(
            const std::vector<PerformanceIssue>& issues,
            const std::vector<IssueCategory>& categories
        ) {
            if (categories.empty()) {
                return issues;
            }
            std::vector<PerformanceIssue> result;
            std::ranges::copy_if(issues, std::back_inserter(result), [&](const PerformanceIssue& issue) {
                return std::ranges::find(categories, issue.category) != categories.end();
            });
            return result;
        }
    };

    namespace {
        struct CheckCommandRegistrar {
            CheckCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CheckCommand>()
                );
            }
        } check_registrar;
    }
}  // namespace ppa::cli
