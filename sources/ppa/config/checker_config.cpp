//
// Created by gregorian-rayne on 10/16/26.
//

#include "ppa/config/checker_config.hpp"
#include "ppa/utils/file_utils.hpp"
#include "ppa/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <vector>

namespace ppa::config
{
    namespace {

        /**
         * Collects every problem in a document instead of stopping at the
         * first one.
         */
        class TomlReader {
        public:
            void read_bool(const toml::table& table, const std::string_view section, const std::string_view key,
                           bool& out) {
                if (const auto* node = table.get(key)) {
                    if (const auto value = node->value<bool>()) {
                        out = *value;
                    } else {
                        type_error(section, key, "a boolean");
                    }
                }
            }

            void read_int(const toml::table& table, const std::string_view section, const std::string_view key,
                          int& out) {
                if (const auto* node = table.get(key)) {
                    if (const auto value = node->value<std::int64_t>()) {
                        if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
                            errors_.push_back(std::string(section) + "." + std::string(key) + " is out of range");
                            return;
                        }
                        out = static_cast<int>(*value);
                    } else {
                        type_error(section, key, "an integer");
                    }
                }
            }

            void read_strings(const toml::table& table, const std::string_view section, const std::string_view key,
                              std::vector<std::string>& out) {
                const auto* node = table.get(key);
                if (node == nullptr) {
                    return;
                }
                const auto* array = node->as_array();
                if (array == nullptr) {
                    type_error(section, key, "an array of strings");
                    return;
                }
                out.clear();
                for (const auto& element : *array) {
                    if (const auto value = element.value<std::string>()) {
                        out.push_back(*value);
                    } else {
                        type_error(section, key, "an array of strings");
                        return;
                    }
                }
            }

            void error(std::string message) { errors_.push_back(std::move(message)); }

            [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

        private:
            void type_error(const std::string_view section, const std::string_view key, const std::string_view expected) {
                errors_.push_back(std::string(section) + "." + std::string(key) + " must be " + std::string(expected));
            }

            std::vector<std::string> errors_;
        };

        const toml::table* section(const toml::table& root, const std::string_view name, TomlReader& reader) {
            const auto* node = root.get(name);
            if (node == nullptr) {
                return nullptr;
            }
            if (const auto* table = node->as_table()) {
                return table;
            }
            reader.error("[" + std::string(name) + "] must be a table");
            return nullptr;
        }

        void read_rules(const toml::table& rules, CheckerConfig& config, TomlReader& reader) {
            for (const auto& [key, node] : rules) {
                const auto rule = parse_rule_id(key.str());
                if (!rule) {
                    reader.error("unknown rule '" + std::string(key.str()) + "'");
                    continue;
                }
                if (const auto value = node.value<bool>()) {
                    config.set_enabled(*rule, *value);
                } else {
                    reader.error("rules." + std::string(key.str()) + " must be a boolean");
                }
            }
        }

        void read_output(const toml::table& output, CheckerConfig& config, TomlReader& reader) {
            reader.read_bool(output, "output", "include_snippets", config.include_snippets);

            if (const auto* node = output.get("min_severity")) {
                const auto text = node->value<std::string>();
                if (!text) {
                    reader.error("output.min_severity must be a string");
                } else if (const auto severity = parse_severity(*text)) {
                    config.min_severity = *severity;
                } else {
                    reader.error("unknown severity '" + *text + "'");
                }
            }
        }

        void read_catalog(const toml::table& catalog, CheckerConfig& config, TomlReader& reader) {
            reader.read_strings(catalog, "catalog", "orm_methods", config.catalog.orm_methods);
            reader.read_strings(catalog, "catalog", "blocking_calls", config.catalog.blocking_calls);
            reader.read_strings(catalog, "catalog", "memory_calls", config.catalog.memory_calls);

            if (const auto* node = catalog.get("async_alternatives")) {
                const auto* alternatives = node->as_table();
                if (alternatives == nullptr) {
                    reader.error("[catalog.async_alternatives] must be a table");
                    return;
                }
                for (const auto& [key, value] : *alternatives) {
                    if (const auto text = value.value<std::string>()) {
                        config.catalog.async_alternatives[std::string(key.str())] = *text;
                    } else {
                        reader.error("catalog.async_alternatives." + std::string(key.str()) + " must be a string");
                    }
                }
            }
        }

        std::string quoted(const std::string_view text) {
            std::string result = "\"";
            for (const char c : text) {
                if (c == '"' || c == '\\') {
                    result += '\\';
                }
                result += c;
            }
            result += '"';
            return result;
        }

        std::string string_array(const std::vector<std::string>& values) {
            std::vector<std::string> items;
            items.reserve(values.size());
            for (const auto& value : values) {
                items.push_back(quoted(value));
            }
            return "[" + string_utils::join(items, ", ") + "]";
        }

    }  // namespace

    bool CheckerConfig::is_enabled(const RuleId rule) const {
        const auto it = enabled_rules.find(rule);
        return it != enabled_rules.end() && it->second;
    }

    void CheckerConfig::set_enabled(const RuleId rule, const bool enabled) {
        enabled_rules[rule] = enabled;
    }

    Result<void, Error> CheckerConfig::validate() const {
        std::vector<std::string> errors;

        if (nested_loop_depth <= 0) {
            errors.emplace_back("nested_loop_depth must be positive");
        }

        if (snippet_context_lines < 0) {
            errors.emplace_back("snippet_context_lines must be non-negative");
        }

        for (const auto& name : catalog.blocking_calls) {
            if (string_utils::trim(name).empty()) {
                errors.emplace_back("blocking_calls must not contain empty names");
                break;
            }
        }

        for (const auto& name : catalog.memory_calls) {
            if (string_utils::trim(name).empty()) {
                errors.emplace_back("memory_calls must not contain empty names");
                break;
            }
        }

        for (const auto& name : catalog.orm_methods) {
            if (string_utils::trim(name).empty() || name == ".") {
                errors.emplace_back("orm_methods must not contain empty names");
                break;
            }
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed", string_utils::join(errors, "; ")));
        }
        return Result<void, Error>::success();
    }

    std::string CheckerConfig::to_toml() const {
        std::ostringstream ss;

        ss << "[rules]\n";
        for (const auto rule : kAllRules) {
            ss << to_string(rule) << " = " << (is_enabled(rule) ? "true" : "false") << "\n";
        }

        ss << "\n[thresholds]\n";
        ss << "nested_loop_depth = " << nested_loop_depth << "\n";
        ss << "snippet_context_lines = " << snippet_context_lines << "\n";

        ss << "\n[output]\n";
        ss << "include_snippets = " << (include_snippets ? "true" : "false") << "\n";
        ss << "min_severity = " << quoted(to_string(min_severity)) << "\n";

        ss << "\n[catalog]\n";
        ss << "orm_methods = " << string_array(catalog.orm_methods) << "\n";
        ss << "blocking_calls = " << string_array(catalog.blocking_calls) << "\n";
        ss << "memory_calls = " << string_array(catalog.memory_calls) << "\n";

        ss << "\n[catalog.async_alternatives]\n";
        for (const auto& [name, alternative] : catalog.async_alternatives) {
            ss << quoted(name) << " = " << quoted(alternative) << "\n";
        }

        return ss.str();
    }

    Result<CheckerConfig, Error> load_config_string(const std::string_view content) {
        try {
            const toml::table root = toml::parse(content);
            CheckerConfig config;
            TomlReader reader;

            if (const auto* rules = section(root, "rules", reader)) {
                read_rules(*rules, config, reader);
            }

            if (const auto* thresholds = section(root, "thresholds", reader)) {
                reader.read_int(*thresholds, "thresholds", "nested_loop_depth", config.nested_loop_depth);
                reader.read_int(*thresholds, "thresholds", "snippet_context_lines", config.snippet_context_lines);
            }

            if (const auto* output = section(root, "output", reader)) {
                read_output(*output, config, reader);
            }

            if (const auto* catalog = section(root, "catalog", reader)) {
                read_catalog(*catalog, config, reader);
            }

            if (!reader.errors().empty()) {
                return Result<CheckerConfig, Error>::failure(
                    Error::config_error("Invalid configuration", string_utils::join(reader.errors(), "; ")));
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<CheckerConfig, Error>::failure(validation.error());
            }

            return Result<CheckerConfig, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            const auto& begin = err.source().begin;
            return Result<CheckerConfig, Error>::failure(Error::config_error(
                "Failed to parse TOML configuration: " + std::string(err.description()),
                "line " + std::to_string(begin.line) + ", column " + std::to_string(begin.column)));
        }
    }

    Result<CheckerConfig, Error> load_config_file(const std::filesystem::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<CheckerConfig, Error>::failure(content.error());
        }
        return load_config_string(content.value()).map_error([&](Error error) {
            return error.with_context(path.string());
        });
    }
}  // namespace ppa::config
