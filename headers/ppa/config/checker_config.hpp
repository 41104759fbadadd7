//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef PPA_CHECKER_CONFIG_HPP
#define PPA_CHECKER_CONFIG_HPP

/**
 * @file checker_config.hpp
 * @brief Checker configuration and its TOML form.
 *
 * @code
 *     [rules]
 *     repeated_query = true
 *     exception_in_loop = false
 *
 *     [thresholds]
 *     nested_loop_depth = 3
 *     snippet_context_lines = 2
 *
 *     [output]
 *     include_snippets = true
 *     min_severity = "low"
 *
 *     [catalog]
 *     orm_methods = ["paginate"]
 *     blocking_calls = ["mylib.fetch"]
 *     memory_calls = ["yaml.load"]
 *
 *     [catalog.async_alternatives]
 *     "mylib.fetch" = "mylib.async_fetch"
 * @endcode
 *
 * Every key is optional; a missing key keeps its default.
 */

#include "ppa/error.hpp"
#include "ppa/patterns/catalog.hpp"
#include "ppa/result.hpp"
#include "ppa/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace ppa::config {

    struct CheckerConfig {
        /// Rules absent from the map are disabled.
        std::map<RuleId, bool> enabled_rules = {
            {RuleId::RepeatedQuery, true},
            {RuleId::BlockingIo, true},
            {RuleId::InefficientLoop, true},
            {RuleId::MemoryLoad, true},
            {RuleId::ExceptionInLoop, false},
            {RuleId::TypeConversionInLoop, false},
            {RuleId::GlobalMutation, false}
        };

        /// Loop depth (outermost loop = 1) at which a nest is reported.
        int nested_loop_depth = 3;

        /// Extra lines shown after the first line of multi-line findings.
        int snippet_context_lines = 2;

        bool include_snippets = true;

        /// Issues below this severity are dropped from check_all().
        Severity min_severity = Severity::Low;

        patterns::CatalogExtensions catalog;

        [[nodiscard]] bool is_enabled(RuleId rule) const;
        void set_enabled(RuleId rule, bool enabled);

        /**
         * Checks value ranges.
         *
         * @return ConfigError listing every invalid value.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Renders the configuration as a TOML document that
         * load_config_string() reads back.
         */
        [[nodiscard]] std::string to_toml() const;

        bool operator==(const CheckerConfig&) const = default;
    };

    /**
     * Parses a TOML document.
     *
     * @return ConfigError for malformed TOML, wrongly typed values,
     *         unknown rule or severity names and out-of-range values.
     */
    [[nodiscard]] Result<CheckerConfig, Error> load_config_string(std::string_view content);

    /**
     * Reads and parses a TOML file.
     *
     * @return NotFound / IoError for an unusable path, otherwise as
     *         load_config_string().
     */
    [[nodiscard]] Result<CheckerConfig, Error> load_config_file(const std::filesystem::path& path);

}  // namespace ppa::config

#endif //PPA_CHECKER_CONFIG_HPP
