//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef PPA_COMMAND_HPP
#define PPA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Command framework for the ppa executable.
 *
 * Each subcommand declares its options as ArgDef records. The same records
 * drive argument parsing, validation of required options and the generated
 * help text. Options shared by every command (help, verbosity, JSON output,
 * color) come from common_arguments() and are never declared per command.
 */

#include "ppa/error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ppa::cli
{
    /**
     * Declaration of one command-line option.
     */
    struct ArgDef {
        std::string name;                  // --name
        char short_name = 0;               // -n, 0 when there is none
        std::string description;
        bool required = false;
        bool takes_value = true;           // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
        bool repeatable = false;           // every occurrence is kept
    };

    /**
     * Options accepted by every command.
     */
    [[nodiscard]] const std::vector<ArgDef>& common_arguments();

    /**
     * Option values, flags and positionals after parsing.
     *
     * A repeatable option keeps each value in order; get() returns the last.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void append(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::vector<std::string>> values_;
        std::unordered_set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the command name.
     *
     * Supports --name VALUE, --name=VALUE, -n VALUE, -nVALUE, flag clusters
     * such as -vq and "--" to end option processing. Declared defaults are
     * filled in before parsing.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose,
        Debug
    };

    /**
     * A ppa subcommand.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Usage line plus examples. The default lists required options only.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Checks option combinations before execution.
         *
         * @return Error message, or an empty string when the arguments are usable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        void print_help() const;

    protected:
        /// Reads --verbose, --quiet, --debug, --json and --no-color.
        void apply_common_options(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        static void print_error(const Error& error);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return json_output_; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        bool json_output_ = false;
    };

    /**
     * Process-wide set of commands, ordered by name.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::map<std::string, std::unique_ptr<Command>, std::less<>> commands_;
    };
}  // namespace ppa::cli

#endif //PPA_COMMAND_HPP
