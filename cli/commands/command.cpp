//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/cli/command.hpp"
#include "ppa/cli/formatter.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ppa::cli
{
    namespace {

        /**
         * Single-pass parser over one command's arguments.
         *
         * Command definitions shadow the common options, so a command may
         * claim a short name such as -v for itself.
         */
        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args) {
                for (const auto* group : {&defs, &common_arguments()}) {
                    for (const auto& def : *group) {
                        by_name_.try_emplace(def.name, &def);
                        if (def.short_name != 0) {
                            by_short_.try_emplace(def.short_name, &def);
                        }
                    }
                }
                for (const auto& def : defs) {
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() {
                bool options_ended = false;
                while (pos_ < args_.size() && result_.success) {
                    const std::string& arg = args_[pos_++];
                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg[0] != '-' || arg.size() == 1) {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        parse_long(arg.substr(2));
                    } else {
                        parse_short_cluster(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void parse_long(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    fail("Unknown option: --" + name);
                    return;
                }
                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    result_.args.set_flag(def.name);
                    return;
                }
                if (!inline_value) {
                    inline_value = next_value();
                }
                if (!inline_value) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                store(def, *inline_value);
            }

            void parse_short_cluster(const std::string& arg) {
                for (std::size_t i = 1; i < arg.size(); ++i) {
                    const auto it = by_short_.find(arg[i]);
                    if (it == by_short_.end()) {
                        fail(std::string("Unknown option: -") + arg[i]);
                        return;
                    }
                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    // The rest of the cluster, or the next argument, is the value.
                    std::optional<std::string> value;
                    if (i + 1 < arg.size()) {
                        value = arg.substr(i + 1);
                    } else {
                        value = next_value();
                    }
                    if (!value) {
                        fail(std::string("Option -") + arg[i] + " requires a value");
                        return;
                    }
                    store(def, *value);
                    return;
                }
            }

            std::optional<std::string> next_value() {
                if (pos_ < args_.size()) {
                    return args_[pos_++];
                }
                return std::nullopt;
            }

            void store(const ArgDef& def, const std::string& value) {
                if (def.repeatable) {
                    result_.args.append(def.name, value);
                } else {
                    result_.args.set(def.name, value);
                }
            }

            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const std::vector<std::string>& args_;
            std::size_t pos_ = 0;
            std::unordered_map<std::string, const ArgDef*> by_name_;
            std::unordered_map<char, const ArgDef*> by_short_;
            ParseResult result_;
        };

        void print_option(std::ostream& out, const ArgDef& arg) {
            std::string names = arg.short_name != 0 ? std::string("-") + arg.short_name + ", " : "    ";
            names += "--" + arg.name;
            if (arg.takes_value) {
                names += " " + arg.value_name;
            }

            out << "  " << std::left << std::setw(28) << names << " " << arg.description;
            if (!arg.default_value.empty()) {
                out << " (default: " << arg.default_value << ")";
            }
            if (arg.required) {
                out << " [required]";
            }
            if (arg.repeatable) {
                out << " [repeatable]";
            }
            out << "\n";
        }

    }  // namespace

    const std::vector<ArgDef>& common_arguments() {
        static const std::vector<ArgDef> common = {
            {"help", 'h', "Show this help message", false, false},
            {"verbose", 'v', "Print progress details", false, false},
            {"quiet", 'q', "Only print errors", false, false},
            {"debug", 0, "Print debug details", false, false},
            {"json", 0, "Print results as JSON", false, false},
            {"no-color", 0, "Disable colored output", false, false},
        };
        return common;
    }

    // ParsedArgs

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = {value};
    }

    void ParsedArgs::append(const std::string& name, const std::string& value) {
        values_[name].push_back(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto text = get(name);
        if (!text) {
            return std::nullopt;
        }
        int number = 0;
        const char* last = text->data() + text->size();
        if (const auto [ptr, ec] = std::from_chars(text->data(), last, number); ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return number;
    }

    std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? std::vector<std::string>{} : it->second;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentParser(args, defs).run();
    }

    // Command

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: ppa " << name();
        for (const auto& arg : arguments()) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }
        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "\nOptions:\n";
            for (const auto& arg : args) {
                print_option(std::cout, arg);
            }
        }

        std::cout << "\nCommon options:\n";
        for (const auto& arg : common_arguments()) {
            print_option(std::cout, arg);
        }
    }

    void Command::apply_common_options(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            verbosity_ = Verbosity::Debug;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
        json_output_ = args.get_flag("json");
        if (args.get_flag("no-color")) {
            colors::set_enabled(false);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << colors::paint(colors::RED, "error: ") << msg << "\n";
    }

    void Command::print_error(const Error& error) {
        print_error(error.to_string());
    }

    void Command::print_warning(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cerr << colors::paint(colors::YELLOW, "warning: ") << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (is_verbose()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Debug) {
            std::cout << colors::paint(colors::DIM, "[debug] ") << msg << "\n";
        }
    }

    // CommandRegistry

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        std::string key(cmd->name());
        commands_.insert_or_assign(std::move(key), std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = commands_.find(name);
        return it == commands_.end() ? nullptr : it->second.get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& [name, cmd] : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }
}  // namespace ppa::cli
