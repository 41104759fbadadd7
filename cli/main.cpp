//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/cli/command.hpp"
#include "ppa/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>

namespace {

    void print_help() {
        std::cout << ppa::PROJECT_NAME << " " << ppa::VERSION_STRING << "\n"
                  << "Detect performance anti-patterns in Python source code.\n\n"
                  << "USAGE:\n"
                  << "    " << ppa::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n"
                  << "COMMANDS:\n";

        for (const auto* cmd : ppa::cli::CommandRegistry::instance().list()) {
            std::cout << "    " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "    " << std::left << std::setw(12) << "help" << "Show this help, or help for a command\n"
                  << "    " << std::left << std::setw(12) << "version" << "Show version information\n\n"
                  << "Run '" << ppa::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << ppa::PROJECT_SHORT_NAME << " " << ppa::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            print_help();
            return 0;
        }

        const std::string cmd_name = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd_name == "help" || cmd_name == "--help" || cmd_name == "-h") {
            if (!args.empty()) {
                if (const auto* cmd = ppa::cli::CommandRegistry::instance().find(args.front())) {
                    cmd->print_help();
                    return 0;
                }
                std::cerr << "Unknown command: " << args.front() << "\n";
                return 1;
            }
            print_help();
            return 0;
        }

        if (cmd_name == "version" || cmd_name == "--version") {
            print_version();
            return 0;
        }

        auto* cmd = ppa::cli::CommandRegistry::instance().find(cmd_name);
        if (cmd == nullptr) {
            std::cerr << "Unknown command: " << cmd_name << "\n\n";
            print_help();
            return 1;
        }

        const auto parsed = ppa::cli::parse_arguments(args, cmd->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n\n" << cmd->usage() << "\n";
            return 1;
        }

        return cmd->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
