//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/cli/command.hpp"
#include "ppa/cli/formatter.hpp"

#include "ppa/ppa.hpp"

#include <iostream>

namespace ppa::cli
{
    /**
     * Inspect command - dumps the structural model of one module.
     */
    class InspectCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "inspect";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the functions, loops, imports, calls and classes found in a module";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: ppa inspect [OPTIONS] <file>\n"
                   "       ppa inspect [OPTIONS] --source TEXT\n"
                   "\n"
                   "Examples:\n"
                   "  ppa inspect app.py\n"
                   "  ppa inspect --json --output model.json app.py";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"source", 's', "Inspect this source text instead of a file", false, true, "", "TEXT"},
                {"output", 'o', "Write the JSON model to FILE", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            const auto count = args.positional().size() + (args.has("source") ? 1 : 0);
            if (count == 0) {
                return "No input specified. Use 'ppa inspect <file>'";
            }
            if (count > 1) {
                return "inspect takes exactly one input";
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

            const auto input = args.has("source")
                ? frontend::SourceInput::text(args.get_or("source", ""))
                : frontend::SourceInput::file(args.positional().front());

            auto analyzer = analysis::AstAnalyzer::create(input);
            if (analyzer.is_err()) {
                print_error(analyzer.error());
                return 1;
            }

            const auto& model = analyzer.value();
            print_verbose(std::to_string(model.line_count()) + " lines parsed");

            if (is_json()) {
                std::cout << report::dump_json(report::structure_to_json(model)) << "\n";
            } else if (!is_quiet()) {
                IssuePrinter printer(std::cout);
                printer.print_structure(model);
            }

            if (const auto output_file = args.get("output")) {
                if (auto written = report::write_json(*output_file, report::structure_to_json(model));
                    written.is_err()) {
                    print_error(written.error());
                    return 1;
                }
                print_verbose("Model written to " + *output_file);
            }

            return 0;
        }
    };

    namespace {
        struct InspectCommandRegistrar {
            InspectCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<InspectCommand>()
                );
            }
        } inspect_registrar;
    }
}  // namespace ppa::cli
