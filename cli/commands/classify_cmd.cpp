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
     * Classify command - shows how the pattern catalog sees a call name.
     */
    class ClassifyCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "classify";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show how the pattern catalog classifies a call name";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: ppa classify [OPTIONS] <name>\n"
                   "\n"
                   "Examples:\n"
                   "  ppa classify requests.get\n"
                   "  ppa classify get --resolved requests.get\n"
                   "  ppa classify --config ppa.toml mylib.fetch";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"resolved", 'r', "Fully qualified name the call resolves to", false, true, "", "QNAME"},
                {"config", 'c', "TOML configuration file with catalog extensions", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "classify takes exactly one call name";
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

            patterns::CatalogExtensions extensions;
            if (const auto path = args.get("config")) {
                auto loaded = config::load_config_file(*path);
                if (loaded.is_err()) {
                    print_error(loaded.error());
                    return 1;
                }
                extensions = loaded.value().catalog;
            }

            const patterns::PatternCatalog catalog(extensions);
            const std::string& written = args.positional().front();
            const std::optional<std::string> resolved = args.get("resolved");

            const auto orm = catalog.classify_orm_query(written, resolved);
            const auto blocking = catalog.classify_blocking_io(written, resolved);
            const auto memory = catalog.classify_memory_load(written, resolved);
            const bool conversion = catalog.classify_type_conversion(written, resolved);

            if (is_json()) {
                nlohmann::json j;
                j["name"] = written;
                j["resolved"] = resolved ? nlohmann::json(*resolved) : nlohmann::json(nullptr);
                j["orm_query"] = orm ? nlohmann::json(patterns::to_string(*orm)) : nlohmann::json(nullptr);
                if (blocking) {
                    j["blocking_io"] = {
                        {"async_alternative", blocking->alternative ? nlohmann::json(*blocking->alternative)
                                                                    : nlohmann::json(nullptr)}
                    };
                } else {
                    j["blocking_io"] = nullptr;
                }
                j["memory_load"] = memory ? nlohmann::json(patterns::to_string(*memory)) : nlohmann::json(nullptr);
                j["type_conversion"] = conversion;
                std::cout << report::dump_json(j) << "\n";
                return 0;
            }

            Table table({{"Table"}, {"Match"}, {"Detail"}});
            table.add_row({"orm query", orm ? "yes" : "no", orm ? patterns::to_string(*orm) : ""});
            table.add_row({"blocking io", blocking ? "yes" : "no",
                           blocking ? blocking->alternative.value_or("") : ""});
            table.add_row({"memory load", memory ? "yes" : "no", memory ? patterns::to_string(*memory) : ""});
            table.add_row({"type conversion", conversion ? "yes" : "no", ""});

            print(written + (resolved ? " (" + *resolved + ")" : std::string()));
            if (!is_quiet()) {
                table.render(std::cout);
            }

            if (is_verbose()) {
                if (orm) {
                    print("\nsuggestion: " + patterns::orm_suggestion(orm));
                }
                if (blocking) {
                    print("\nsuggestion: " + patterns::blocking_io_suggestion(*blocking));
                }
                if (memory) {
                    print("\nsuggestion: " + patterns::memory_load_suggestion(*memory));
                }
            }

            return 0;
        }
    };

    namespace {
        struct ClassifyCommandRegistrar {
            ClassifyCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ClassifyCommand>()
                );
            }
        } classify_registrar;
    }
}  // namespace ppa::cli
