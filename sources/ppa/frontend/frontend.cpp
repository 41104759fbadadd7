//
// Created by gregorian-rayne on 10/14/26.
//

#include "ppa/frontend/frontend.hpp"
#include "ppa/frontend/parser.hpp"
#include "ppa/utils/file_utils.hpp"

namespace ppa::frontend
{
    Result<ParsedModule, Error> parse(const SourceInput& input) {
        if (input.source_text.has_value() == input.file_path.has_value()) {
            return Result<ParsedModule, Error>::failure(
                Error::invalid_argument("Either source text or a file path must be provided, not both")
            );
        }

        ParsedModule module;
        if (input.file_path) {
            auto content = file_utils::read_file(*input.file_path);
            if (content.is_err()) {
                return Result<ParsedModule, Error>::failure(content.error());
            }
            module.source = std::move(content).value();
            module.path = input.file_path;
        } else {
            module.source = *input.source_text;
        }

        auto tree = parse_source(module.source).map_error([&module](Error error) {
            return module.path ? error.with_context(module.path->string()) : std::move(error);
        });
        if (tree.is_err()) {
            return Result<ParsedModule, Error>::failure(tree.error());
        }

        module.tree = std::move(tree).value();
        module.semantics = SemanticModel::build(module.tree);
        return Result<ParsedModule, Error>::success(std::move(module));
    }
}  // namespace ppa::frontend
