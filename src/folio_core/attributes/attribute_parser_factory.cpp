#include "folio_core/attributes/attribute_parser_factory.hpp"
#include "folio_core/attributes/json_attribute_parser.hpp"
#include "folio_core/attributes/yaml_attribute_parser.hpp"
#include "folio_core/errors.hpp"

namespace folio_core {
AttributeParserFactory::AttributeParserFactory() {
    parsers.push_back(std::make_unique<YamlAttributeParser>());
    parsers.push_back(std::make_unique<JsonAttributeParser>());
}

const AttributeParser& AttributeParserFactory::get_parser_for(AttributeSyntax syntax) const {
    for (const auto& parser : parsers) {
        if (parser->can_handle(syntax)) {
            return *parser;
        }
    }
    throw ConfigurationError("No attribute parser registered for syntax " + to_string(syntax));
}
}  // namespace folio_core
