#include "folio_core/attributes/json_attribute_parser.hpp"

#include <algorithm>
#include <cctype>

#include "folio_core/errors.hpp"

namespace folio_core {

bool JsonAttributeParser::can_handle(AttributeSyntax syntax) const {
  return syntax == AttributeSyntax::Json;
}

AttributeMap JsonAttributeParser::parse(const std::string& document,
                                        const std::string& origin) const {
  const bool blank = std::all_of(document.begin(), document.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank) {
    return make_attribute_map();
  }

  AttributeValue value;
  try {
    value = AttributeValue::parse(document);
  } catch (const nlohmann::json::parse_error& e) {
    throw AttributeParseError(origin, e.what());
  }

  if (value.is_null()) {
    return make_attribute_map();
  }
  if (!value.is_object()) {
    throw AttributeParseError(origin, "expected an object at the top level");
  }
  return value;
}

}  // namespace folio_core
