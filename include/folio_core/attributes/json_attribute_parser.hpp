#pragma once
#include "attribute_parser.hpp"

namespace folio_core {

class JsonAttributeParser : public AttributeParser {
 public:
  bool can_handle(AttributeSyntax syntax) const override;

  AttributeMap parse(const std::string& document, const std::string& origin) const override;
};

}  // namespace folio_core
