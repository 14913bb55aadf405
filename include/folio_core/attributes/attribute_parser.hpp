#pragma once

#include <memory>
#include <optional>
#include <string>

#include "folio_core/config/data_source_config.hpp"
#include "folio_core/types/attributes.hpp"

namespace folio_core {

// A frontmatter block split off the top of a file.
struct Frontmatter {
  std::string block;  // text between the delimiters
  std::string body;   // content after the closing delimiter line
};

/**
 * @class AttributeParser
 * @brief Turns a structured document (sidecar file or frontmatter block)
 * into an attribute map.
 */
class AttributeParser {
 public:
  static constexpr const char* DELIMITER = "---";

  virtual ~AttributeParser() = default;

  // Checks if this parser handles the given syntax
  virtual bool can_handle(AttributeSyntax syntax) const = 0;

  // Parses a whole document. Empty or null documents give an empty map.
  // Throws AttributeParseError naming `origin` on malformed input or when
  // the top-level value is not a mapping.
  virtual AttributeMap parse(const std::string& document, const std::string& origin) const = 0;

  // Recognizes a block that starts on the first line (after an optional
  // UTF-8 BOM) with "---" and ends at the next line that is exactly "---".
  static std::optional<Frontmatter> split_frontmatter(const std::string& content);
};

using AttributeParserPtr = std::unique_ptr<AttributeParser>;

}  // namespace folio_core
