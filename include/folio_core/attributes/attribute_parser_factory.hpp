#pragma once
#include <memory>
#include <vector>

#include "attribute_parser.hpp"

/**
 * @class AttributeParserFactory
 * @brief Provides the AttributeParser for a configured attribute syntax.
 *
 * Holds one parser per supported syntax. This class is non-copyable and
 * non-movable.
 */
namespace folio_core {
class AttributeParserFactory {
 public:
  /**
   * @brief Constructs the factory and registers the yaml and json parsers.
   */
  AttributeParserFactory();
  virtual ~AttributeParserFactory() = default;

  /**
   * @brief Returns the parser that handles `syntax`.
   *
   * @throw ConfigurationError if no registered parser handles it.
   */
  virtual const AttributeParser& get_parser_for(AttributeSyntax syntax) const;

  AttributeParserFactory(const AttributeParserFactory&) = delete;
  AttributeParserFactory& operator=(const AttributeParserFactory&) = delete;
  AttributeParserFactory(AttributeParserFactory&&) = delete;
  AttributeParserFactory& operator=(AttributeParserFactory&&) = delete;

 private:
  std::vector<AttributeParserPtr> parsers;
};
}  // namespace folio_core
