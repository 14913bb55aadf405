#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace folio_core {

enum class AttributeSyntax { Yaml, Json };

std::string to_string(AttributeSyntax syntax);
// Throws ConfigurationError for anything other than "yaml" or "json".
AttributeSyntax attribute_syntax_from_string(const std::string& str);

/**
 * @brief Validated ingestion parameters for the filesystem data source.
 *
 * Built either from a raw settings object with from_json(), which applies the
 * defaults and validates, or programmatically followed by validate().
 * Neither touches the filesystem.
 */
struct DataSourceConfig {
  std::filesystem::path source_root;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  // Lower-cased, without leading dot. Compound entries like "html.twig" allowed.
  std::vector<std::string> text_extensions;
  AttributeSyntax attribute_syntax = AttributeSyntax::Yaml;

  std::filesystem::path content_root() const {
    return source_root / "content";
  }
  std::filesystem::path layouts_root() const {
    return source_root / "layouts";
  }
  std::filesystem::path includes_root() const {
    return source_root / "includes";
  }

  static DataSourceConfig from_json(const nlohmann::json& params);

  // Throws ConfigurationError describing the first violated rule.
  void validate() const;

  // "MD" and ".md" both become "md".
  static std::string normalize_extension(const std::string& extension);
};

}  // namespace folio_core
