#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace folio_cli {

/**
 * @brief Site settings that feed the filesystem data source.
 *
 * Missing keys fall back to the site defaults (the usual web text
 * extensions, ".htaccess" force-included, yaml attributes).
 */
class Settings {
 public:
  std::string source_root;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::vector<std::string> text_extensions;
  std::string attribute_syntax;

  // Load settings from a JSON file at the given path
  static Settings from_file(const std::string& filename);

  // Construct settings from a JSON object (useful for tests)
  static Settings from_json(const nlohmann::json& json_settings);

  static const std::vector<std::string>& default_text_extensions();

  // Raw parameters for folio_core::DataSourceConfig::from_json().
  nlohmann::json to_data_source_params() const;
};

}  // namespace folio_cli
