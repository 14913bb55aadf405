#include "folio_core/config/data_source_config.hpp"

#include <algorithm>
#include <cctype>

#include "folio_core/errors.hpp"

namespace folio_core {

namespace {

std::vector<std::string> read_string_list(const nlohmann::json& params, const std::string& key) {
  std::vector<std::string> out;
  if (!params.contains(key) || params.at(key).is_null()) {
    return out;
  }
  const auto& value = params.at(key);
  if (!value.is_array()) {
    throw ConfigurationError("'" + key + "' must be a list of strings");
  }
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      throw ConfigurationError("'" + key + "' must be a list of strings");
    }
    out.push_back(entry.get<std::string>());
  }
  return out;
}

}  // namespace

std::string to_string(AttributeSyntax syntax) {
  switch (syntax) {
    case AttributeSyntax::Yaml:
      return "yaml";
    case AttributeSyntax::Json:
      return "json";
  }
  return "unknown";
}

AttributeSyntax attribute_syntax_from_string(const std::string& str) {
  if (str == "yaml")
    return AttributeSyntax::Yaml;
  if (str == "json")
    return AttributeSyntax::Json;
  throw ConfigurationError("Invalid attribute_syntax '" + str + "': expected \"yaml\" or \"json\"");
}

std::string DataSourceConfig::normalize_extension(const std::string& extension) {
  std::string out = extension;
  if (!out.empty() && out.front() == '.') {
    out.erase(0, 1);
  }
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

DataSourceConfig DataSourceConfig::from_json(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw ConfigurationError("Data source parameters must be an object");
  }

  DataSourceConfig config;

  if (!params.contains("source_root") || !params.at("source_root").is_string()) {
    throw ConfigurationError("Missing required parameter 'source_root'");
  }
  config.source_root = params.at("source_root").get<std::string>();

  config.include = read_string_list(params, "include");
  config.exclude = read_string_list(params, "exclude");

  if (!params.contains("text_extensions")) {
    throw ConfigurationError("Missing required parameter 'text_extensions'");
  }
  for (const auto& extension : read_string_list(params, "text_extensions")) {
    std::string normalized = normalize_extension(extension);
    if (normalized.empty()) {
      continue;
    }
    if (std::find(config.text_extensions.begin(), config.text_extensions.end(), normalized) ==
        config.text_extensions.end()) {
      config.text_extensions.push_back(normalized);
    }
  }

  if (params.contains("attribute_syntax")) {
    const auto& syntax = params.at("attribute_syntax");
    if (!syntax.is_string()) {
      throw ConfigurationError("'attribute_syntax' must be a string");
    }
    config.attribute_syntax = attribute_syntax_from_string(syntax.get<std::string>());
  }

  config.validate();
  return config;
}

void DataSourceConfig::validate() const {
  if (source_root.empty()) {
    throw ConfigurationError("source_root cannot be empty");
  }
  if (text_extensions.empty()) {
    throw ConfigurationError("text_extensions cannot be empty");
  }
  for (const auto& extension : text_extensions) {
    if (extension.empty() || extension != normalize_extension(extension)) {
      throw ConfigurationError("text_extensions entry '" + extension +
                               "' must be lower case without a leading dot");
    }
  }
  if (attribute_syntax != AttributeSyntax::Yaml && attribute_syntax != AttributeSyntax::Json) {
    throw ConfigurationError("attribute_syntax must be yaml or json");
  }
}

}  // namespace folio_core
