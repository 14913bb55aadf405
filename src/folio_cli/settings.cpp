#include "folio_cli/settings.hpp"

#include <fstream>
#include <stdexcept>

namespace folio_cli {

const std::vector<std::string>& Settings::default_text_extensions() {
  static const std::vector<std::string> extensions = {
      "htm",  "html",    "html.twig", "twig.html", "twig",       "js",   "less",
      "markdown", "md",  "mkd",       "mkdn",      "coffee",     "css",  "erb",
      "haml", "handlebars", "hb",     "ms",        "mustache",   "php",  "rb",
      "sass", "scss",    "slim",      "txt",       "xhtml",      "xml"};
  return extensions;
}

Settings Settings::from_file(const std::string& filename) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw std::runtime_error("Failed to open settings file: " + filename);
  }

  nlohmann::json json_settings;
  try {
    file_stream >> json_settings;
  } catch (const std::exception& e) {
    throw std::runtime_error(std::string("Failed to parse JSON in settings file '") + filename +
                             "': " + e.what());
  }

  return from_json(json_settings);
}

Settings Settings::from_json(const nlohmann::json& json_settings) {
  if (!json_settings.is_object()) {
    throw std::runtime_error("Settings must be a JSON object");
  }

  Settings settings;
  try {
    settings.source_root = json_settings.value("source_root", std::string());
    settings.include =
        json_settings.value("include", std::vector<std::string>{".htaccess"});
    settings.exclude = json_settings.value("exclude", std::vector<std::string>{});
    settings.text_extensions =
        json_settings.value("text_extensions", default_text_extensions());
    settings.attribute_syntax = json_settings.value("attribute_syntax", std::string("yaml"));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid settings: ") + e.what());
  }
  return settings;
}

nlohmann::json Settings::to_data_source_params() const {
  return {{"source_root", source_root},
          {"include", include},
          {"exclude", exclude},
          {"text_extensions", text_extensions},
          {"attribute_syntax", attribute_syntax}};
}

}  // namespace folio_cli
