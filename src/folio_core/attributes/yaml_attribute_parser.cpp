#include "folio_core/attributes/yaml_attribute_parser.hpp"

#include <yaml-cpp/yaml.h>

#include "folio_core/errors.hpp"

namespace folio_core {

namespace {

// Plain scalars get typed; quoted ones ("!" tag) always stay strings.
AttributeValue scalar_value(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    return text;
  }
  if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
    return nullptr;
  }
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }

  long long integer = 0;
  if (YAML::convert<long long>::decode(node, integer)) {
    return integer;
  }
  double number = 0.0;
  if (YAML::convert<double>::decode(node, number)) {
    return number;
  }
  return text;
}

AttributeValue to_attribute_value(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return scalar_value(node);
    case YAML::NodeType::Sequence: {
      AttributeValue sequence = AttributeValue::array();
      for (const auto& child : node) {
        sequence.push_back(to_attribute_value(child));
      }
      return sequence;
    }
    case YAML::NodeType::Map: {
      AttributeValue map = AttributeValue::object();
      for (const auto& entry : node) {
        map[entry.first.as<std::string>()] = to_attribute_value(entry.second);
      }
      return map;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
      return nullptr;
  }
}

}  // namespace

bool YamlAttributeParser::can_handle(AttributeSyntax syntax) const {
  return syntax == AttributeSyntax::Yaml;
}

AttributeMap YamlAttributeParser::parse(const std::string& document,
                                        const std::string& origin) const {
  AttributeValue value;
  try {
    YAML::Node root = YAML::Load(document);
    value = to_attribute_value(root);
  } catch (const YAML::Exception& e) {
    throw AttributeParseError(origin, e.what());
  }

  if (value.is_null()) {
    return make_attribute_map();
  }
  if (!value.is_object()) {
    throw AttributeParseError(origin, "expected a mapping at the top level");
  }
  return value;
}

}  // namespace folio_core
