#pragma once

#include <nlohmann/json.hpp>

namespace folio_core {

// Tagged attribute value: null, string, integer, float, bool, ordered
// sequence or ordered map. Key order follows the source document.
using AttributeValue = nlohmann::ordered_json;

// An item's attribute set. Always a JSON object.
using AttributeMap = nlohmann::ordered_json;

namespace attribute_keys {
inline constexpr const char* kMtime = "mtime";
inline constexpr const char* kFilename = "filename";
inline constexpr const char* kExtension = "extension";
inline constexpr const char* kTitle = "title";
inline constexpr const char* kTitlePath = "title_path";
inline constexpr const char* kDate = "date";
inline constexpr const char* kCategories = "categories";
}  // namespace attribute_keys

inline AttributeMap make_attribute_map() {
  return AttributeMap::object();
}

// True when `key` holds a non-null value. Null counts as "not set" for the
// filename-derived defaults.
inline bool has_explicit_attribute(const AttributeMap& attributes, const char* key) {
  auto it = attributes.find(key);
  return it != attributes.end() && !it->is_null();
}

}  // namespace folio_core
