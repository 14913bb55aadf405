#include "folio_core/derivation/category_deriver.hpp"

#include <sstream>

namespace folio_core {

std::optional<std::vector<std::string>> derive_categories(const std::string& relative_path) {
  const auto slash = relative_path.rfind('/');
  if (slash == std::string::npos) {
    return std::nullopt;
  }
  // Directory portion with a trailing slash so that "posts/x.md" qualifies.
  const std::string directory = relative_path.substr(0, slash + 1);
  const std::string prefix = std::string(kPostsDirectory) + "/";
  if (directory.rfind(prefix, 0) != 0) {
    return std::nullopt;
  }

  std::vector<std::string> categories;
  std::stringstream ss(directory.substr(prefix.size()));
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (!segment.empty()) {
      categories.push_back(segment);
    }
  }
  return categories;
}

void apply_categories(const std::string& relative_path, AttributeMap& attributes) {
  if (attributes.contains(attribute_keys::kCategories)) {
    return;
  }
  auto categories = derive_categories(relative_path);
  if (categories) {
    attributes[attribute_keys::kCategories] = *categories;
  }
}

}  // namespace folio_core
