#pragma once

#include <optional>
#include <string>
#include <vector>

#include "folio_core/types/attributes.hpp"

namespace folio_core {

inline constexpr const char* kPostsDirectory = "posts";

// Categories for an item whose id is `relative_path`: the directories between
// "posts/" and the file. std::nullopt when the item is not under posts/.
std::optional<std::vector<std::string>> derive_categories(const std::string& relative_path);

// Stores the derived categories unless the key is already present.
void apply_categories(const std::string& relative_path, AttributeMap& attributes);

}  // namespace folio_core
