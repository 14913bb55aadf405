#include "folio_core/services/item_collection.hpp"

#include <stdexcept>

namespace folio_core {

bool ItemCollection::put(Item item) {
  const std::string id = item.id();
  auto it = items_.find(id);
  if (it != items_.end()) {
    it->second = std::move(item);
    ++replaced_count_;
    return true;
  }
  items_.emplace(id, std::move(item));
  return false;
}

const Item& ItemCollection::at(const std::string& id) const {
  auto it = items_.find(id);
  if (it == items_.end()) {
    throw std::out_of_range("No item with id '" + id + "'");
  }
  return it->second;
}

std::vector<std::string> ItemCollection::ids() const {
  std::vector<std::string> out;
  out.reserve(items_.size());
  for (const auto& [id, item] : items_) {
    out.push_back(id);
  }
  return out;
}

void ItemCollection::clear() {
  items_.clear();
  replaced_count_ = 0;
}

}  // namespace folio_core
