#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "folio_core/types/item.hpp"

namespace folio_core {

/**
 * @class ItemCollection
 * @brief Id-keyed, id-ordered set of items produced by one ingestion pass.
 *
 * Duplicate ids follow a last-write-wins policy: put() replaces an existing
 * item with the same id and reports it. This happens when an `include` entry
 * overlaps the default scan.
 */
class ItemCollection {
 public:
  using Storage = std::map<std::string, Item>;
  using const_iterator = Storage::const_iterator;

  // Returns true when an item with the same id was replaced.
  bool put(Item item);

  // Throws std::out_of_range for unknown ids.
  const Item& at(const std::string& id) const;
  bool contains(const std::string& id) const {
    return items_.count(id) > 0;
  }

  size_t size() const {
    return items_.size();
  }
  bool empty() const {
    return items_.empty();
  }
  size_t replaced_count() const {
    return replaced_count_;
  }

  std::vector<std::string> ids() const;
  void clear();

  const_iterator begin() const {
    return items_.begin();
  }
  const_iterator end() const {
    return items_.end();
  }

 private:
  Storage items_;
  size_t replaced_count_ = 0;
};

}  // namespace folio_core
