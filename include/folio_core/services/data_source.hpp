#pragma once

#include "folio_core/services/item_collection.hpp"

namespace folio_core {

// A source of site items. Callers must configure(), then process(), then read.
class DataSource {
 public:
  virtual ~DataSource() = default;

  virtual void configure() = 0;
  virtual void process() = 0;

  virtual const ItemCollection& items() const = 0;
  virtual const ItemCollection& layouts() const = 0;
  virtual const ItemCollection& includes() const = 0;
};

}  // namespace folio_core
