#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. folio_core/types/item.hpp),
// users can simply do `#include "folio_core/types.hpp"`.
//
#include "folio_core/types/attributes.hpp"
#include "folio_core/types/item.hpp"
