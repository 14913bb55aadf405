#pragma once

#include <optional>
#include <string>

#include "folio_core/types/attributes.hpp"

namespace folio_core {

// Components of a "yyyy-mm-dd-title" file name.
struct DateFilename {
  std::string year;
  std::string month;
  std::string day;
  std::string title_path;

  std::string date() const {
    return year + "-" + month + "-" + day;
  }
  // title_path with dashes turned into spaces.
  std::string title() const;
};

// Matches the whole base name (extension removed) against yyyy-mm-dd-<rest>.
// A name that only ends with such a run, like "notes-2020-05-01-x", does not match.
std::optional<DateFilename> parse_date_filename(const std::string& filename);

// Sets title_path on a match, and title/date unless already explicit.
// Returns true when the name matched.
bool apply_filename_convention(const std::string& filename, AttributeMap& attributes);

}  // namespace folio_core
