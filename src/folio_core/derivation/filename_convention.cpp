#include "folio_core/derivation/filename_convention.hpp"

#include <algorithm>
#include <regex>

namespace folio_core {

std::string DateFilename::title() const {
  std::string out = title_path;
  std::replace(out.begin(), out.end(), '-', ' ');
  return out;
}

std::optional<DateFilename> parse_date_filename(const std::string& filename) {
  static const std::regex date_regex(R"(^(\d{4})-(\d{2})-(\d{2})-(.+)$)");

  std::smatch match;
  if (!std::regex_match(filename, match, date_regex)) {
    return std::nullopt;
  }
  return DateFilename{match[1].str(), match[2].str(), match[3].str(), match[4].str()};
}

bool apply_filename_convention(const std::string& filename, AttributeMap& attributes) {
  auto parsed = parse_date_filename(filename);
  if (!parsed) {
    return false;
  }

  attributes[attribute_keys::kTitlePath] = parsed->title_path;

  if (!has_explicit_attribute(attributes, attribute_keys::kTitle)) {
    attributes[attribute_keys::kTitle] = parsed->title();
  }
  if (!has_explicit_attribute(attributes, attribute_keys::kDate)) {
    attributes[attribute_keys::kDate] = parsed->date();
  }
  return true;
}

}  // namespace folio_core
