#pragma once

#include <filesystem>
#include <string>

#include "folio_core/attributes/attribute_parser.hpp"
#include "folio_core/fs/file_system.hpp"
#include "folio_core/fs/file_walker.hpp"
#include "folio_core/types/item.hpp"

namespace folio_core {

struct ExtractedAttributes {
  AttributeMap attributes = make_attribute_map();
  // Effective body: frontmatter-stripped when frontmatter was consumed,
  // otherwise the raw content.
  std::string body;
  bool frontmatter_consumed = false;
};

/**
 * @class AttributeExtractor
 * @brief Resolves an item's explicit attributes from its sidecar file or,
 * failing that, from the frontmatter at the top of its content.
 *
 * Sidecars ("<id>.meta" under the content root) apply to content items only
 * and win over frontmatter; the content is then left untouched. Layouts read
 * frontmatter only. Includes and binary files without a sidecar are not parsed.
 */
class AttributeExtractor {
 public:
  AttributeExtractor(const IFileSystem& file_system, const AttributeParser& parser,
                     std::filesystem::path content_root);

  ExtractedAttributes extract(const WalkedFile& file, ItemRole role, bool is_binary,
                              const std::string& raw_content) const;

  std::filesystem::path sidecar_path(const std::string& relative_path) const;

 private:
  const IFileSystem& file_system_;
  const AttributeParser& parser_;
  std::filesystem::path content_root_;
};

}  // namespace folio_core
