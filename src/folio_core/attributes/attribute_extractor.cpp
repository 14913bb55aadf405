#include "folio_core/attributes/attribute_extractor.hpp"

namespace folio_core {

AttributeExtractor::AttributeExtractor(const IFileSystem& file_system,
                                       const AttributeParser& parser,
                                       std::filesystem::path content_root)
    : file_system_(file_system), parser_(parser), content_root_(std::move(content_root)) {}

std::filesystem::path AttributeExtractor::sidecar_path(const std::string& relative_path) const {
  return content_root_ / std::filesystem::path(relative_path + FileWalker::SIDECAR_SUFFIX);
}

ExtractedAttributes AttributeExtractor::extract(const WalkedFile& file, ItemRole role,
                                                bool is_binary,
                                                const std::string& raw_content) const {
  ExtractedAttributes result;
  result.body = raw_content;

  if (role == ItemRole::Include) {
    return result;
  }

  if (role == ItemRole::Content) {
    const auto sidecar = sidecar_path(file.relative_path);
    if (file_system_.is_regular_file(sidecar)) {
      result.attributes =
          parser_.parse(file_system_.read_file(sidecar), sidecar.generic_string());
      return result;
    }
  }

  if (is_binary) {
    return result;
  }

  auto frontmatter = AttributeParser::split_frontmatter(raw_content);
  if (frontmatter) {
    result.attributes = parser_.parse(frontmatter->block, file.absolute_path.generic_string());
    result.body = std::move(frontmatter->body);
    result.frontmatter_consumed = true;
  }
  return result;
}

}  // namespace folio_core
