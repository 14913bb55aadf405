#pragma once

#include <string>
#include <vector>

namespace folio_core {

/**
 * @class FileInfo
 * @brief Splits a file name into base name and extension against the
 * configured text extensions, and classifies the file as text or binary.
 *
 * The longest configured extension that suffixes the name wins, so with
 * "html.twig" configured, "index.html.twig" has filename "index" and
 * extension "html.twig". Otherwise the extension is whatever follows the
 * last dot. Comparison is case-insensitive.
 */
class FileInfo {
 public:
  FileInfo(const std::string& path, const std::vector<std::string>& text_extensions);

  // Base name without the extension.
  const std::string& filename() const {
    return filename_;
  }
  // Extension without the leading dot, as spelled in the file name. Empty when none.
  const std::string& extension() const {
    return extension_;
  }
  bool has_predefined_extension() const {
    return has_predefined_extension_;
  }
  bool is_binary() const {
    return !has_predefined_extension_;
  }

 private:
  std::string filename_;
  std::string extension_;
  bool has_predefined_extension_ = false;
};

}  // namespace folio_core
