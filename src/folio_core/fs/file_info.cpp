#include "folio_core/fs/file_info.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace folio_core {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

FileInfo::FileInfo(const std::string& path, const std::vector<std::string>& text_extensions) {
  const std::string basename = std::filesystem::path(path).filename().string();
  const std::string lowered = to_lower(basename);

  size_t best_length = 0;
  for (const auto& extension : text_extensions) {
    const std::string suffix = "." + to_lower(extension);
    // The name must keep at least one character in front of the extension.
    if (lowered.size() <= suffix.size() || extension.size() <= best_length) continue;
    if (lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0) {
      best_length = extension.size();
    }
  }

  if (best_length > 0) {
    has_predefined_extension_ = true;
    extension_ = basename.substr(basename.size() - best_length);
    filename_ = basename.substr(0, basename.size() - best_length - 1);
    return;
  }

  // ".htaccess" has no extension; std::filesystem agrees.
  std::filesystem::path p(basename);
  extension_ = p.extension().string();
  if (!extension_.empty()) {
    extension_.erase(0, 1);
  }
  filename_ = p.stem().string();
}

}  // namespace folio_core
