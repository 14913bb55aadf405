#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "folio_core/config/data_source_config.hpp"
#include "folio_core/fs/file_system.hpp"

namespace folio_core {

// A file discovered by the walker.
struct WalkedFile {
  // Forward-slash path relative to the directory it was found under.
  std::string relative_path;
  std::filesystem::path absolute_path;
};

/**
 * @class FileWalker
 * @brief Enumerates candidate files under the content, layouts and includes
 * roots of a site, applying the include/exclude rules.
 *
 * Listings are sorted by relative path so that repeated passes over the same
 * tree yield the same sequence.
 */
class FileWalker {
 public:
  static constexpr const char* SIDECAR_SUFFIX = ".meta";

  FileWalker(const IFileSystem& file_system, const DataSourceConfig& config);

  // Content root, then include directories, then include files.
  // Throws FileAccessError when the content root does not exist.
  std::vector<WalkedFile> walk_content() const;

  // Empty when the root is missing.
  std::vector<WalkedFile> walk_layouts() const;
  std::vector<WalkedFile> walk_includes() const;

  static std::string normalize_separators(const std::filesystem::path& path);

  // Hidden files and version-control directories are skipped by default scans.
  static bool is_ignored(const std::string& relative_path);

  // True when `entry` occurs anywhere in the forward-slash `relative_path`,
  // so "drafts" also drops "drafts-old/a.md". A leading "./" is ignored.
  static bool matches_exclude(const std::string& relative_path, const std::string& entry);

 private:
  std::vector<WalkedFile> scan_directory(const std::filesystem::path& root, bool content_rules) const;
  std::vector<WalkedFile> walk_optional_root(const std::filesystem::path& root) const;
  std::filesystem::path resolve_include(const std::string& entry) const;
  bool is_excluded(const std::string& relative_path) const;

  const IFileSystem& file_system_;
  const DataSourceConfig& config_;
};

}  // namespace folio_core
