#include "folio_core/fs/file_walker.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "folio_core/errors.hpp"

namespace folio_core {

namespace {

const std::vector<std::string> kVcsDirectories = {"CVS", "_darcs", "_svn"};

std::vector<std::string> split_segments(const std::string& path) {
  std::vector<std::string> segments;
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

FileWalker::FileWalker(const IFileSystem& file_system, const DataSourceConfig& config)
    : file_system_(file_system), config_(config) {}

std::string FileWalker::normalize_separators(const std::filesystem::path& path) {
  return path.generic_string();
}

bool FileWalker::is_ignored(const std::string& relative_path) {
  for (const auto& segment : split_segments(relative_path)) {
    if (segment.front() == '.') return true;
    if (std::find(kVcsDirectories.begin(), kVcsDirectories.end(), segment) != kVcsDirectories.end())
      return true;
  }
  return false;
}

bool FileWalker::matches_exclude(const std::string& relative_path, const std::string& entry) {
  std::string pattern = entry;
  if (pattern.rfind("./", 0) == 0) {
    pattern.erase(0, 2);
  }
  if (pattern.empty()) {
    return false;
  }
  return relative_path.find(pattern) != std::string::npos;
}

bool FileWalker::is_excluded(const std::string& relative_path) const {
  for (const auto& entry : config_.exclude) {
    if (matches_exclude(relative_path, entry)) return true;
  }
  return false;
}

std::filesystem::path FileWalker::resolve_include(const std::string& entry) const {
  std::filesystem::path p(entry);
  if (p.is_relative()) {
    return config_.content_root() / p;
  }
  return p;
}

std::vector<WalkedFile> FileWalker::scan_directory(const std::filesystem::path& root,
                                                   bool content_rules) const {
  std::vector<WalkedFile> out;
  for (const auto& relative : file_system_.list_files(root)) {
    std::string id = normalize_separators(relative);
    if (is_ignored(id)) continue;
    if (content_rules) {
      if (ends_with(id, SIDECAR_SUFFIX)) continue;
      if (is_excluded(id)) continue;
    }
    out.push_back({id, root / relative});
  }
  std::sort(out.begin(), out.end(), [](const WalkedFile& a, const WalkedFile& b) {
    return a.relative_path < b.relative_path;
  });
  return out;
}

std::vector<WalkedFile> FileWalker::walk_content() const {
  const auto content_root = config_.content_root();
  if (!file_system_.is_directory(content_root)) {
    throw FileAccessError(content_root.string(), "Content directory not found");
  }

  std::vector<WalkedFile> out = scan_directory(content_root, true);

  std::vector<WalkedFile> included_files;
  for (const auto& entry : config_.include) {
    const auto path = resolve_include(entry);
    if (file_system_.is_directory(path)) {
      auto scanned = scan_directory(path, true);
      out.insert(out.end(), scanned.begin(), scanned.end());
    } else if (file_system_.is_regular_file(path)) {
      included_files.push_back({path.filename().string(), path});
    } else {
      std::cerr << "[Walker] Skipping include entry that is neither file nor directory: "
                << path.string() << std::endl;
    }
  }
  out.insert(out.end(), included_files.begin(), included_files.end());
  return out;
}

std::vector<WalkedFile> FileWalker::walk_optional_root(const std::filesystem::path& root) const {
  if (!file_system_.is_directory(root)) {
    return {};
  }
  return scan_directory(root, false);
}

std::vector<WalkedFile> FileWalker::walk_layouts() const {
  return walk_optional_root(config_.layouts_root());
}

std::vector<WalkedFile> FileWalker::walk_includes() const {
  return walk_optional_root(config_.includes_root());
}

}  // namespace folio_core
