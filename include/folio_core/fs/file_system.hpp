#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace folio_core {

/**
 * @class IFileSystem
 * @brief Minimal filesystem surface used by the ingestion pipeline.
 *
 * Lets the walker and the data source run against an in-memory fixture in
 * tests. Failures other than "does not exist" throw FileAccessError.
 */
class IFileSystem {
 public:
  virtual ~IFileSystem() = default;

  virtual bool is_directory(const std::filesystem::path& path) const = 0;
  virtual bool is_regular_file(const std::filesystem::path& path) const = 0;

  // Every regular file under `root`, recursively, as paths relative to `root`.
  virtual std::vector<std::filesystem::path> list_files(const std::filesystem::path& root) const = 0;

  virtual std::string read_file(const std::filesystem::path& path) const = 0;

  virtual std::chrono::system_clock::time_point last_write_time(
      const std::filesystem::path& path) const = 0;

  // Absolute, normalized form of `path`.
  virtual std::filesystem::path absolute_path(const std::filesystem::path& path) const = 0;
};

// IFileSystem over std::filesystem.
class LocalFileSystem : public IFileSystem {
 public:
  bool is_directory(const std::filesystem::path& path) const override;
  bool is_regular_file(const std::filesystem::path& path) const override;
  std::vector<std::filesystem::path> list_files(const std::filesystem::path& root) const override;
  std::string read_file(const std::filesystem::path& path) const override;
  std::chrono::system_clock::time_point last_write_time(
      const std::filesystem::path& path) const override;
  std::filesystem::path absolute_path(const std::filesystem::path& path) const override;
};

}  // namespace folio_core
