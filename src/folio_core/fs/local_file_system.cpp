#include <chrono>
#include <fstream>
#include <sstream>

#include "folio_core/errors.hpp"
#include "folio_core/fs/file_system.hpp"

namespace folio_core {

namespace {

auto to_sys_time = [](std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(ftime));
};

}  // namespace

bool LocalFileSystem::is_directory(const std::filesystem::path& path) const {
  std::error_code ec;
  bool result = std::filesystem::is_directory(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw FileAccessError(path.string(), "Failed to stat (" + ec.message() + ")");
  }
  return result;
}

bool LocalFileSystem::is_regular_file(const std::filesystem::path& path) const {
  std::error_code ec;
  bool result = std::filesystem::is_regular_file(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw FileAccessError(path.string(), "Failed to stat (" + ec.message() + ")");
  }
  return result;
}

std::vector<std::filesystem::path> LocalFileSystem::list_files(
    const std::filesystem::path& root) const {
  std::vector<std::filesystem::path> files;
  try {
    for (auto it = std::filesystem::recursive_directory_iterator(root);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
      if (!it->is_regular_file()) continue;
      files.push_back(it->path().lexically_relative(root));
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw FileAccessError(root.string(), std::string("Failed to list directory (") + e.what() + ")");
  }
  return files;
}

std::string LocalFileSystem::read_file(const std::filesystem::path& path) const {
  std::ifstream file_stream(path, std::ios::in | std::ios::binary);
  if (!file_stream.is_open()) {
    throw FileAccessError(path.string(), "Could not open file");
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw FileAccessError(path.string(), "Failed to read file");
  }
  return buffer.str();
}

std::chrono::system_clock::time_point LocalFileSystem::last_write_time(
    const std::filesystem::path& path) const {
  std::error_code ec;
  auto ftime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    throw FileAccessError(path.string(), "Failed to read modification time (" + ec.message() + ")");
  }
  return to_sys_time(ftime);
}

std::filesystem::path LocalFileSystem::absolute_path(const std::filesystem::path& path) const {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    throw FileAccessError(path.string(), "Failed to resolve path (" + ec.message() + ")");
  }
  return canonical;
}

}  // namespace folio_core
