#pragma once

#include <gmock/gmock.h>

#include "folio_core/attributes/attribute_parser.hpp"
#include "folio_core/fs/file_system.hpp"

namespace folio_tests {

/**
 * Mock class for IFileSystem to use in tests
 */
class MockFileSystem : public folio_core::IFileSystem {
 public:
  MOCK_METHOD(bool, is_directory, (const std::filesystem::path& path), (const, override));
  MOCK_METHOD(bool, is_regular_file, (const std::filesystem::path& path), (const, override));
  MOCK_METHOD(std::vector<std::filesystem::path>, list_files, (const std::filesystem::path& root),
              (const, override));
  MOCK_METHOD(std::string, read_file, (const std::filesystem::path& path), (const, override));
  MOCK_METHOD(std::chrono::system_clock::time_point, last_write_time,
              (const std::filesystem::path& path), (const, override));
  MOCK_METHOD(std::filesystem::path, absolute_path, (const std::filesystem::path& path),
              (const, override));
};

/**
 * Mock class for AttributeParser to use in tests
 */
class MockAttributeParser : public folio_core::AttributeParser {
 public:
  MOCK_METHOD(bool, can_handle, (folio_core::AttributeSyntax syntax), (const, override));
  MOCK_METHOD(folio_core::AttributeMap, parse, (const std::string& document, const std::string& origin),
              (const, override));
};

}  // namespace folio_tests
