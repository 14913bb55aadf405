#pragma once

#include <exception>
#include <string>

namespace folio_core {

// Invalid or missing ingestion parameter. Raised before any file is touched.
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Malformed sidecar or frontmatter document.
class AttributeParseError : public std::exception {
 public:
  AttributeParseError(const std::string& file, const std::string& reason)
      : file_(file), message_("Failed to parse attributes in '" + file + "': " + reason) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

  const std::string& file() const {
    return file_;
  }

 private:
  std::string file_;
  std::string message_;
};

class FileAccessError : public std::exception {
 public:
  FileAccessError(const std::string& path, const std::string& reason)
      : path_(path), message_(reason + ": " + path) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
  std::string message_;
};

}  // namespace folio_core
