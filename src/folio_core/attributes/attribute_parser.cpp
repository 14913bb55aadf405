#include "folio_core/attributes/attribute_parser.hpp"

namespace folio_core {

namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

bool is_delimiter_line(const std::string& content, size_t begin, size_t end) {
  std::string line = content.substr(begin, end - begin);
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.pop_back();
  }
  return line == AttributeParser::DELIMITER;
}

}  // namespace

std::optional<Frontmatter> AttributeParser::split_frontmatter(const std::string& content) {
  size_t pos = 0;
  if (content.compare(0, 3, kUtf8Bom) == 0) {
    pos = 3;
  }

  size_t line_end = content.find('\n', pos);
  if (line_end == std::string::npos || !is_delimiter_line(content, pos, line_end)) {
    return std::nullopt;
  }

  const size_t block_start = line_end + 1;
  size_t cursor = block_start;
  while (cursor < content.size()) {
    size_t next = content.find('\n', cursor);
    size_t end = next == std::string::npos ? content.size() : next;
    if (is_delimiter_line(content, cursor, end)) {
      Frontmatter frontmatter;
      frontmatter.block = content.substr(block_start, cursor - block_start);
      frontmatter.body = next == std::string::npos ? std::string() : content.substr(next + 1);
      return frontmatter;
    }
    if (next == std::string::npos) break;
    cursor = next + 1;
  }
  return std::nullopt;
}

}  // namespace folio_core
