#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "folio_core/attributes/attribute_parser_factory.hpp"
#include "folio_core/config/data_source_config.hpp"
#include "folio_core/fs/file_system.hpp"
#include "folio_core/fs/file_walker.hpp"
#include "folio_core/services/data_source.hpp"

namespace folio_core {

/**
 * @class FilesystemDataSource
 * @brief Builds items from a site directory laid out as
 *
 *   <source_root>/content    pages, posts and assets
 *   <source_root>/layouts    optional
 *   <source_root>/includes   optional
 *
 * Text files (extension listed in text_extensions) have their content loaded;
 * binary files only carry their absolute path in the "source" path snapshot.
 * Attributes come from a "<file>.meta" sidecar or from frontmatter, and every
 * item additionally receives mtime, filename and extension. Content and
 * layout files named "yyyy-mm-dd-title.ext" receive title, title_path and
 * date; content under posts/ receives categories.
 */
class FilesystemDataSource : public DataSource {
 public:
  FilesystemDataSource(DataSourceConfig config, std::shared_ptr<IFileSystem> file_system);

  // Validates the configuration and resets the collections. No filesystem access.
  void configure() override;

  // Throws std::logic_error when called before configure(). Any
  // ConfigurationError, AttributeParseError or FileAccessError aborts the
  // pass; the collections are not valid afterwards.
  void process() override;

  const ItemCollection& items() const override {
    return items_;
  }
  const ItemCollection& layouts() const override {
    return layouts_;
  }
  const ItemCollection& includes() const override {
    return includes_;
  }

  // UTC, e.g. "2020-05-01T10:00:00+0000".
  static std::string format_mtime(std::chrono::system_clock::time_point time);

 private:
  void process_items(const std::vector<WalkedFile>& files, ItemRole role, ItemCollection& target);
  Item assemble(const WalkedFile& file, ItemRole role) const;

  DataSourceConfig config_;
  std::shared_ptr<IFileSystem> file_system_;
  std::unique_ptr<AttributeParserFactory> parser_factory_;
  const AttributeParser* attribute_parser_ = nullptr;

  ItemCollection items_;
  ItemCollection layouts_;
  ItemCollection includes_;
};

}  // namespace folio_core
