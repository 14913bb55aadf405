#include "folio_core/services/filesystem_data_source.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>

#include "folio_core/attributes/attribute_extractor.hpp"
#include "folio_core/derivation/category_deriver.hpp"
#include "folio_core/derivation/filename_convention.hpp"
#include "folio_core/fs/file_info.hpp"

namespace folio_core {

FilesystemDataSource::FilesystemDataSource(DataSourceConfig config,
                                           std::shared_ptr<IFileSystem> file_system)
    : config_(std::move(config)), file_system_(std::move(file_system)) {}

std::string FilesystemDataSource::format_mtime(std::chrono::system_clock::time_point time) {
  const std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+0000", &tm);
  return buffer;
}

void FilesystemDataSource::configure() {
  config_.validate();
  if (!file_system_) {
    throw std::invalid_argument("FilesystemDataSource requires a file system");
  }

  parser_factory_ = std::make_unique<AttributeParserFactory>();
  attribute_parser_ = &parser_factory_->get_parser_for(config_.attribute_syntax);

  items_.clear();
  layouts_.clear();
  includes_.clear();
}

void FilesystemDataSource::process() {
  if (attribute_parser_ == nullptr) {
    throw std::logic_error("FilesystemDataSource::process() called before configure()");
  }

  FileWalker walker(*file_system_, config_);
  process_items(walker.walk_content(), ItemRole::Content, items_);
  process_items(walker.walk_layouts(), ItemRole::Layout, layouts_);
  process_items(walker.walk_includes(), ItemRole::Include, includes_);

  std::cout << "[DataSource] Processed " << items_.size() << " items, " << layouts_.size()
            << " layouts, " << includes_.size() << " includes from "
            << config_.source_root.string() << std::endl;
}

void FilesystemDataSource::process_items(const std::vector<WalkedFile>& files, ItemRole role,
                                         ItemCollection& target) {
  for (const auto& file : files) {
    if (target.put(assemble(file, role))) {
      std::cerr << "[DataSource] Replaced " << to_string(role) << " with duplicate id: "
                << file.relative_path << " (" << file.absolute_path.string() << ")" << std::endl;
    }
  }
}

Item FilesystemDataSource::assemble(const WalkedFile& file, ItemRole role) const {
  const FileInfo file_info(file.relative_path, config_.text_extensions);
  const bool is_binary = file_info.is_binary();
  std::string raw_content = is_binary ? std::string() : file_system_->read_file(file.absolute_path);

  AttributeExtractor extractor(*file_system_, *attribute_parser_, config_.content_root());
  ExtractedAttributes extracted = extractor.extract(file, role, is_binary, raw_content);

  Item item(file.relative_path, role, is_binary, std::move(raw_content));
  item.set_path(file.relative_path, Item::SNAPSHOT_PATH_RELATIVE);
  if (is_binary) {
    item.set_path(FileWalker::normalize_separators(file_system_->absolute_path(file.absolute_path)),
                  Item::SNAPSHOT_PATH_SOURCE);
  }
  if (extracted.frontmatter_consumed) {
    item.set_content(std::move(extracted.body), Item::SNAPSHOT_LAST);
  }

  AttributeMap attributes = std::move(extracted.attributes);
  attributes[attribute_keys::kMtime] = format_mtime(file_system_->last_write_time(file.absolute_path));
  attributes[attribute_keys::kFilename] = file_info.filename();
  attributes[attribute_keys::kExtension] = file_info.extension();

  if (role != ItemRole::Include) {
    apply_filename_convention(file_info.filename(), attributes);
  }
  if (role == ItemRole::Content) {
    apply_categories(file.relative_path, attributes);
  }

  item.set_attributes(std::move(attributes));
  return item;
}

}  // namespace folio_core
