#pragma once

#include <map>
#include <optional>
#include <string>

#include "folio_core/types/attributes.hpp"

namespace folio_core {

enum class ItemRole { Content, Layout, Include };

std::string to_string(ItemRole role);

/**
 * @class Item
 * @brief One ingested file: content snapshots, path snapshots and attributes.
 *
 * Items are assembled by the data source during a single pass and handed out
 * by const reference afterwards.
 */
class Item {
 public:
  // Content snapshots
  static constexpr const char* SNAPSHOT_RAW = "raw";
  static constexpr const char* SNAPSHOT_LAST = "last";

  // Path snapshots
  static constexpr const char* SNAPSHOT_PATH_RELATIVE = "relative";
  static constexpr const char* SNAPSHOT_PATH_SOURCE = "source";

  // `raw_content` seeds both the raw and the last snapshot.
  Item(std::string id, ItemRole role, bool is_binary, std::string raw_content);

  const std::string& id() const {
    return id_;
  }
  ItemRole role() const {
    return role_;
  }
  bool is_binary() const {
    return is_binary_;
  }

  // Effective body by default. Throws std::out_of_range for unknown snapshots.
  const std::string& content(const std::string& snapshot = SNAPSHOT_LAST) const;
  bool has_content_snapshot(const std::string& snapshot) const;
  void set_content(std::string content, const std::string& snapshot);

  std::optional<std::string> path(const std::string& snapshot = SNAPSHOT_PATH_RELATIVE) const;
  void set_path(std::string path, const std::string& snapshot);

  const AttributeMap& attributes() const {
    return attributes_;
  }
  void set_attributes(AttributeMap attributes);

  // Serialized form used by the command line dump.
  nlohmann::ordered_json to_json() const;

 private:
  std::string id_;
  ItemRole role_;
  bool is_binary_;
  std::map<std::string, std::string> content_snapshots_;
  std::map<std::string, std::string> path_snapshots_;
  AttributeMap attributes_;
};

}  // namespace folio_core
