#include "folio_core/types/item.hpp"

#include <stdexcept>

namespace folio_core {

std::string to_string(ItemRole role) {
  switch (role) {
    case ItemRole::Content:
      return "content";
    case ItemRole::Layout:
      return "layout";
    case ItemRole::Include:
      return "include";
  }
  return "unknown";
}

Item::Item(std::string id, ItemRole role, bool is_binary, std::string raw_content)
    : id_(std::move(id)), role_(role), is_binary_(is_binary), attributes_(make_attribute_map()) {
  content_snapshots_[SNAPSHOT_LAST] = raw_content;
  content_snapshots_[SNAPSHOT_RAW] = std::move(raw_content);
}

const std::string& Item::content(const std::string& snapshot) const {
  auto it = content_snapshots_.find(snapshot);
  if (it == content_snapshots_.end()) {
    throw std::out_of_range("Item '" + id_ + "' has no content snapshot '" + snapshot + "'");
  }
  return it->second;
}

bool Item::has_content_snapshot(const std::string& snapshot) const {
  return content_snapshots_.count(snapshot) > 0;
}

void Item::set_content(std::string content, const std::string& snapshot) {
  content_snapshots_[snapshot] = std::move(content);
}

std::optional<std::string> Item::path(const std::string& snapshot) const {
  auto it = path_snapshots_.find(snapshot);
  if (it == path_snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Item::set_path(std::string path, const std::string& snapshot) {
  path_snapshots_[snapshot] = std::move(path);
}

void Item::set_attributes(AttributeMap attributes) {
  if (!attributes.is_object()) {
    throw std::invalid_argument("Item attributes must be a map: " + id_);
  }
  attributes_ = std::move(attributes);
}

nlohmann::ordered_json Item::to_json() const {
  nlohmann::ordered_json out;
  out["id"] = id_;
  out["role"] = to_string(role_);
  out["binary"] = is_binary_;
  out["attributes"] = attributes_;

  nlohmann::ordered_json paths = nlohmann::ordered_json::object();
  for (const auto& [name, value] : path_snapshots_) {
    paths[name] = value;
  }
  out["paths"] = paths;

  if (!is_binary_) {
    nlohmann::ordered_json content = nlohmann::ordered_json::object();
    for (const auto& [name, value] : content_snapshots_) {
      content[name] = value;
    }
    out["content"] = content;
  }
  return out;
}

}  // namespace folio_core
