#include "upgate/store/attachment_catalog.hpp"

#include <algorithm>
#include <iterator>

#include <nlohmann/json.hpp>

#include "upgate/util/filesystem.hpp"
#include "upgate/util/time.hpp"

namespace upgate::store {

namespace {

constexpr int kCatalogVersion = 1;

core::StoredFileRecord recordFromJson(const nlohmann::json& item) {
  core::StoredFileRecord record;
  record.filename = item.at("filename").get<std::string>();
  record.original_filename = item.value("original_filename", "");
  record.path = item.at("path").get<std::string>();
  record.size = item.at("size").get<std::uintmax_t>();
  record.mime_type = item.value("mime_type", "");
  record.container_id = item.at("container_id").get<std::string>();
  record.uploaded_by = item.value("uploaded_by", "");

  auto created = util::Time::fromRfc3339(item.value("created", ""));
  if (created.has_value()) {
    record.created = *created;
  }
  return record;
}

}  // namespace

nlohmann::json recordToJson(const core::StoredFileRecord& record) {
  nlohmann::json item;
  item["filename"] = record.filename;
  item["original_filename"] = record.original_filename;
  item["path"] = record.path.string();
  item["relative_path"] = record.relativePath();
  item["size"] = record.size;
  item["mime_type"] = record.mime_type;
  item["container_id"] = record.container_id;
  item["uploaded_by"] = record.uploaded_by;
  item["created"] = util::Time::toRfc3339(record.created);
  return item;
}

AttachmentCatalog::AttachmentCatalog(std::filesystem::path catalog_file)
    : catalog_file_(std::move(catalog_file)) {
}

Result<void> AttachmentCatalog::add(const core::StoredFileRecord& record) {
  std::lock_guard lock(mutex_);
  if (auto loaded = loadLocked(); !loaded.has_value()) {
    return loaded;
  }

  auto key = record.path.string();
  records_[key] = record;
  auto saved = saveLocked();
  if (!saved.has_value()) {
    records_.erase(key);
  }
  return saved;
}

Result<bool> AttachmentCatalog::remove(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  if (auto loaded = loadLocked(); !loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  auto it = records_.find(path.string());
  if (it == records_.end()) {
    return false;
  }

  auto removed = it->second;
  records_.erase(it);
  auto saved = saveLocked();
  if (!saved.has_value()) {
    records_[path.string()] = std::move(removed);
    return std::unexpected(saved.error());
  }
  return true;
}

Result<std::vector<core::StoredFileRecord>> AttachmentCatalog::listAll() const {
  std::lock_guard lock(mutex_);
  if (auto loaded = loadLocked(); !loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  std::vector<core::StoredFileRecord> records;
  records.reserve(records_.size());
  for (const auto& [path, record] : records_) {
    records.push_back(record);
  }

  std::sort(records.begin(), records.end(),
            [](const core::StoredFileRecord& a, const core::StoredFileRecord& b) {
              return a.created < b.created;
            });
  return records;
}

Result<std::vector<core::StoredFileRecord>> AttachmentCatalog::listForContainer(
    const std::string& container_id) const {
  auto all = listAll();
  if (!all.has_value()) {
    return std::unexpected(all.error());
  }

  std::vector<core::StoredFileRecord> records;
  std::copy_if(all->begin(), all->end(), std::back_inserter(records),
               [&container_id](const core::StoredFileRecord& record) {
                 return record.container_id == container_id;
               });
  return records;
}

Result<std::optional<core::StoredFileRecord>> AttachmentCatalog::find(
    const std::string& container_id, const std::string& filename) const {
  std::lock_guard lock(mutex_);
  if (auto loaded = loadLocked(); !loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  for (const auto& [path, record] : records_) {
    if (record.container_id == container_id && record.filename == filename) {
      return std::optional<core::StoredFileRecord>(record);
    }
  }
  return std::optional<core::StoredFileRecord>();
}

Result<std::set<std::filesystem::path>> AttachmentCatalog::referencedPaths() const {
  std::lock_guard lock(mutex_);
  if (auto loaded = loadLocked(); !loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  std::set<std::filesystem::path> paths;
  for (const auto& [path, record] : records_) {
    paths.insert(record.path);
  }
  return paths;
}

Result<void> AttachmentCatalog::loadLocked() const {
  if (loaded_) {
    return {};
  }

  if (!std::filesystem::exists(catalog_file_)) {
    loaded_ = true;
    return {};  // No catalog yet
  }

  auto content = util::FileSystem::readFile(catalog_file_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  try {
    auto json = nlohmann::json::parse(*content);

    std::map<std::string, core::StoredFileRecord> records;
    for (const auto& item : json.at("attachments")) {
      auto record = recordFromJson(item);
      records[record.path.string()] = std::move(record);
    }

    records_ = std::move(records);
    loaded_ = true;
    return {};

  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid attachment catalog: " + std::string(e.what())));
  }
}

Result<void> AttachmentCatalog::saveLocked() const {
  nlohmann::json json;
  json["version"] = kCatalogVersion;
  json["attachments"] = nlohmann::json::array();

  for (const auto& [path, record] : records_) {
    json["attachments"].push_back(recordToJson(record));
  }

  return util::FileSystem::writeFileAtomic(catalog_file_, json.dump(2));
}

}  // namespace upgate::store
