#include "convo/store/folder_repository.hpp"
#include "convo/store/key_value_store.hpp"
#include "convo/log.hpp"

#include <nlohmann/json.hpp>

#include <unordered_set>

namespace convo::store {

namespace {

std::optional<Folder> folder_from_json(const nlohmann::json &entry) {
  if (!entry.is_object())
    return std::nullopt;
  Folder folder;
  folder.id = entry.value("id", "");
  if (folder.id.empty())
    return std::nullopt;
  folder.name = entry.value("name", "");
  if (auto color = entry.find("color");
      color != entry.end() && color->is_string() &&
      !color->get<std::string>().empty())
    folder.color = color->get<std::string>();

  if (auto ids = entry.find("conversationIds");
      ids != entry.end() && ids->is_array()) {
    std::unordered_set<std::string> seen;
    for (const auto &id : *ids) {
      if (!id.is_string())
        continue;
      auto value = id.get<std::string>();
      if (seen.insert(value).second)
        folder.conversationIds.push_back(std::move(value));
    }
  }
  return folder;
}

nlohmann::json folder_to_json(const Folder &folder) {
  nlohmann::json entry;
  entry["id"] = folder.id;
  entry["name"] = folder.name;
  if (folder.color)
    entry["color"] = *folder.color;
  entry["conversationIds"] = folder.conversationIds;
  return entry;
}

} // namespace

FolderRepository::FolderRepository(KeyValueStore &store) : store_(store) {}

std::vector<Folder> FolderRepository::load() const {
  std::vector<Folder> folders;
  auto stored = store_.get(kFolderNamespace, kFolderKey);
  if (!stored || !stored->is_array())
    return folders;

  std::unordered_set<std::string> ids;
  for (const auto &entry : *stored) {
    std::optional<Folder> folder;
    try {
      folder = folder_from_json(entry);
    } catch (const nlohmann::json::exception &ex) {
      log::warning(std::string("Skipping malformed folder entry: ") + ex.what());
      continue;
    }
    if (folder && ids.insert(folder->id).second)
      folders.push_back(std::move(*folder));
  }
  return folders;
}

bool FolderRepository::save(const std::vector<Folder> &folders) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &folder : folders)
    array.push_back(folder_to_json(folder));
  return store_.set(kFolderNamespace, kFolderKey, std::move(array));
}

} // namespace convo::store
