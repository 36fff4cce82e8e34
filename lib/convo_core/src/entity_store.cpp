#include "convo/store/entity_store.hpp"
#include "convo/store/folder_repository.hpp"

#include <algorithm>
#include <cctype>

namespace convo::store {

namespace {

std::string trim(const std::string &text) {
  std::size_t start = 0;
  std::size_t end = text.size();
  while (start < end && std::isspace(static_cast<unsigned char>(text[start])))
    ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  return text.substr(start, end - start);
}

bool erase_id(std::vector<std::string> &ids, const std::string &id) {
  auto it = std::remove(ids.begin(), ids.end(), id);
  if (it == ids.end())
    return false;
  ids.erase(it, ids.end());
  return true;
}

} // namespace

EntityStore::EntityStore(FolderRepository *repository)
    : repository_(repository) {
  if (repository_)
    folders_ = repository_->load();
}

Snapshot EntityStore::snapshot() const {
  Snapshot snap;
  snap.revision = revision_;
  snap.conversations = conversations_;
  snap.folders = folders_;
  snap.projects = projects_;
  snap.pinned = pinned_;
  snap.archived = archived_;
  return snap;
}

std::optional<Conversation>
EntityStore::findConversation(const std::string &id) const {
  auto it = std::find_if(conversations_.begin(), conversations_.end(),
                         [&](const Conversation &c) { return c.id == id; });
  if (it == conversations_.end())
    return std::nullopt;
  return *it;
}

std::optional<Folder> EntityStore::findFolder(const std::string &id) const {
  auto it = std::find_if(folders_.begin(), folders_.end(),
                         [&](const Folder &f) { return f.id == id; });
  if (it == folders_.end())
    return std::nullopt;
  return *it;
}

std::optional<std::string>
EntityStore::folderOf(const std::string &conversationId) const {
  for (const auto &folder : folders_) {
    if (std::find(folder.conversationIds.begin(), folder.conversationIds.end(),
                  conversationId) != folder.conversationIds.end())
      return folder.id;
  }
  return std::nullopt;
}

bool EntityStore::isPinned(const std::string &id) const {
  return pinned_.count(id) > 0;
}

bool EntityStore::isArchived(const std::string &id) const {
  return archived_.count(id) > 0;
}

std::size_t
EntityStore::appendConversations(const std::vector<Conversation> &page) {
  IdSet known;
  known.reserve(conversations_.size() + page.size());
  for (const auto &conversation : conversations_)
    known.insert(conversation.id);

  std::size_t added = 0;
  for (const auto &conversation : page) {
    if (conversation.id.empty() || !known.insert(conversation.id).second)
      continue;
    conversations_.push_back(conversation);
    ++added;
  }
  if (added > 0)
    bump();
  return added;
}

bool EntityStore::prependConversation(const Conversation &conversation) {
  if (conversation.id.empty() || hasConversation(conversation.id))
    return false;
  conversations_.insert(conversations_.begin(), conversation);
  bump();
  return true;
}

bool EntityStore::renameConversation(const std::string &id,
                                     const std::string &title) {
  auto it = std::find_if(conversations_.begin(), conversations_.end(),
                         [&](const Conversation &c) { return c.id == id; });
  if (it == conversations_.end())
    return false;
  std::string cleaned = trim(title);
  if (cleaned.empty())
    return false;
  if (it->title != cleaned) {
    it->title = std::move(cleaned);
    bump();
  }
  return true;
}

bool EntityStore::deleteConversation(const std::string &id) {
  auto it = std::find_if(conversations_.begin(), conversations_.end(),
                         [&](const Conversation &c) { return c.id == id; });
  if (it == conversations_.end())
    return false;
  conversations_.erase(it);

  bool folderTouched = false;
  for (auto &folder : folders_)
    folderTouched = erase_id(folder.conversationIds, id) || folderTouched;
  for (auto &project : projects_)
    erase_id(project.conversationIds, id);
  pinned_.erase(id);
  archived_.erase(id);

  if (folderTouched)
    foldersChanged();
  bump();
  return true;
}

bool EntityStore::setPinned(const std::string &id, bool pinned) {
  if (!hasConversation(id))
    return false;
  bool changed = pinned ? pinned_.insert(id).second : pinned_.erase(id) > 0;
  if (changed)
    bump();
  return true;
}

bool EntityStore::togglePin(const std::string &id) {
  return setPinned(id, !isPinned(id));
}

bool EntityStore::setArchived(const std::string &id, bool archived) {
  if (!hasConversation(id))
    return false;
  bool changed =
      archived ? archived_.insert(id).second : archived_.erase(id) > 0;
  if (changed)
    bump();
  return true;
}

bool EntityStore::moveToFolder(const std::string &conversationId,
                               const std::optional<std::string> &folderId) {
  if (!hasConversation(conversationId))
    return false;
  if (folderId && !folderById(*folderId))
    return false;

  auto current = folderOf(conversationId);
  if (current == folderId) {
    // Already filed there (or already unfiled). Still collapse any stray
    // duplicates left by an external writer.
    std::size_t holders = 0;
    for (const auto &folder : folders_)
      holders += static_cast<std::size_t>(
          std::count(folder.conversationIds.begin(),
                     folder.conversationIds.end(), conversationId));
    if (holders <= 1)
      return true;
  }

  for (auto &folder : folders_)
    erase_id(folder.conversationIds, conversationId);
  if (folderId)
    folderById(*folderId)->conversationIds.push_back(conversationId);

  foldersChanged();
  bump();
  return true;
}

std::string EntityStore::createFolder(const std::string &name,
                                      std::optional<std::string> color) {
  Folder folder;
  folder.id = nextFolderId();
  folder.name = trim(name);
  if (folder.name.empty())
    folder.name = "New Folder";
  if (color && !color->empty())
    folder.color = std::move(color);
  folders_.push_back(folder);
  foldersChanged();
  bump();
  return folder.id;
}

bool EntityStore::renameFolder(const std::string &id, const std::string &name) {
  Folder *folder = folderById(id);
  if (!folder)
    return false;
  std::string cleaned = trim(name);
  if (cleaned.empty())
    return false;
  if (folder->name != cleaned) {
    folder->name = std::move(cleaned);
    foldersChanged();
    bump();
  }
  return true;
}

bool EntityStore::setFolderColor(const std::string &id,
                                 std::optional<std::string> color) {
  Folder *folder = folderById(id);
  if (!folder)
    return false;
  if (color && color->empty())
    color.reset();
  if (folder->color != color) {
    folder->color = std::move(color);
    foldersChanged();
    bump();
  }
  return true;
}

bool EntityStore::deleteFolder(const std::string &id) {
  auto it = std::find_if(folders_.begin(), folders_.end(),
                         [&](const Folder &f) { return f.id == id; });
  if (it == folders_.end())
    return false;
  folders_.erase(it);
  foldersChanged();
  bump();
  return true;
}

void EntityStore::setFolders(std::vector<Folder> folders) {
  folders_ = std::move(folders);
  bump();
}

void EntityStore::setProjects(std::vector<Project> projects) {
  projects_ = std::move(projects);
  bump();
}

void EntityStore::reloadFolders() {
  if (!repository_)
    return;
  folders_ = repository_->load();
  bump();
}

bool EntityStore::hasConversation(const std::string &id) const {
  return std::any_of(conversations_.begin(), conversations_.end(),
                     [&](const Conversation &c) { return c.id == id; });
}

Folder *EntityStore::folderById(const std::string &id) {
  auto it = std::find_if(folders_.begin(), folders_.end(),
                         [&](const Folder &f) { return f.id == id; });
  return it == folders_.end() ? nullptr : &*it;
}

std::string EntityStore::nextFolderId() const {
  std::size_t counter = folders_.size() + 1;
  for (;;) {
    std::string candidate = "folder-" + std::to_string(counter++);
    bool taken = std::any_of(folders_.begin(), folders_.end(),
                             [&](const Folder &f) { return f.id == candidate; });
    if (!taken)
      return candidate;
  }
}

void EntityStore::foldersChanged() {
  if (repository_)
    repository_->save(folders_);
}

} // namespace convo::store
