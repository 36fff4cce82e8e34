#pragma once

#include "convo/store/entities.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace convo::store {

class FolderRepository;

/**
 * @brief Owner of the raw sidebar collections.
 *
 * Every successful mutation increments the revision, so consumers can tell
 * whether a snapshot they hold is stale. Mutations that name unknown ids
 * return false and leave the store untouched. Folder changes are written
 * through the repository when one is attached.
 */
class EntityStore {
public:
  EntityStore() = default;
  explicit EntityStore(FolderRepository *repository);

  std::uint64_t revision() const noexcept { return revision_; }
  Snapshot snapshot() const;

  const std::vector<Conversation> &conversations() const noexcept {
    return conversations_;
  }
  const std::vector<Folder> &folders() const noexcept { return folders_; }
  const std::vector<Project> &projects() const noexcept { return projects_; }
  const IdSet &pinned() const noexcept { return pinned_; }
  const IdSet &archived() const noexcept { return archived_; }

  std::optional<Conversation> findConversation(const std::string &id) const;
  std::optional<Folder> findFolder(const std::string &id) const;
  std::optional<std::string> folderOf(const std::string &conversationId) const;
  bool isPinned(const std::string &id) const;
  bool isArchived(const std::string &id) const;

  // Appends in delivery order, skipping ids that are already known.
  // Returns the number of conversations added.
  std::size_t appendConversations(const std::vector<Conversation> &page);
  bool prependConversation(const Conversation &conversation);
  bool renameConversation(const std::string &id, const std::string &title);
  bool deleteConversation(const std::string &id);

  bool setPinned(const std::string &id, bool pinned);
  bool togglePin(const std::string &id);
  bool setArchived(const std::string &id, bool archived);

  // Removes the id from every folder, then appends it to the target.
  // An empty target only removes it.
  bool moveToFolder(const std::string &conversationId,
                    const std::optional<std::string> &folderId);

  std::string createFolder(const std::string &name,
                           std::optional<std::string> color = std::nullopt);
  bool renameFolder(const std::string &id, const std::string &name);
  bool setFolderColor(const std::string &id, std::optional<std::string> color);
  bool deleteFolder(const std::string &id);
  void setFolders(std::vector<Folder> folders);

  void setProjects(std::vector<Project> projects);

  // Re-reads folders from the attached repository.
  void reloadFolders();

private:
  bool hasConversation(const std::string &id) const;
  Folder *folderById(const std::string &id);
  std::string nextFolderId() const;
  void foldersChanged();
  void bump() noexcept { ++revision_; }

  FolderRepository *repository_ = nullptr;
  std::uint64_t revision_ = 0;
  std::vector<Conversation> conversations_;
  std::vector<Folder> folders_;
  std::vector<Project> projects_;
  IdSet pinned_;
  IdSet archived_;
};

} // namespace convo::store
