#pragma once

#include "convo/sidebar/incremental_loader.hpp"
#include "convo/sidebar/list_composer.hpp"
#include "convo/sidebar/windowed_list.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace convo::store
{
class EntityStore;
}

namespace convo::sidebar
{

/**
 * @brief Glue between the entity store, the composer, the windowed list and
 * the incremental loader.
 *
 * The controller owns all sidebar render state (expanded folders, project
 * filter, search text, cursor, inline rename) and translates user intents
 * into store mutations. It never patches the composed sequence: after every
 * mutation it recomposes from the latest store snapshot, and everything that
 * must survive recomposition is keyed by itemKey().
 */
class SidebarController
{
public:
    enum class ViewState
    {
        Empty,
        Loading,
        List
    };

    struct Settings
    {
        int estimatedItemHeight = 2;
        std::size_t overscan = 5;
        std::size_t endReachedThreshold = 3;
    };

    using StatusCallback = std::function<void(const std::string &message)>;
    using ErrorCallback = std::function<void(const std::string &error)>;
    using SelectCallback = std::function<void(const store::Conversation &conversation)>;
    using ChangeCallback = std::function<void()>;

    explicit SidebarController(store::EntityStore &store);
    SidebarController(store::EntityStore &store, Settings settings);

    void setStatusCallback(StatusCallback callback) { statusCallback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback);
    void setSelectCallback(SelectCallback callback) { selectCallback_ = std::move(callback); }
    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

    const Settings &settings() const noexcept { return settings_; }
    void applySettings(const Settings &settings);

    // Loading
    void setLoadMore(IncrementalLoader::LoadMoreFn onLoadMore);
    void setHasMore(bool hasMore);
    bool hasMore() const noexcept { return loader_.hasMore(); }
    bool loading() const noexcept { return loader_.loading(); }
    const IncrementalLoader &loader() const noexcept { return loader_; }

    // Recomposition. Returns true when the sequence was recomputed.
    bool refresh();
    const ComposedList &items() const noexcept { return composer_.items(); }
    ViewState viewState() const;

    // Windowing
    const WindowedList &list() const noexcept { return list_; }
    WindowedList::Window visibleWindow() const { return list_.window(); }
    void setViewportHeight(int height);
    void scrollTo(int offset);
    void scrollBy(int delta);
    void reportItemHeight(const std::string &key, int height);
    // Starts a load when the window reaches the end. Returns true on start.
    // After a failed load nothing starts until the next scroll, viewport
    // change or explicit loadMore().
    bool checkEndReached();
    bool retryPending() const noexcept { return retryPending_; }

    // Cursor
    std::optional<std::string> selectedKey() const { return selectedKey_; }
    std::optional<std::size_t> selectedIndex() const;
    const ComposedListItem *selectedItem() const;
    bool selectKey(const std::string &key);
    bool selectIndex(std::size_t index);
    bool selectNext();
    bool selectPrevious();
    bool selectPageDown();
    bool selectPageUp();
    // Opens the conversation under the cursor or toggles its folder.
    bool activateSelected();
    const std::optional<std::string> &activeConversationId() const noexcept { return activeConversationId_; }

    // Intents
    bool selectConversation(const std::string &id);
    bool loadMore();
    bool togglePin(const std::string &id);
    bool moveToFolder(const std::string &id, const std::optional<std::string> &folderId);
    bool archive(const std::string &id);
    bool unarchive(const std::string &id);
    bool toggleFolderExpanded(const std::string &folderId);
    bool deleteConversation(const std::string &id);
    bool renameConversation(const std::string &id, const std::string &title);
    std::string createFolder(const std::string &name, std::optional<std::string> color = std::nullopt);
    bool renameFolder(const std::string &folderId, const std::string &name);
    bool deleteFolder(const std::string &folderId);

    bool isFolderExpanded(const std::string &folderId) const;
    const ExpandedFolderSet &expandedFolders() const noexcept { return expanded_; }

    // Inline rename state, keyed like everything else that must survive
    // recomposition.
    bool beginRename(const std::string &key);
    void cancelRename() noexcept { renamingKey_.reset(); }
    const std::optional<std::string> &renamingKey() const noexcept { return renamingKey_; }

    // Filters
    void setActiveProject(std::optional<std::string> projectId);
    const std::optional<std::string> &activeProject() const noexcept { return activeProject_; }
    void setSearchQuery(std::string query);
    const std::string &searchQuery() const noexcept { return searchQuery_; }

    store::EntityStore &store() noexcept { return store_; }
    const store::EntityStore &store() const noexcept { return store_; }

private:
    void afterMutation();
    void restoreSelection(std::optional<std::size_t> previousIndex);
    void revealSelection();
    void notifyStatus(const std::string &message);
    void notifyError(const std::string &error);
    void notifyChanged();
    std::string conversationTitle(const std::string &id) const;

    store::EntityStore &store_;
    Settings settings_;
    MemoizedComposer composer_;
    WindowedList list_;
    IncrementalLoader loader_;

    ExpandedFolderSet expanded_;
    std::optional<std::string> activeProject_;
    std::string searchQuery_;
    std::optional<std::string> selectedKey_;
    std::optional<std::string> activeConversationId_;
    std::optional<std::string> renamingKey_;
    bool retryPending_ = false;

    StatusCallback statusCallback_;
    ErrorCallback errorCallback_;
    SelectCallback selectCallback_;
    ChangeCallback changeCallback_;
};

} // namespace convo::sidebar
