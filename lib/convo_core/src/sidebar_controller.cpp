#include "convo/sidebar/sidebar_controller.hpp"
#include "convo/store/entity_store.hpp"

#include <algorithm>

namespace convo::sidebar
{
namespace
{
bool isSelectable(const ComposedListItem &item)
{
    return kindOf(item) != ItemKind::Section;
}

} // namespace

SidebarController::SidebarController(store::EntityStore &store)
    : SidebarController(store, Settings{})
{
}

SidebarController::SidebarController(store::EntityStore &store, Settings settings)
    : store_(store), settings_(settings), list_(settings.estimatedItemHeight, settings.overscan)
{
    loader_.setErrorCallback([this](const std::string &error) { notifyError(error); });
    loader_.setStateCallback([this](bool loading) {
        if (loading)
            notifyStatus("Loading more conversations...");
        else if (loader_.lastLoadFailed())
            retryPending_ = true;
        notifyChanged();
    });
}

void SidebarController::setErrorCallback(ErrorCallback callback)
{
    errorCallback_ = std::move(callback);
}

void SidebarController::applySettings(const Settings &settings)
{
    settings_ = settings;
    list_.setEstimatedItemHeight(settings.estimatedItemHeight);
    list_.setOverscan(settings.overscan);
    notifyChanged();
}

void SidebarController::setLoadMore(IncrementalLoader::LoadMoreFn onLoadMore)
{
    loader_.setLoadMore(std::move(onLoadMore));
}

void SidebarController::setHasMore(bool hasMore)
{
    loader_.setHasMore(hasMore);
}

bool SidebarController::refresh()
{
    const auto previousIndex = selectedIndex();
    const std::size_t before = composer_.recomputeCount();
    composer_.compose(store_.snapshot(), expanded_, activeProject_, searchQuery_);
    const bool recomputed = composer_.recomputeCount() != before;

    if (recomputed)
    {
        list_.setKeys(itemKeys(composer_.items()));
        restoreSelection(previousIndex);
        if (renamingKey_ && !list_.indexOf(*renamingKey_))
            renamingKey_.reset();
    }

    checkEndReached();
    return recomputed;
}

SidebarController::ViewState SidebarController::viewState() const
{
    if (!composer_.items().empty())
        return ViewState::List;
    if (store_.conversations().empty() && loader_.loading())
        return ViewState::Loading;
    return ViewState::Empty;
}

void SidebarController::setViewportHeight(int height)
{
    retryPending_ = false;
    list_.setViewportHeight(height);
    checkEndReached();
}

void SidebarController::scrollTo(int offset)
{
    retryPending_ = false;
    list_.setScrollTop(offset);
    checkEndReached();
}

void SidebarController::scrollBy(int delta)
{
    retryPending_ = false;
    list_.scrollBy(delta);
    checkEndReached();
}

void SidebarController::reportItemHeight(const std::string &key, int height)
{
    list_.reportHeight(key, height);
}

bool SidebarController::checkEndReached()
{
    if (retryPending_ || !list_.nearEnd(settings_.endReachedThreshold))
        return false;
    return loader_.notifyScrollNearEnd();
}

std::optional<std::size_t> SidebarController::selectedIndex() const
{
    if (!selectedKey_)
        return std::nullopt;
    return list_.indexOf(*selectedKey_);
}

const ComposedListItem *SidebarController::selectedItem() const
{
    auto index = selectedIndex();
    if (!index || *index >= composer_.items().size())
        return nullptr;
    return &composer_.items()[*index];
}

bool SidebarController::selectKey(const std::string &key)
{
    auto index = list_.indexOf(key);
    if (!index)
        return false;
    return selectIndex(*index);
}

bool SidebarController::selectIndex(std::size_t index)
{
    const auto &items = composer_.items();
    if (index >= items.size() || !isSelectable(items[index]))
        return false;
    selectedKey_ = list_.keys()[index];
    revealSelection();
    notifyChanged();
    return true;
}

bool SidebarController::selectNext()
{
    const auto &items = composer_.items();
    auto current = selectedIndex();
    std::size_t start = current ? *current + 1 : 0;
    for (std::size_t i = start; i < items.size(); ++i)
    {
        if (isSelectable(items[i]))
            return selectIndex(i);
    }
    return false;
}

bool SidebarController::selectPrevious()
{
    const auto &items = composer_.items();
    auto current = selectedIndex();
    if (!current)
        return selectNext();
    for (std::size_t i = *current; i > 0; --i)
    {
        if (isSelectable(items[i - 1]))
            return selectIndex(i - 1);
    }
    return false;
}

bool SidebarController::selectPageDown()
{
    const auto &items = composer_.items();
    if (items.empty())
        return false;
    auto current = selectedIndex();
    const int from = current ? list_.offsetOf(*current) : list_.scrollTop();
    const std::size_t floor = current ? *current + 1 : 0;
    const std::size_t target = std::max(floor, list_.indexAtOffset(from + std::max(1, list_.viewportHeight())));
    for (std::size_t i = target; i < items.size(); ++i)
    {
        if (isSelectable(items[i]))
            return selectIndex(i);
    }
    for (std::size_t i = std::min(target, items.size()); i > floor; --i)
    {
        if (isSelectable(items[i - 1]))
            return selectIndex(i - 1);
    }
    return false;
}

bool SidebarController::selectPageUp()
{
    auto current = selectedIndex();
    if (!current)
        return selectNext();
    const auto &items = composer_.items();
    const int from = list_.offsetOf(*current);
    const std::size_t target =
        std::min(*current, list_.indexAtOffset(std::max(0, from - std::max(1, list_.viewportHeight()))));
    for (std::size_t i = target + 1; i > 0; --i)
    {
        if (i - 1 < *current && isSelectable(items[i - 1]))
            return selectIndex(i - 1);
    }
    for (std::size_t i = target; i < *current; ++i)
    {
        if (isSelectable(items[i]))
            return selectIndex(i);
    }
    return false;
}

bool SidebarController::activateSelected()
{
    const ComposedListItem *item = selectedItem();
    if (!item)
        return false;
    if (const auto *row = std::get_if<ConversationRowItem>(item))
        return selectConversation(row->conversation.id);
    if (const auto *header = std::get_if<FolderHeaderItem>(item))
        return toggleFolderExpanded(header->id);
    return false;
}

bool SidebarController::selectConversation(const std::string &id)
{
    auto conversation = store_.findConversation(id);
    if (!conversation)
        return false;
    activeConversationId_ = id;
    if (list_.indexOf(id))
    {
        selectedKey_ = id;
        revealSelection();
    }
    if (selectCallback_)
        selectCallback_(*conversation);
    notifyChanged();
    return true;
}

bool SidebarController::loadMore()
{
    retryPending_ = false;
    return loader_.notifyScrollNearEnd();
}

bool SidebarController::togglePin(const std::string &id)
{
    if (!store_.togglePin(id))
        return false;
    notifyStatus((store_.isPinned(id) ? "Pinned " : "Unpinned ") + conversationTitle(id));
    afterMutation();
    return true;
}

bool SidebarController::moveToFolder(const std::string &id, const std::optional<std::string> &folderId)
{
    if (!store_.moveToFolder(id, folderId))
    {
        notifyError("Unable to move conversation");
        return false;
    }
    if (folderId)
    {
        auto folder = store_.findFolder(*folderId);
        notifyStatus("Moved " + conversationTitle(id) + " to " + (folder ? folder->name : *folderId));
    }
    else
    {
        notifyStatus("Removed " + conversationTitle(id) + " from its folder");
    }
    afterMutation();
    return true;
}

bool SidebarController::archive(const std::string &id)
{
    if (!store_.setArchived(id, true))
        return false;
    notifyStatus("Archived " + conversationTitle(id));
    afterMutation();
    return true;
}

bool SidebarController::unarchive(const std::string &id)
{
    if (!store_.setArchived(id, false))
        return false;
    notifyStatus("Restored " + conversationTitle(id));
    afterMutation();
    return true;
}

bool SidebarController::toggleFolderExpanded(const std::string &folderId)
{
    if (!store_.findFolder(folderId))
        return false;
    if (!expanded_.erase(folderId))
        expanded_.insert(folderId);
    afterMutation();
    return true;
}

bool SidebarController::deleteConversation(const std::string &id)
{
    const std::string title = conversationTitle(id);
    if (!store_.deleteConversation(id))
        return false;
    if (activeConversationId_ == id)
        activeConversationId_.reset();
    list_.forgetMeasurement(id);
    notifyStatus("Deleted " + title);
    afterMutation();
    return true;
}

bool SidebarController::renameConversation(const std::string &id, const std::string &title)
{
    if (!store_.renameConversation(id, title))
    {
        notifyError("Conversation title cannot be empty");
        return false;
    }
    if (renamingKey_ == id)
        renamingKey_.reset();
    afterMutation();
    return true;
}

std::string SidebarController::createFolder(const std::string &name, std::optional<std::string> color)
{
    std::string id = store_.createFolder(name, std::move(color));
    notifyStatus("Created folder " + store_.findFolder(id)->name);
    afterMutation();
    return id;
}

bool SidebarController::renameFolder(const std::string &folderId, const std::string &name)
{
    if (!store_.renameFolder(folderId, name))
    {
        notifyError("Folder name cannot be empty");
        return false;
    }
    if (renamingKey_ == folderId)
        renamingKey_.reset();
    afterMutation();
    return true;
}

bool SidebarController::deleteFolder(const std::string &folderId)
{
    auto folder = store_.findFolder(folderId);
    if (!folder || !store_.deleteFolder(folderId))
        return false;
    expanded_.erase(folderId);
    list_.forgetMeasurement(folderId);
    notifyStatus("Deleted folder " + folder->name);
    afterMutation();
    return true;
}

bool SidebarController::isFolderExpanded(const std::string &folderId) const
{
    return expanded_.find(folderId) != expanded_.end();
}

bool SidebarController::beginRename(const std::string &key)
{
    auto index = list_.indexOf(key);
    if (!index || !isSelectable(composer_.items()[*index]))
        return false;
    renamingKey_ = key;
    notifyChanged();
    return true;
}

void SidebarController::setActiveProject(std::optional<std::string> projectId)
{
    if (activeProject_ == projectId)
        return;
    activeProject_ = std::move(projectId);
    afterMutation();
}

void SidebarController::setSearchQuery(std::string query)
{
    if (searchQuery_ == query)
        return;
    searchQuery_ = std::move(query);
    afterMutation();
}

void SidebarController::afterMutation()
{
    refresh();
    notifyChanged();
}

void SidebarController::restoreSelection(std::optional<std::size_t> previousIndex)
{
    if (!selectedKey_ || list_.indexOf(*selectedKey_))
        return;

    const auto &items = composer_.items();
    selectedKey_.reset();
    if (!previousIndex || items.empty())
        return;

    // The selected row left the sequence: take whatever now sits at its old
    // position, else the closest selectable item above it.
    const std::size_t start = std::min(*previousIndex, items.size() - 1);
    for (std::size_t i = start; i < items.size(); ++i)
    {
        if (isSelectable(items[i]))
        {
            selectedKey_ = list_.keys()[i];
            return;
        }
    }
    for (std::size_t i = start; i > 0; --i)
    {
        if (isSelectable(items[i - 1]))
        {
            selectedKey_ = list_.keys()[i - 1];
            return;
        }
    }
}

void SidebarController::revealSelection()
{
    if (auto index = selectedIndex())
    {
        list_.scrollToIndex(*index);
        checkEndReached();
    }
}

void SidebarController::notifyStatus(const std::string &message)
{
    if (statusCallback_)
        statusCallback_(message);
}

void SidebarController::notifyError(const std::string &error)
{
    if (errorCallback_)
        errorCallback_(error);
}

void SidebarController::notifyChanged()
{
    if (changeCallback_)
        changeCallback_();
}

std::string SidebarController::conversationTitle(const std::string &id) const
{
    auto conversation = store_.findConversation(id);
    if (!conversation || conversation->title.empty())
        return "conversation";
    return "\"" + conversation->title + "\"";
}

} // namespace convo::sidebar
