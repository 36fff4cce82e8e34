#include "convo/sidebar/list_composer.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

namespace convo::sidebar
{
namespace
{
using store::Conversation;
using store::IdSet;

bool contains(const IdSet &set, const std::string &id)
{
    return set.find(id) != set.end();
}

std::string toLower(std::string_view text)
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char ch : text)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lowered;
}

ConversationRowItem makeRow(const Conversation &conversation, bool inFolder)
{
    return ConversationRowItem{conversation, inFolder};
}

} // namespace

ComposedList compose(const ComposeInput &input)
{
    // Step 1: project restriction. Repeated ids keep their first occurrence.
    std::vector<const Conversation *> visible;
    std::unordered_map<std::string, const Conversation *> byId;
    visible.reserve(input.conversations.size());
    for (const auto &conversation : input.conversations)
    {
        if (input.activeProjectMembers && !contains(*input.activeProjectMembers, conversation.id))
            continue;
        if (!byId.emplace(conversation.id, &conversation).second)
            continue;
        visible.push_back(&conversation);
    }

    // Step 2: pinned, archive dominates.
    std::vector<const Conversation *> pinnedList;
    for (const auto *conversation : visible)
    {
        if (contains(input.pinned, conversation->id) && !contains(input.archived, conversation->id))
            pinnedList.push_back(conversation);
    }

    // Step 3: every id any folder claims.
    IdSet inFolders;
    for (const auto &folder : input.folders)
        inFolders.insert(folder.conversationIds.begin(), folder.conversationIds.end());

    // Step 4: unfiled.
    std::vector<const Conversation *> recentList;
    for (const auto *conversation : visible)
    {
        const std::string &id = conversation->id;
        if (contains(input.pinned, id) || contains(inFolders, id) || contains(input.archived, id))
            continue;
        recentList.push_back(conversation);
    }

    ComposedList items;
    items.reserve(visible.size() + input.folders.size() + 2);

    if (!pinnedList.empty())
    {
        items.emplace_back(makeSection(kPinnedSectionTitle));
        for (const auto *conversation : pinnedList)
            items.emplace_back(makeRow(*conversation, false));
    }

    if (!input.folders.empty() && !input.activeProjectMembers)
    {
        IdSet seenFolders;
        IdSet claimed;
        for (const auto &folder : input.folders)
        {
            if (!seenFolders.insert(folder.id).second)
                continue;

            FolderHeaderItem header;
            header.id = folder.id;
            header.name = folder.name;
            header.color = folder.color;
            header.expanded = contains(input.expandedFolders, folder.id);

            std::vector<const Conversation *> members;
            for (const auto &memberId : folder.conversationIds)
            {
                // An id already claimed by an earlier folder (or repeated in
                // this one) belongs to its first claimant only.
                if (!claimed.insert(memberId).second)
                    continue;
                auto it = byId.find(memberId);
                if (it == byId.end() || contains(input.archived, memberId))
                    continue;
                ++header.count;
                if (!contains(input.pinned, memberId))
                    members.push_back(it->second);
            }

            const bool expanded = header.expanded;
            items.emplace_back(std::move(header));
            if (expanded)
            {
                for (const auto *conversation : members)
                    items.emplace_back(makeRow(*conversation, true));
            }
        }
    }

    if (!recentList.empty())
    {
        if (!items.empty())
            items.emplace_back(makeSection(kRecentSectionTitle));
        for (const auto *conversation : recentList)
            items.emplace_back(makeRow(*conversation, false));
    }

    return items;
}

ComposedList compose(const std::vector<store::Conversation> &conversations,
                     const std::vector<store::Folder> &folders,
                     const store::IdSet &pinned,
                     const store::IdSet &archived,
                     const ExpandedFolderSet &expandedFolders,
                     const std::optional<std::string> &activeProjectId,
                     const std::vector<store::Project> &projects)
{
    IdSet members;
    const IdSet *membersPtr = nullptr;
    if (activeProjectId)
    {
        auto it = std::find_if(projects.begin(), projects.end(),
                               [&](const store::Project &project) { return project.id == *activeProjectId; });
        if (it != projects.end())
            members.insert(it->conversationIds.begin(), it->conversationIds.end());
        membersPtr = &members;
    }

    return compose(ComposeInput{conversations, folders, pinned, archived, expandedFolders, membersPtr});
}

ComposedList compose(const store::Snapshot &snapshot,
                     const ExpandedFolderSet &expandedFolders,
                     const std::optional<std::string> &activeProjectId)
{
    return compose(snapshot.conversations, snapshot.folders, snapshot.pinned, snapshot.archived,
                   expandedFolders, activeProjectId, snapshot.projects);
}

std::vector<store::Conversation> filterByTitle(const std::vector<store::Conversation> &conversations,
                                               const std::string &query)
{
    if (query.empty())
        return conversations;

    const std::string needle = toLower(query);
    std::vector<store::Conversation> result;
    for (const auto &conversation : conversations)
    {
        if (toLower(conversation.title).find(needle) != std::string::npos)
            result.push_back(conversation);
    }
    return result;
}

const ComposedList &MemoizedComposer::compose(const store::Snapshot &snapshot,
                                              const ExpandedFolderSet &expandedFolders,
                                              const std::optional<std::string> &activeProjectId,
                                              const std::string &searchQuery)
{
    if (valid_ && revision_ == snapshot.revision && expanded_ == expandedFolders &&
        projectId_ == activeProjectId && searchQuery_ == searchQuery)
        return items_;

    if (searchQuery.empty())
    {
        items_ = sidebar::compose(snapshot, expandedFolders, activeProjectId);
    }
    else
    {
        auto filtered = filterByTitle(snapshot.conversations, searchQuery);
        items_ = sidebar::compose(filtered, snapshot.folders, snapshot.pinned, snapshot.archived,
                                  expandedFolders, activeProjectId, snapshot.projects);
    }

    valid_ = true;
    revision_ = snapshot.revision;
    expanded_ = expandedFolders;
    projectId_ = activeProjectId;
    searchQuery_ = searchQuery;
    ++recomputeCount_;
    return items_;
}

} // namespace convo::sidebar
