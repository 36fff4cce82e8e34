#pragma once

#include "convo/sidebar/list_item.hpp"
#include "convo/store/entities.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace convo::sidebar
{

using ExpandedFolderSet = std::unordered_set<std::string>;

struct ComposeInput
{
    const std::vector<store::Conversation> &conversations;
    const std::vector<store::Folder> &folders;
    const store::IdSet &pinned;
    const store::IdSet &archived;
    const ExpandedFolderSet &expandedFolders;
    // Member set of the active project, when a project filter is set.
    const store::IdSet *activeProjectMembers = nullptr;
};

/**
 * Builds the flat sidebar sequence: Pinned section, folders (only without a
 * project filter), then the Recent section. Never throws; malformed input is
 * tolerated by dropping the offending references, first writer wins.
 */
ComposedList compose(const ComposeInput &input);

ComposedList compose(const std::vector<store::Conversation> &conversations,
                     const std::vector<store::Folder> &folders,
                     const store::IdSet &pinned,
                     const store::IdSet &archived,
                     const ExpandedFolderSet &expandedFolders,
                     const std::optional<std::string> &activeProjectId,
                     const std::vector<store::Project> &projects);

// Convenience for a store snapshot.
ComposedList compose(const store::Snapshot &snapshot,
                     const ExpandedFolderSet &expandedFolders,
                     const std::optional<std::string> &activeProjectId);

// Case-insensitive title substring filter. An empty query keeps everything.
std::vector<store::Conversation> filterByTitle(const std::vector<store::Conversation> &conversations,
                                               const std::string &query);

// Caches the last composition and only recomputes when an input changed.
class MemoizedComposer
{
public:
    const ComposedList &compose(const store::Snapshot &snapshot,
                                const ExpandedFolderSet &expandedFolders,
                                const std::optional<std::string> &activeProjectId,
                                const std::string &searchQuery = std::string());

    const ComposedList &items() const noexcept { return items_; }
    std::size_t recomputeCount() const noexcept { return recomputeCount_; }
    void invalidate() noexcept { valid_ = false; }

private:
    bool valid_ = false;
    std::uint64_t revision_ = 0;
    ExpandedFolderSet expanded_;
    std::optional<std::string> projectId_;
    std::string searchQuery_;
    ComposedList items_;
    std::size_t recomputeCount_ = 0;
};

} // namespace convo::sidebar
