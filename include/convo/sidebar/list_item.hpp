#pragma once

#include "convo/store/entities.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace convo::sidebar
{

inline constexpr char kPinnedSectionTitle[] = "Pinned";
inline constexpr char kRecentSectionTitle[] = "Recent";

struct SectionItem
{
    std::string title;
    std::string id;

    bool operator==(const SectionItem &other) const
    {
        return title == other.title && id == other.id;
    }
};

struct FolderHeaderItem
{
    std::string id;
    std::string name;
    std::optional<std::string> color;
    std::size_t count = 0;
    bool expanded = false;

    bool operator==(const FolderHeaderItem &other) const
    {
        return id == other.id && name == other.name && color == other.color &&
               count == other.count && expanded == other.expanded;
    }
};

struct ConversationRowItem
{
    store::Conversation conversation;
    bool inFolder = false;

    bool operator==(const ConversationRowItem &other) const
    {
        return conversation == other.conversation && inFolder == other.inFolder;
    }
};

using ComposedListItem = std::variant<SectionItem, FolderHeaderItem, ConversationRowItem>;
using ComposedList = std::vector<ComposedListItem>;

enum class ItemKind
{
    Section,
    FolderHeader,
    ConversationRow
};

ItemKind kindOf(const ComposedListItem &item) noexcept;

// Stable identity of an item, independent of its position:
// "section-<title>" for sections, the folder id for folder headers and the
// conversation id for conversation rows.
std::string itemKey(const ComposedListItem &item);
std::vector<std::string> itemKeys(const ComposedList &items);

SectionItem makeSection(const std::string &title);

} // namespace convo::sidebar
