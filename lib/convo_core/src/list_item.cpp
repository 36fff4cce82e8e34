#include "convo/sidebar/list_item.hpp"

namespace convo::sidebar
{
namespace
{
template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

ItemKind kindOf(const ComposedListItem &item) noexcept
{
    switch (item.index())
    {
    case 0:
        return ItemKind::Section;
    case 1:
        return ItemKind::FolderHeader;
    default:
        return ItemKind::ConversationRow;
    }
}

std::string itemKey(const ComposedListItem &item)
{
    return std::visit(Overloaded{
                          [](const SectionItem &section) { return "section-" + section.title; },
                          [](const FolderHeaderItem &folder) { return folder.id; },
                          [](const ConversationRowItem &row) { return row.conversation.id; },
                      },
                      item);
}

std::vector<std::string> itemKeys(const ComposedList &items)
{
    std::vector<std::string> keys;
    keys.reserve(items.size());
    for (const auto &item : items)
        keys.push_back(itemKey(item));
    return keys;
}

SectionItem makeSection(const std::string &title)
{
    return SectionItem{title, "section-" + title};
}

} // namespace convo::sidebar
