#include <gtest/gtest.h>

#include "convo/sidebar/list_composer.hpp"
#include "convo/sidebar/windowed_list.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace convo::sidebar;

namespace
{

convo::store::Conversation conv(const std::string &id)
{
    convo::store::Conversation conversation;
    conversation.id = id;
    conversation.title = id;
    return conversation;
}

} // namespace

TEST(ItemKey, FollowsTheItemKind)
{
    ComposedListItem section = makeSection("Recent");
    ComposedListItem header = FolderHeaderItem{"folder-7", "Work", std::nullopt, 3, false};
    ComposedListItem row = ConversationRowItem{conv("conv-12"), true};

    EXPECT_EQ(itemKey(section), "section-Recent");
    EXPECT_EQ(itemKey(header), "folder-7");
    EXPECT_EQ(itemKey(row), "conv-12");

    EXPECT_EQ(kindOf(section), ItemKind::Section);
    EXPECT_EQ(kindOf(header), ItemKind::FolderHeader);
    EXPECT_EQ(kindOf(row), ItemKind::ConversationRow);
}

TEST(ItemKey, RowKeyIgnoresFolderPlacement)
{
    ComposedListItem nested = ConversationRowItem{conv("conv-1"), true};
    ComposedListItem flat = ConversationRowItem{conv("conv-1"), false};
    EXPECT_EQ(itemKey(nested), itemKey(flat));
}

TEST(ItemKey, ExpandingAFolderKeepsExistingKeys)
{
    std::vector<convo::store::Conversation> conversations{conv("A"), conv("B"), conv("C"), conv("D")};
    convo::store::Folder work{"F1", "Work", std::nullopt, {"B", "C"}};
    convo::store::IdSet pinned{"A"};

    const auto before = itemKeys(compose(conversations, {work}, pinned, {}, {}, std::nullopt, {}));
    const auto after = itemKeys(compose(conversations, {work}, pinned, {}, {"F1"}, std::nullopt, {}));

    EXPECT_EQ(after.size(), before.size() + 2);
    for (const auto &key : before)
        EXPECT_NE(std::find(after.begin(), after.end(), key), after.end()) << key;
}

TEST(ItemKey, MeasuredHeightsFollowKeysAcrossRecomposition)
{
    std::vector<convo::store::Conversation> conversations{conv("A"), conv("B"), conv("C")};
    convo::store::Folder work{"F1", "Work", std::nullopt, {"B"}};

    WindowedList list(2, 0);
    list.setKeys(itemKeys(compose(conversations, {work}, {}, {}, {}, std::nullopt, {})));
    list.reportHeight("C", 5);
    list.reportHeight("section-Recent", 1);

    // Pinning A and expanding F1 shifts every row below.
    list.setKeys(itemKeys(compose(conversations, {work}, {"A"}, {}, {"F1"}, std::nullopt, {})));
    const auto index = list.indexOf("C");
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(list.heightAt(*index), 5);
    EXPECT_EQ(list.heightOf("section-Recent"), 1);
    EXPECT_EQ(list.heightOf("B"), 2);
}
