#include <gtest/gtest.h>

#include "convo/sidebar/list_composer.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

using namespace convo::sidebar;
using convo::store::Conversation;
using convo::store::Folder;
using convo::store::IdSet;
using convo::store::Project;

namespace
{

Conversation conv(const std::string &id)
{
    Conversation conversation;
    conversation.id = id;
    conversation.title = "Title " + id;
    return conversation;
}

std::vector<Conversation> convs(std::initializer_list<const char *> ids)
{
    std::vector<Conversation> result;
    for (const char *id : ids)
        result.push_back(conv(id));
    return result;
}

Folder folder(const std::string &id, const std::string &name, std::vector<std::string> members)
{
    Folder result;
    result.id = id;
    result.name = name;
    result.conversationIds = std::move(members);
    return result;
}

// Compact rendering of a composed sequence, one token per item:
// "S:Pinned", "F:f1:2:c" (id, count, collapsed/expanded), "R:A" and "R:B+"
// for a row inside a folder.
std::vector<std::string> describe(const ComposedList &items)
{
    std::vector<std::string> tokens;
    for (const auto &item : items)
    {
        if (const auto *section = std::get_if<SectionItem>(&item))
            tokens.push_back("S:" + section->title);
        else if (const auto *header = std::get_if<FolderHeaderItem>(&item))
            tokens.push_back("F:" + header->id + ":" + std::to_string(header->count) + ":" +
                             (header->expanded ? "e" : "c"));
        else
        {
            const auto &row = std::get<ConversationRowItem>(item);
            tokens.push_back("R:" + row.conversation.id + (row.inFolder ? "+" : ""));
        }
    }
    return tokens;
}

using Tokens = std::vector<std::string>;

ComposedList composeSimple(const std::vector<Conversation> &conversations, const std::vector<Folder> &folders,
                           const IdSet &pinned, const IdSet &archived, const ExpandedFolderSet &expanded,
                           const std::optional<std::string> &project = std::nullopt,
                           const std::vector<Project> &projects = {})
{
    return compose(conversations, folders, pinned, archived, expanded, project, projects);
}

} // namespace

TEST(ListComposer, CollapsedFolderScenario)
{
    auto items = composeSimple(convs({"A", "B", "C", "D"}), {folder("F1", "Work", {"B", "C"})}, {"A"}, {}, {});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "F:F1:2:c", "S:Recent", "R:D"}));

    const auto &header = std::get<FolderHeaderItem>(items[2]);
    EXPECT_EQ(header.name, "Work");
}

TEST(ListComposer, ExpandedFolderScenario)
{
    auto items = composeSimple(convs({"A", "B", "C", "D"}), {folder("F1", "Work", {"B", "C"})}, {"A"}, {}, {"F1"});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "F:F1:2:e", "R:B+", "R:C+", "S:Recent", "R:D"}));
}

TEST(ListComposer, ArchivedFolderMemberLowersTheCount)
{
    auto items = composeSimple(convs({"A", "B", "C", "D"}), {folder("F1", "Work", {"B", "C"})}, {"A"}, {"B"}, {"F1"});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "F:F1:1:e", "R:C+", "S:Recent", "R:D"}));
}

TEST(ListComposer, EmptyInputComposesNothing)
{
    EXPECT_TRUE(composeSimple({}, {}, {}, {}, {}).empty());
}

TEST(ListComposer, RecentOnlyHasNoHeader)
{
    auto items = composeSimple(convs({"A", "B"}), {}, {}, {}, {});
    EXPECT_EQ(describe(items), (Tokens{"R:A", "R:B"}));
}

TEST(ListComposer, PinnedOnlyHasNoRecentHeader)
{
    auto items = composeSimple(convs({"A", "B"}), {}, {"A", "B"}, {}, {});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "R:B"}));
}

TEST(ListComposer, PinnedFollowsCollectionOrderNotPinOrder)
{
    auto items = composeSimple(convs({"C", "A", "B"}), {}, {"B", "C"}, {}, {});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:C", "R:B", "S:Recent", "R:A"}));
}

TEST(ListComposer, PinnedFolderMemberStaysOutOfExpandedFolder)
{
    auto items = composeSimple(convs({"A", "B", "C"}), {folder("F1", "Work", {"A", "B"})}, {"A"}, {}, {"F1"});
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "F:F1:2:e", "R:B+", "S:Recent", "R:C"}));
}

TEST(ListComposer, ArchivedPinnedConversationDisappears)
{
    auto items = composeSimple(convs({"A", "B"}), {}, {"A"}, {"A"}, {});
    EXPECT_EQ(describe(items), (Tokens{"R:B"}));
}

TEST(ListComposer, FolderWithNoVisibleMembersKeepsItsHeader)
{
    auto items = composeSimple(convs({"A", "B"}), {folder("F1", "Old", {"A"}), folder("F2", "Empty", {})}, {}, {"A"},
                               {"F1", "F2"});
    EXPECT_EQ(describe(items), (Tokens{"F:F1:0:e", "F:F2:0:e", "S:Recent", "R:B"}));
}

TEST(ListComposer, FolderMembersFollowStoredOrder)
{
    auto items = composeSimple(convs({"A", "B", "C"}), {folder("F1", "Work", {"C", "A", "B"})}, {}, {}, {"F1"});
    EXPECT_EQ(describe(items), (Tokens{"F:F1:3:e", "R:C+", "R:A+", "R:B+"}));
}

TEST(ListComposer, DanglingFolderReferencesAreIgnored)
{
    auto items = composeSimple(convs({"A"}), {folder("F1", "Work", {"ghost", "A"})}, {}, {}, {"F1"});
    EXPECT_EQ(describe(items), (Tokens{"F:F1:1:e", "R:A+"}));
}

TEST(ListComposer, OverlappingFoldersKeepTheFirstClaimant)
{
    auto items = composeSimple(convs({"A", "B"}), {folder("F1", "One", {"A", "A"}), folder("F2", "Two", {"A", "B"})},
                               {}, {}, {"F1", "F2"});
    EXPECT_EQ(describe(items), (Tokens{"F:F1:1:e", "R:A+", "F:F2:1:e", "R:B+"}));
}

TEST(ListComposer, DuplicateFolderIdsAreShownOnce)
{
    auto items = composeSimple(convs({"A", "B"}), {folder("F1", "One", {"A"}), folder("F1", "Again", {"B"})}, {}, {},
                               {});
    // B is still claimed by a folder, so it never falls back to Recent.
    EXPECT_EQ(describe(items), (Tokens{"F:F1:1:c"}));
}

TEST(ListComposer, RepeatedConversationIdsKeepTheFirst)
{
    std::vector<Conversation> input = convs({"A", "B"});
    Conversation copy = conv("A");
    copy.title = "Imposter";
    input.push_back(copy);

    auto items = composeSimple(input, {}, {}, {}, {});
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(std::get<ConversationRowItem>(items[0]).conversation.title, "Title A");
}

TEST(ListComposer, ProjectFilterRestrictsAndHidesFolders)
{
    std::vector<Project> projects{{"p1", "Work", {"A", "C", "D"}}};
    auto items = composeSimple(convs({"A", "B", "C", "D"}), {folder("F1", "Work", {"C"})}, {"A"}, {}, {"F1"},
                               std::string("p1"), projects);
    EXPECT_EQ(describe(items), (Tokens{"S:Pinned", "R:A", "S:Recent", "R:D"}));
}

TEST(ListComposer, UnknownProjectShowsNothing)
{
    auto items = composeSimple(convs({"A", "B"}), {}, {}, {}, {}, std::string("missing"), {});
    EXPECT_TRUE(items.empty());
}

TEST(ListComposer, SectionIdsMatchTheirKeys)
{
    auto items = composeSimple(convs({"A", "B"}), {}, {"A"}, {}, {});
    const auto &pinned = std::get<SectionItem>(items[0]);
    EXPECT_EQ(pinned.id, "section-Pinned");
    EXPECT_EQ(itemKey(items[0]), pinned.id);
}

TEST(ListComposer, TitleFilterIsCaseInsensitive)
{
    std::vector<Conversation> input = convs({"A", "B", "C"});
    input[0].title = "Kubernetes ingress";
    input[1].title = "Sourdough";
    input[2].title = "kubectl cheatsheet";

    auto filtered = filterByTitle(input, "KUB");
    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0].id, "A");
    EXPECT_EQ(filtered[1].id, "C");
    EXPECT_EQ(filterByTitle(input, "").size(), 3u);
}

TEST(ListComposer, RandomSnapshotsHoldTheCompositionRules)
{
    std::mt19937 rng(20240611);
    for (int round = 0; round < 200; ++round)
    {
        const int conversationCount = static_cast<int>(rng() % 25);
        std::vector<Conversation> conversations;
        for (int i = 0; i < conversationCount; ++i)
            conversations.push_back(conv("c" + std::to_string(rng() % 30)));

        std::vector<Folder> folders;
        const int folderCount = static_cast<int>(rng() % 4);
        for (int f = 0; f < folderCount; ++f)
        {
            Folder next = folder("f" + std::to_string(f), "Folder", {});
            const int members = static_cast<int>(rng() % 6);
            for (int m = 0; m < members; ++m)
                next.conversationIds.push_back("c" + std::to_string(rng() % 30));
            folders.push_back(next);
        }

        IdSet pinned, archived;
        ExpandedFolderSet expanded;
        for (int i = 0; i < 30; ++i)
        {
            const std::string id = "c" + std::to_string(i);
            if (rng() % 5 == 0)
                pinned.insert(id);
            if (rng() % 6 == 0)
                archived.insert(id);
        }
        for (const auto &f : folders)
        {
            if (rng() % 2 == 0)
                expanded.insert(f.id);
        }

        const auto items = composeSimple(conversations, folders, pinned, archived, expanded);

        std::unordered_map<std::string, int> seen;
        std::string section;
        bool sawAnything = false;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const auto &item = items[i];
            if (const auto *s = std::get_if<SectionItem>(&item))
            {
                section = s->title;
                // A header is always followed by at least one row.
                ASSERT_LT(i + 1, items.size());
                EXPECT_EQ(kindOf(items[i + 1]), ItemKind::ConversationRow);
                if (s->title == kRecentSectionTitle)
                    EXPECT_TRUE(sawAnything);
            }
            else if (const auto *row = std::get_if<ConversationRowItem>(&item))
            {
                const std::string &id = row->conversation.id;
                EXPECT_EQ(++seen[id], 1) << "duplicate row " << id;
                EXPECT_EQ(archived.count(id), 0u) << "archived row " << id;
                if (pinned.count(id))
                {
                    EXPECT_EQ(section, kPinnedSectionTitle);
                    EXPECT_FALSE(row->inFolder);
                }
            }
            else
            {
                section.clear();
            }
            sawAnything = true;
        }

        // Keys are unique across the whole sequence.
        auto keys = itemKeys(items);
        std::sort(keys.begin(), keys.end());
        EXPECT_EQ(std::adjacent_find(keys.begin(), keys.end()), keys.end());
    }
}

TEST(MemoizedComposer, RecomputesOnlyWhenAnInputChanges)
{
    convo::store::Snapshot snapshot;
    snapshot.revision = 1;
    snapshot.conversations = convs({"A", "B"});
    snapshot.folders = {folder("F1", "Work", {"B"})};

    MemoizedComposer composer;
    ExpandedFolderSet expanded;
    composer.compose(snapshot, expanded, std::nullopt);
    composer.compose(snapshot, expanded, std::nullopt);
    EXPECT_EQ(composer.recomputeCount(), 1u);

    expanded.insert("F1");
    composer.compose(snapshot, expanded, std::nullopt);
    EXPECT_EQ(composer.recomputeCount(), 2u);
    EXPECT_EQ(describe(composer.items()), (Tokens{"F:F1:1:e", "R:B+", "S:Recent", "R:A"}));

    snapshot.revision = 2;
    snapshot.pinned.insert("A");
    composer.compose(snapshot, expanded, std::nullopt);
    EXPECT_EQ(composer.recomputeCount(), 3u);

    composer.compose(snapshot, expanded, std::nullopt, "title b");
    EXPECT_EQ(composer.recomputeCount(), 4u);
    EXPECT_EQ(describe(composer.items()), (Tokens{"F:F1:1:e", "R:B+"}));

    composer.invalidate();
    composer.compose(snapshot, expanded, std::nullopt, "title b");
    EXPECT_EQ(composer.recomputeCount(), 5u);
}
