#include "convo/store/conversation_source.hpp"
#include "convo/store/page_fetcher.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace {

class ConversationFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("convo_conversations_" +
             std::to_string(
                 std::chrono::steady_clock::now().time_since_epoch().count()) +
             ".json");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void write(const std::string &text) {
    std::ofstream out(path_);
    out << text;
  }

  std::filesystem::path path_;
};

// Blocks fetchPage until released so tests can observe a running fetch.
class GatedSource : public convo::store::ConversationSource {
public:
  convo::store::ConversationPage fetchPage(std::size_t pageIndex,
                                           std::size_t pageSize) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return open_; });
    if (fail_)
      throw std::runtime_error("backend unavailable");
    convo::store::ConversationPage page;
    page.pageIndex = pageIndex;
    for (std::size_t i = 0; i < pageSize; ++i) {
      convo::store::Conversation conversation;
      conversation.id = "p" + std::to_string(pageIndex) + "-" + std::to_string(i);
      page.conversations.push_back(conversation);
    }
    return page;
  }

  std::string description() const override { return "gated"; }

  void release(bool fail = false) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
      fail_ = fail;
    }
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  bool fail_ = false;
};

// Polls until a completion ran or the deadline passes.
bool pollUntilDelivered(convo::store::PageFetcher &fetcher) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (fetcher.poll())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return false;
}

} // namespace

TEST(ConversationSource, ParsesArrayAndObjectDocuments) {
  auto fromArray = convo::store::parseConversations(
      R"([{"id": "a", "title": "First", "lastMessage": "hi", "timestamp": 60},
          {"title": "no id"},
          {"id": "b", "timestamp": "1970-01-01T00:02:00Z"}])");
  ASSERT_EQ(fromArray.size(), 2u);
  EXPECT_EQ(fromArray[0].title, "First");
  EXPECT_EQ(fromArray[0].lastMessage, "hi");
  EXPECT_EQ(std::chrono::system_clock::to_time_t(fromArray[0].timestamp), 60);
  EXPECT_EQ(std::chrono::system_clock::to_time_t(fromArray[1].timestamp), 120);
  EXPECT_TRUE(fromArray[1].title.empty());

  auto fromObject = convo::store::parseConversations(
      R"({"conversations": [{"id": "x"}]})");
  ASSERT_EQ(fromObject.size(), 1u);
  EXPECT_EQ(fromObject[0].id, "x");
}

TEST(ConversationSource, RejectsInvalidDocuments) {
  EXPECT_THROW(convo::store::parseConversations("{ nope"), std::runtime_error);
  EXPECT_THROW(convo::store::parseConversations("42"), std::runtime_error);
}

TEST(ConversationSource, FormatsTimestampsInUtc) {
  auto timestamp = std::chrono::system_clock::from_time_t(86400 + 3600 + 120);
  EXPECT_EQ(convo::store::formatTimestamp(timestamp), "1970-01-02 01:02");
}

TEST_F(ConversationFileTest, PagesThroughTheFile) {
  write(R"({
    "conversations": [
      {"id": "c1", "title": "One", "pinned": true},
      {"id": "c2", "title": "Two"},
      {"id": "c3", "title": "Three"}
    ],
    "projects": [{"id": "p1", "name": "Work", "conversationIds": ["c1", "c1", "c3"]}]
  })");

  convo::store::JsonConversationSource source(path_);
  auto first = source.fetchPage(0, 2);
  ASSERT_EQ(first.conversations.size(), 2u);
  EXPECT_EQ(first.conversations[1].id, "c2");

  auto second = source.fetchPage(1, 2);
  ASSERT_EQ(second.conversations.size(), 1u);
  EXPECT_EQ(second.pageIndex, 1u);

  EXPECT_TRUE(source.fetchPage(2, 2).conversations.empty());
  EXPECT_TRUE(source.fetchPage(0, 0).conversations.empty());

  ASSERT_EQ(source.projects().size(), 1u);
  EXPECT_EQ(source.projects()[0].conversationIds,
            (std::vector<std::string>{"c1", "c3"}));
  EXPECT_EQ(source.initiallyPinned(), (std::vector<std::string>{"c1"}));
}

TEST_F(ConversationFileTest, SkipsEntriesWithWrongTypedFields) {
  write(R"({
    "conversations": [
      {"id": "c1", "title": "One"},
      {"id": "c2", "title": 5},
      {"id": "c3", "lastMessage": ["not", "text"]},
      {"id": "c4", "title": "Four", "pinned": "yes"},
      {"id": "c5", "title": "Five", "pinned": true}
    ],
    "projects": [{"id": "p1", "name": 7}, {"id": "p2", "name": "Home"}]
  })");

  convo::store::JsonConversationSource source(path_);
  auto page = source.fetchPage(0, 10);
  std::vector<std::string> ids;
  for (const auto &conversation : page.conversations)
    ids.push_back(conversation.id);
  EXPECT_EQ(ids, (std::vector<std::string>{"c1", "c5"}));
  EXPECT_EQ(source.initiallyPinned(), (std::vector<std::string>{"c5"}));
  ASSERT_EQ(source.projects().size(), 1u);
  EXPECT_EQ(source.projects()[0].id, "p2");

  EXPECT_EQ(convo::store::parseConversations(
                R"([{"id": "a", "title": false}, {"id": "b"}])")
                .size(),
            1u);
}

TEST_F(ConversationFileTest, MissingOrBrokenFileThrowsOnFetch) {
  convo::store::JsonConversationSource missing(path_);
  EXPECT_THROW(missing.fetchPage(0, 10), std::runtime_error);

  write("[{]");
  convo::store::JsonConversationSource broken(path_);
  EXPECT_THROW(broken.fetchPage(0, 10), std::runtime_error);
}

TEST(SampleConversationSource, GeneratesStablePages) {
  const auto now = std::chrono::system_clock::from_time_t(1700000000);
  convo::store::SampleConversationSource source(25, now);

  auto page = source.fetchPage(1, 10);
  ASSERT_EQ(page.conversations.size(), 10u);
  EXPECT_EQ(page.conversations[0].id, "conv-11");
  EXPECT_EQ(source.fetchPage(2, 10).conversations.size(), 5u);
  EXPECT_LT(page.conversations[1].timestamp, page.conversations[0].timestamp);

  EXPECT_EQ(source.initiallyPinned(), (std::vector<std::string>{"conv-1", "conv-2"}));
  ASSERT_EQ(source.projects().size(), 1u);
  EXPECT_FALSE(source.projects()[0].conversationIds.empty());
}

TEST(PageFetcher, DeliversResultsOnlyThroughPoll) {
  auto source = std::make_shared<GatedSource>();
  convo::store::PageFetcher fetcher(source);

  std::vector<std::string> ids;
  ASSERT_TRUE(fetcher.start(3, 2, [&](convo::store::PageFetcher::Result result) {
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.page.pageIndex, 3u);
    for (const auto &conversation : result.page.conversations)
      ids.push_back(conversation.id);
  }));
  EXPECT_TRUE(fetcher.busy());
  EXPECT_FALSE(fetcher.start(4, 2, [](convo::store::PageFetcher::Result) {}));
  EXPECT_FALSE(fetcher.poll());

  source->release();
  ASSERT_TRUE(pollUntilDelivered(fetcher));
  EXPECT_EQ(ids, (std::vector<std::string>{"p3-0", "p3-1"}));
  EXPECT_FALSE(fetcher.busy());
}

TEST(PageFetcher, ReportsSourceErrors) {
  auto source = std::make_shared<GatedSource>();
  convo::store::PageFetcher fetcher(source);

  std::string error;
  ASSERT_TRUE(fetcher.start(0, 5, [&](convo::store::PageFetcher::Result result) {
    EXPECT_FALSE(result.ok);
    error = result.error;
  }));
  source->release(true);
  ASSERT_TRUE(pollUntilDelivered(fetcher));
  EXPECT_EQ(error, "backend unavailable");

  // The fetcher is reusable after a failure.
  EXPECT_TRUE(fetcher.start(1, 1, [](convo::store::PageFetcher::Result) {}));
  ASSERT_TRUE(pollUntilDelivered(fetcher));
}

TEST(PageFetcher, DestructionDropsAnUnpolledResult) {
  auto source = std::make_shared<GatedSource>();
  bool called = false;
  {
    convo::store::PageFetcher fetcher(source);
    ASSERT_TRUE(fetcher.start(0, 1, [&](convo::store::PageFetcher::Result) {
      called = true;
    }));
    source->release();
  }
  EXPECT_FALSE(called);
}

TEST(PageFetcher, RefusesToStartWithoutSource) {
  convo::store::PageFetcher fetcher(nullptr);
  EXPECT_FALSE(fetcher.start(0, 1, [](convo::store::PageFetcher::Result) {}));
  EXPECT_FALSE(fetcher.busy());
}
