#include "convo/store/conversation_source.hpp"
#include "convo/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace convo::store {

namespace {

using nlohmann::json;

std::optional<Timestamp> parse_iso_timestamp(const std::string &text) {
  std::tm tm{};
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int matched = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month,
                            &day, &hour, &minute, &second);
  if (matched < 3)
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > 31)
    return std::nullopt;
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1))
    return std::nullopt;
  return std::chrono::system_clock::from_time_t(seconds);
}

Timestamp timestamp_from_json(const json &value) {
  if (value.is_number_integer() || value.is_number_unsigned())
    return std::chrono::system_clock::from_time_t(
        static_cast<std::time_t>(value.get<std::int64_t>()));
  if (value.is_number_float())
    return std::chrono::system_clock::from_time_t(
        static_cast<std::time_t>(value.get<double>()));
  if (value.is_string()) {
    if (auto parsed = parse_iso_timestamp(value.get<std::string>()))
      return *parsed;
  }
  return Timestamp{};
}

std::vector<std::string> id_list(const json &value) {
  std::vector<std::string> ids;
  if (!value.is_array())
    return ids;
  std::unordered_set<std::string> seen;
  for (const auto &id : value) {
    if (id.is_string() && seen.insert(id.get<std::string>()).second)
      ids.push_back(id.get<std::string>());
  }
  return ids;
}

// Throws nlohmann::json::exception when a present field has the wrong type.
std::optional<Conversation> conversation_from_json(const json &entry,
                                                   bool &pinned) {
  if (!entry.is_object())
    return std::nullopt;
  auto id = entry.find("id");
  if (id == entry.end() || !id->is_string() || id->get<std::string>().empty())
    return std::nullopt;
  Conversation conversation;
  conversation.id = id->get<std::string>();
  conversation.title = entry.value("title", "");
  conversation.lastMessage = entry.value("lastMessage", "");
  if (auto ts = entry.find("timestamp"); ts != entry.end())
    conversation.timestamp = timestamp_from_json(*ts);
  pinned = entry.value("pinned", false);
  return conversation;
}

std::vector<Conversation> conversations_from_json(const json &array,
                                                  std::vector<std::string> *pinned) {
  std::vector<Conversation> conversations;
  if (!array.is_array())
    return conversations;
  conversations.reserve(array.size());
  for (const auto &entry : array) {
    std::optional<Conversation> conversation;
    bool isPinned = false;
    try {
      conversation = conversation_from_json(entry, isPinned);
    } catch (const json::exception &ex) {
      log::warning(std::string("Skipping malformed conversation entry: ") +
                   ex.what());
      continue;
    }
    if (!conversation)
      continue;
    if (pinned && isPinned)
      pinned->push_back(conversation->id);
    conversations.push_back(std::move(*conversation));
  }
  return conversations;
}

std::vector<Project> projects_from_json(const json &array) {
  std::vector<Project> projects;
  if (!array.is_array())
    return projects;
  for (const auto &entry : array) {
    if (!entry.is_object())
      continue;
    Project project;
    try {
      project.id = entry.value("id", "");
      project.name = entry.value("name", project.id);
    } catch (const json::exception &ex) {
      log::warning(std::string("Skipping malformed project entry: ") +
                   ex.what());
      continue;
    }
    if (project.id.empty())
      continue;
    if (auto ids = entry.find("conversationIds"); ids != entry.end())
      project.conversationIds = id_list(*ids);
    projects.push_back(std::move(project));
  }
  return projects;
}

ConversationPage slice(const std::vector<Conversation> &all,
                       std::size_t pageIndex, std::size_t pageSize) {
  ConversationPage page;
  page.pageIndex = pageIndex;
  if (pageSize == 0)
    return page;
  const std::size_t begin = pageIndex * pageSize;
  if (begin >= all.size())
    return page;
  const std::size_t end = std::min(all.size(), begin + pageSize);
  page.conversations.assign(all.begin() + static_cast<std::ptrdiff_t>(begin),
                            all.begin() + static_cast<std::ptrdiff_t>(end));
  return page;
}

constexpr std::array<const char *, 10> kSampleTopics = {
    "Refactoring the parser",    "Trip planning for Lisbon",
    "Unit test ideas",           "Sourdough troubleshooting",
    "Kubernetes ingress setup",  "Reading list for winter",
    "SQL window functions",      "Birthday gift brainstorm",
    "Explaining Fenwick trees",  "Weekly meal prep"};

constexpr std::array<const char *, 5> kSampleReplies = {
    "Sounds good, let's try that next.",
    "Here is a shorter version of the outline.",
    "Can you show me an example?",
    "That fixed it, thanks!",
    "I summarised the key points below."};

} // namespace

std::vector<Conversation> parseConversations(const std::string &jsonText) {
  json doc;
  try {
    doc = json::parse(jsonText);
  } catch (const json::exception &ex) {
    throw std::runtime_error(std::string("Invalid conversations JSON: ") +
                             ex.what());
  }
  if (doc.is_object())
    return conversations_from_json(doc.value("conversations", json::array()),
                                   nullptr);
  if (doc.is_array())
    return conversations_from_json(doc, nullptr);
  throw std::runtime_error("Conversations JSON must be an array or object");
}

std::string formatTimestamp(Timestamp timestamp) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", &tm);
  return buffer;
}

JsonConversationSource::JsonConversationSource(std::filesystem::path path)
    : path_(std::move(path)) {}

void JsonConversationSource::ensureLoaded() {
  if (loaded_)
    return;

  std::ifstream file(path_);
  if (!file.is_open())
    throw std::runtime_error("Unable to open " + path_.string());
  std::stringstream buffer;
  buffer << file.rdbuf();

  json doc;
  try {
    doc = json::parse(buffer.str());
  } catch (const json::exception &ex) {
    throw std::runtime_error("Invalid JSON in " + path_.string() + ": " +
                             ex.what());
  }

  std::vector<std::string> pinned;
  if (doc.is_array()) {
    conversations_ = conversations_from_json(doc, &pinned);
  } else if (doc.is_object()) {
    conversations_ = conversations_from_json(
        doc.value("conversations", json::array()), &pinned);
    projects_ = projects_from_json(doc.value("projects", json::array()));
  } else {
    throw std::runtime_error(path_.string() +
                             " must hold an array or an object");
  }
  pinned_ = std::move(pinned);
  loaded_ = true;
}

ConversationPage JsonConversationSource::fetchPage(std::size_t pageIndex,
                                                   std::size_t pageSize) {
  ensureLoaded();
  return slice(conversations_, pageIndex, pageSize);
}

std::string JsonConversationSource::description() const {
  return path_.string();
}

std::vector<Project> JsonConversationSource::projects() const {
  return projects_;
}

std::vector<std::string> JsonConversationSource::initiallyPinned() const {
  return pinned_;
}

SampleConversationSource::SampleConversationSource(std::size_t total,
                                                   Timestamp now) {
  conversations_.reserve(total);
  for (std::size_t i = 0; i < total; ++i) {
    Conversation conversation;
    conversation.id = "conv-" + std::to_string(i + 1);
    conversation.title = std::string(kSampleTopics[i % kSampleTopics.size()]);
    if (i >= kSampleTopics.size())
      conversation.title += " (" + std::to_string(i / kSampleTopics.size() + 1) + ")";
    conversation.lastMessage = kSampleReplies[i % kSampleReplies.size()];
    conversation.timestamp = now - std::chrono::hours(3 * static_cast<int>(i));
    conversations_.push_back(std::move(conversation));
  }
}

ConversationPage SampleConversationSource::fetchPage(std::size_t pageIndex,
                                                     std::size_t pageSize) {
  return slice(conversations_, pageIndex, pageSize);
}

std::string SampleConversationSource::description() const {
  return "sample data (" + std::to_string(conversations_.size()) +
         " conversations)";
}

std::vector<Project> SampleConversationSource::projects() const {
  Project project;
  project.id = "project-work";
  project.name = "Work";
  for (const auto &conversation : conversations_) {
    if (conversation.title.rfind("Refactoring", 0) == 0 ||
        conversation.title.rfind("Unit test", 0) == 0 ||
        conversation.title.rfind("Kubernetes", 0) == 0 ||
        conversation.title.rfind("SQL", 0) == 0)
      project.conversationIds.push_back(conversation.id);
  }
  return {project};
}

std::vector<std::string> SampleConversationSource::initiallyPinned() const {
  std::vector<std::string> pinned;
  for (std::size_t i = 0; i < conversations_.size() && i < 2; ++i)
    pinned.push_back(conversations_[i].id);
  return pinned;
}

} // namespace convo::store
