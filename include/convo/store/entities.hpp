#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace convo::store {

using Timestamp = std::chrono::system_clock::time_point;
using IdSet = std::unordered_set<std::string>;

struct Conversation {
  std::string id;
  std::string title;
  std::string lastMessage;
  Timestamp timestamp{};

  bool operator==(const Conversation &other) const {
    return id == other.id && title == other.title &&
           lastMessage == other.lastMessage && timestamp == other.timestamp;
  }
};

struct Folder {
  std::string id;
  std::string name;
  std::optional<std::string> color;
  // Ordered, duplicate-free. Disjoint from every other folder's members.
  std::vector<std::string> conversationIds;
};

struct Project {
  std::string id;
  std::string name;
  std::vector<std::string> conversationIds;
};

// Immutable copy of the store's collections at one revision.
struct Snapshot {
  std::uint64_t revision = 0;
  std::vector<Conversation> conversations;
  std::vector<Folder> folders;
  std::vector<Project> projects;
  IdSet pinned;
  IdSet archived;
};

} // namespace convo::store
