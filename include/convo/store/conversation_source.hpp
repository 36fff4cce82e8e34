#pragma once

#include "convo/store/entities.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace convo::store {

struct ConversationPage {
  std::size_t pageIndex = 0;
  std::vector<Conversation> conversations;
};

// Supplies conversations one page at a time. fetchPage may block and may
// throw std::runtime_error when the backing data cannot be read.
class ConversationSource {
public:
  virtual ~ConversationSource() = default;

  virtual ConversationPage fetchPage(std::size_t pageIndex,
                                     std::size_t pageSize) = 0;
  virtual std::string description() const = 0;

  // Extra data a source may carry alongside conversations.
  virtual std::vector<Project> projects() const { return {}; }
  virtual std::vector<std::string> initiallyPinned() const { return {}; }
};

/**
 * @brief Pages through a JSON array of conversations on disk.
 *
 * Accepted document shapes are a bare array or an object with a
 * "conversations" array and an optional "projects" array. Each entry needs
 * an "id"; "timestamp" may be epoch seconds or "YYYY-MM-DDTHH:MM:SS[Z]".
 */
class JsonConversationSource : public ConversationSource {
public:
  explicit JsonConversationSource(std::filesystem::path path);

  ConversationPage fetchPage(std::size_t pageIndex,
                             std::size_t pageSize) override;
  std::string description() const override;
  std::vector<Project> projects() const override;
  std::vector<std::string> initiallyPinned() const override;

private:
  void ensureLoaded();

  std::filesystem::path path_;
  bool loaded_ = false;
  std::vector<Conversation> conversations_;
  std::vector<Project> projects_;
  std::vector<std::string> pinned_;
};

// Deterministic offline data set used when no conversations file is given.
class SampleConversationSource : public ConversationSource {
public:
  explicit SampleConversationSource(std::size_t total = 50,
                                    Timestamp now = std::chrono::system_clock::now());

  ConversationPage fetchPage(std::size_t pageIndex,
                             std::size_t pageSize) override;
  std::string description() const override;
  std::vector<Project> projects() const override;
  std::vector<std::string> initiallyPinned() const override;

private:
  std::vector<Conversation> conversations_;
};

std::vector<Conversation> parseConversations(const std::string &jsonText);
std::string formatTimestamp(Timestamp timestamp);

} // namespace convo::store
