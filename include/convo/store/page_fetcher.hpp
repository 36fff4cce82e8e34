#pragma once

#include "convo/store/conversation_source.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace convo::store {

/**
 * @brief Runs ConversationSource::fetchPage on a worker thread.
 *
 * Only one fetch runs at a time. The result is parked until the owning
 * thread calls poll(), which invokes the completion there, so store
 * mutations never happen off the UI thread. Destroying the fetcher joins the
 * worker and drops a result that was never polled.
 */
class PageFetcher {
public:
  struct Result {
    bool ok = false;
    ConversationPage page;
    std::string error;
  };
  using Completion = std::function<void(Result)>;

  explicit PageFetcher(std::shared_ptr<ConversationSource> source);
  ~PageFetcher();

  PageFetcher(const PageFetcher &) = delete;
  PageFetcher &operator=(const PageFetcher &) = delete;

  // Returns false when a fetch is already running or awaiting poll().
  bool start(std::size_t pageIndex, std::size_t pageSize, Completion completion);

  // Delivers a finished result. Returns true when a completion ran.
  bool poll();

  bool busy() const;
  const std::shared_ptr<ConversationSource> &source() const noexcept {
    return source_;
  }

private:
  void joinWorker();

  std::shared_ptr<ConversationSource> source_;
  mutable std::mutex mutex_;
  std::thread worker_;
  bool running_ = false;
  std::optional<Result> finished_;
  Completion completion_;
  std::atomic<bool> shuttingDown_{false};
};

} // namespace convo::store
