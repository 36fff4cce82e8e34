#include "convo/store/page_fetcher.hpp"
#include "convo/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace convo::store {

PageFetcher::PageFetcher(std::shared_ptr<ConversationSource> source)
    : source_(std::move(source)) {}

PageFetcher::~PageFetcher() {
  shuttingDown_ = true;
  joinWorker();
}

bool PageFetcher::start(std::size_t pageIndex, std::size_t pageSize,
                        Completion completion) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ || finished_ || !source_)
    return false;

  // The previous worker has already parked its result and returned.
  if (worker_.joinable())
    worker_.join();

  running_ = true;
  completion_ = std::move(completion);
  worker_ = std::thread([this, pageIndex, pageSize]() {
    Result result;
    try {
      result.page = source_->fetchPage(pageIndex, pageSize);
      result.ok = true;
    } catch (const std::exception &ex) {
      result.ok = false;
      result.error = ex.what();
      log::warning("Fetching page " + std::to_string(pageIndex) + " failed: " +
                   result.error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    if (!shuttingDown_)
      finished_ = std::move(result);
  });
  return true;
}

bool PageFetcher::poll() {
  Result result;
  Completion completion;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_)
      return false;
    result = std::move(*finished_);
    finished_.reset();
    completion = std::move(completion_);
    completion_ = nullptr;
  }
  joinWorker();
  if (completion)
    completion(std::move(result));
  return true;
}

bool PageFetcher::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ || finished_.has_value();
}

void PageFetcher::joinWorker() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

} // namespace convo::store
