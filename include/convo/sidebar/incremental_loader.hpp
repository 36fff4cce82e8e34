#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace convo::sidebar
{

/**
 * @brief Guards the "load next page" request behind scroll notifications.
 *
 * notifyScrollNearEnd() may be called on every scroll tick. It starts a load
 * only when more data exists and nothing is in flight, so at most one
 * request is ever outstanding. The completion handed to onLoadMore resets
 * the loading flag whether the load succeeded or failed; errors are passed
 * to the error callback and never retried here.
 */
class IncrementalLoader
{
public:
    struct LoadResult
    {
        bool ok = true;
        std::string error;

        static LoadResult success() { return {}; }
        static LoadResult failure(std::string message) { return {false, std::move(message)}; }
    };

    using Completion = std::function<void(LoadResult)>;
    using LoadMoreFn = std::function<void(Completion)>;
    using ErrorCallback = std::function<void(const std::string &error)>;
    using StateCallback = std::function<void(bool loading)>;

    IncrementalLoader();
    explicit IncrementalLoader(LoadMoreFn onLoadMore);
    ~IncrementalLoader();

    IncrementalLoader(const IncrementalLoader &) = delete;
    IncrementalLoader &operator=(const IncrementalLoader &) = delete;

    void setLoadMore(LoadMoreFn onLoadMore) { onLoadMore_ = std::move(onLoadMore); }
    void setErrorCallback(ErrorCallback callback);
    void setStateCallback(StateCallback callback);

    void setHasMore(bool hasMore) noexcept { hasMore_ = hasMore; }
    bool hasMore() const noexcept { return hasMore_; }
    bool loading() const noexcept;
    // True when the most recent load completed with a failure.
    bool lastLoadFailed() const noexcept;

    // Returns true when this call started a load.
    bool notifyScrollNearEnd();

    std::size_t loadsStarted() const noexcept { return loadsStarted_; }

private:
    struct State
    {
        bool loading = false;
        bool failed = false;
        std::uint64_t generation = 0;
        ErrorCallback onError;
        StateCallback onStateChange;
    };

    static void finish(const std::weak_ptr<State> &weakState, std::uint64_t generation, LoadResult result);

    LoadMoreFn onLoadMore_;
    std::shared_ptr<State> state_;
    bool hasMore_ = true;
    std::size_t loadsStarted_ = 0;
};

} // namespace convo::sidebar
