#include "convo/sidebar/incremental_loader.hpp"

#include <exception>

namespace convo::sidebar
{

IncrementalLoader::IncrementalLoader()
    : state_(std::make_shared<State>())
{
}

IncrementalLoader::IncrementalLoader(LoadMoreFn onLoadMore)
    : onLoadMore_(std::move(onLoadMore)), state_(std::make_shared<State>())
{
}

// Completions still held by an in-flight request only keep a weak_ptr, so
// releasing the state here turns them into no-ops.
IncrementalLoader::~IncrementalLoader() = default;

void IncrementalLoader::setErrorCallback(ErrorCallback callback)
{
    state_->onError = std::move(callback);
}

void IncrementalLoader::setStateCallback(StateCallback callback)
{
    state_->onStateChange = std::move(callback);
}

bool IncrementalLoader::loading() const noexcept
{
    return state_->loading;
}

bool IncrementalLoader::lastLoadFailed() const noexcept
{
    return state_->failed;
}

bool IncrementalLoader::notifyScrollNearEnd()
{
    if (!hasMore_ || state_->loading || !onLoadMore_)
        return false;

    state_->loading = true;
    state_->failed = false;
    const std::uint64_t generation = ++state_->generation;
    ++loadsStarted_;
    if (state_->onStateChange)
        state_->onStateChange(true);

    std::weak_ptr<State> weakState = state_;
    Completion completion = [weakState, generation](LoadResult result)
    { finish(weakState, generation, std::move(result)); };

    try
    {
        onLoadMore_(std::move(completion));
    }
    catch (const std::exception &ex)
    {
        finish(state_, generation, LoadResult::failure(ex.what()));
    }
    return true;
}

void IncrementalLoader::finish(const std::weak_ptr<State> &weakState, std::uint64_t generation, LoadResult result)
{
    auto state = weakState.lock();
    if (!state)
        return;
    // A stale or repeated completion must not end a newer request.
    if (!state->loading || state->generation != generation)
        return;

    state->loading = false;
    state->failed = !result.ok;
    if (state->onStateChange)
        state->onStateChange(false);
    if (!result.ok && state->onError)
        state->onError(result.error.empty() ? std::string("Failed to load more conversations") : result.error);
}

} // namespace convo::sidebar
