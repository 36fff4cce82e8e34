#include "convo/sidebar/windowed_list.hpp"

#include <algorithm>

namespace convo::sidebar
{
namespace
{
std::size_t highestPowerOfTwo(std::size_t n)
{
    std::size_t step = 1;
    while (step <= n / 2)
        step <<= 1;
    return step;
}
} // namespace

WindowedList::WindowedList(int estimatedItemHeight, std::size_t overscan)
    : estimatedHeight_(std::max(1, estimatedItemHeight)), overscan_(overscan)
{
}

void WindowedList::setEstimatedItemHeight(int height)
{
    height = std::max(1, height);
    if (height == estimatedHeight_)
        return;
    estimatedHeight_ = height;
    for (std::size_t i = 0; i < keys_.size(); ++i)
    {
        if (!isMeasured(keys_[i]))
            heights_[i] = estimatedHeight_;
    }
    rebuildTree();
    clampScroll();
}

void WindowedList::setKeys(std::vector<std::string> keys)
{
    keys_ = std::move(keys);
    indexByKey_.clear();
    indexByKey_.reserve(keys_.size());
    heights_.assign(keys_.size(), estimatedHeight_);
    for (std::size_t i = 0; i < keys_.size(); ++i)
    {
        indexByKey_.emplace(keys_[i], i);
        auto it = measured_.find(keys_[i]);
        if (it != measured_.end())
            heights_[i] = it->second;
    }
    rebuildTree();
    clampScroll();
}

std::optional<std::size_t> WindowedList::indexOf(const std::string &key) const
{
    auto it = indexByKey_.find(key);
    if (it == indexByKey_.end())
        return std::nullopt;
    return it->second;
}

bool WindowedList::reportHeight(const std::string &key, int height)
{
    height = std::max(0, height);
    auto cached = measured_.find(key);
    if (cached != measured_.end() && cached->second == height)
        return false;
    measured_[key] = height;

    auto index = indexOf(key);
    if (!index)
        return false;
    const int delta = height - heights_[*index];
    if (delta == 0)
        return false;
    heights_[*index] = height;
    addToTree(*index, delta);
    total_ += delta;
    clampScroll();
    return true;
}

bool WindowedList::isMeasured(const std::string &key) const
{
    return measured_.find(key) != measured_.end();
}

int WindowedList::heightOf(const std::string &key) const
{
    auto it = measured_.find(key);
    return it != measured_.end() ? it->second : estimatedHeight_;
}

int WindowedList::heightAt(std::size_t index) const
{
    return index < heights_.size() ? heights_[index] : 0;
}

void WindowedList::clearMeasurements()
{
    measured_.clear();
    std::fill(heights_.begin(), heights_.end(), estimatedHeight_);
    rebuildTree();
    clampScroll();
}

bool WindowedList::forgetMeasurement(const std::string &key)
{
    if (measured_.erase(key) == 0)
        return false;
    if (auto index = indexOf(key))
    {
        const int delta = estimatedHeight_ - heights_[*index];
        if (delta != 0)
        {
            heights_[*index] = estimatedHeight_;
            addToTree(*index, delta);
            total_ += delta;
            clampScroll();
        }
    }
    return true;
}

void WindowedList::setViewportHeight(int height)
{
    viewportHeight_ = std::max(0, height);
    clampScroll();
}

void WindowedList::setScrollTop(int offset)
{
    scrollTop_ = offset;
    clampScroll();
}

int WindowedList::maxScrollTop() const noexcept
{
    return std::max(0, total_ - viewportHeight_);
}

void WindowedList::scrollToIndex(std::size_t index)
{
    if (index >= keys_.size())
        return;
    const int top = offsetOf(index);
    const int bottom = top + heights_[index];
    if (top < scrollTop_)
        setScrollTop(top);
    else if (bottom > scrollTop_ + viewportHeight_)
        setScrollTop(std::min(top, bottom - viewportHeight_));
}

int WindowedList::totalHeight() const noexcept
{
    return total_;
}

int WindowedList::offsetOf(std::size_t index) const
{
    return prefixSum(std::min(index, keys_.size()));
}

std::size_t WindowedList::indexAtOffset(int offset) const
{
    const std::size_t n = keys_.size();
    if (n == 0 || offset < 0)
        return 0;

    // Largest count whose prefix sum is <= offset; that many items end at or
    // before the offset, so the next one covers it.
    std::size_t pos = 0;
    int remaining = offset;
    for (std::size_t step = highestPowerOfTwo(n); step > 0; step >>= 1)
    {
        std::size_t next = pos + step;
        if (next <= n && tree_[next] <= remaining)
        {
            pos = next;
            remaining -= tree_[next];
        }
    }
    return std::min(pos, n - 1);
}

WindowedList::Window WindowedList::window() const
{
    Window result;
    if (keys_.empty())
        return result;

    result.empty = false;
    result.totalHeight = total_;
    if (viewportHeight_ <= 0)
    {
        result.trailingSpacer = total_;
        return result;
    }

    const std::size_t firstVisible = indexAtOffset(scrollTop_);
    const std::size_t first = firstVisible > overscan_ ? firstVisible - overscan_ : 0;

    const int limit = scrollTop_ + viewportHeight_ + static_cast<int>(overscan_) * estimatedHeight_;
    std::size_t lastVisible = indexAtOffset(limit - 1);
    lastVisible = std::max(lastVisible, firstVisible);

    result.first = first;
    result.last = lastVisible + 1;
    result.leadingSpacer = prefixSum(result.first);
    const int throughLast = prefixSum(result.last);
    result.materializedHeight = throughLast - result.leadingSpacer;
    result.trailingSpacer = total_ - throughLast;
    return result;
}

bool WindowedList::nearEnd(std::size_t threshold) const
{
    Window current = window();
    if (current.empty || current.count() == 0)
        return false;
    // Rows after the materialized window.
    return current.last + threshold >= keys_.size();
}

void WindowedList::rebuildTree()
{
    const std::size_t n = heights_.size();
    tree_.assign(n + 1, 0);
    total_ = 0;
    for (std::size_t i = 1; i <= n; ++i)
    {
        tree_[i] += heights_[i - 1];
        total_ += heights_[i - 1];
        std::size_t parent = i + (i & (~i + 1));
        if (parent <= n)
            tree_[parent] += tree_[i];
    }
}

void WindowedList::addToTree(std::size_t index, int delta)
{
    const std::size_t n = heights_.size();
    for (std::size_t i = index + 1; i <= n; i += i & (~i + 1))
        tree_[i] += delta;
}

int WindowedList::prefixSum(std::size_t count) const
{
    int sum = 0;
    for (std::size_t i = std::min(count, heights_.size()); i > 0; i -= i & (~i + 1))
        sum += tree_[i];
    return sum;
}

void WindowedList::clampScroll()
{
    scrollTop_ = std::clamp(scrollTop_, 0, maxScrollTop());
}

} // namespace convo::sidebar
