#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace convo::sidebar
{

/**
 * @brief Variable-height windowing over a keyed item sequence.
 *
 * Heights are cached per item key and start at the estimated height until a
 * real height is reported. Cumulative heights live in a Fenwick tree, so a
 * measured height costs O(log n), locating the first visible row is an
 * O(log n) descent, and only replacing the item sequence costs O(n).
 *
 * The window always satisfies
 *   leadingSpacer + materializedHeight + trailingSpacer == totalHeight.
 */
class WindowedList
{
public:
    struct Window
    {
        // No items at all: the caller shows its empty state instead.
        bool empty = true;
        // [first, last) materialized indices. first == last when nothing is
        // materialized (no items, or viewport not laid out yet).
        std::size_t first = 0;
        std::size_t last = 0;
        int leadingSpacer = 0;
        int materializedHeight = 0;
        int trailingSpacer = 0;
        int totalHeight = 0;

        std::size_t count() const noexcept { return last - first; }
        bool contains(std::size_t index) const noexcept { return index >= first && index < last; }
    };

    explicit WindowedList(int estimatedItemHeight = 1, std::size_t overscan = 0);

    void setEstimatedItemHeight(int height);
    int estimatedItemHeight() const noexcept { return estimatedHeight_; }
    void setOverscan(std::size_t overscan) noexcept { overscan_ = overscan; }
    std::size_t overscan() const noexcept { return overscan_; }

    // Replaces the sequence. Cached heights of keys survive the change.
    void setKeys(std::vector<std::string> keys);

    template <typename T, typename KeyFn>
    void setItems(const std::vector<T> &items, KeyFn getItemKey)
    {
        std::vector<std::string> keys;
        keys.reserve(items.size());
        for (const auto &item : items)
            keys.push_back(getItemKey(item));
        setKeys(std::move(keys));
    }

    const std::vector<std::string> &keys() const noexcept { return keys_; }
    std::size_t size() const noexcept { return keys_.size(); }
    std::optional<std::size_t> indexOf(const std::string &key) const;

    // Records an observed height. Returns true when the layout changed.
    bool reportHeight(const std::string &key, int height);
    bool isMeasured(const std::string &key) const;
    int heightOf(const std::string &key) const;
    int heightAt(std::size_t index) const;
    void clearMeasurements();
    // Drops the cached height of a key that will not come back. A key still
    // in the sequence falls back to the estimate.
    bool forgetMeasurement(const std::string &key);
    std::size_t measuredCount() const noexcept { return measured_.size(); }

    void setViewportHeight(int height);
    int viewportHeight() const noexcept { return viewportHeight_; }

    void setScrollTop(int offset);
    void scrollBy(int delta) { setScrollTop(scrollTop_ + delta); }
    int scrollTop() const noexcept { return scrollTop_; }
    int maxScrollTop() const noexcept;

    // Scrolls the least amount needed to show the whole item.
    void scrollToIndex(std::size_t index);

    int totalHeight() const noexcept;
    // Sum of the heights of items [0, index).
    int offsetOf(std::size_t index) const;
    // Index of the item covering the given pixel offset, clamped to the
    // sequence. Zero-height items never cover an offset. Requires a non-empty
    // sequence.
    std::size_t indexAtOffset(int offset) const;

    Window window() const;

    // True when at most `threshold` items follow the materialized window.
    bool nearEnd(std::size_t threshold) const;

private:
    void rebuildTree();
    void addToTree(std::size_t index, int delta);
    int prefixSum(std::size_t count) const;
    void clampScroll();

    int estimatedHeight_ = 1;
    std::size_t overscan_ = 0;
    int viewportHeight_ = 0;
    int scrollTop_ = 0;

    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::size_t> indexByKey_;
    std::unordered_map<std::string, int> measured_;
    std::vector<int> heights_;
    std::vector<int> tree_;
    int total_ = 0;
};

} // namespace convo::sidebar
