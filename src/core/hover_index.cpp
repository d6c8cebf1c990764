#include "hover_index.hpp"

#include <algorithm>
#include <cmath>

namespace tlviz
{

namespace
{
const std::vector<HoverSpan> kEmptyBucket;
}

void HoverIndex::clear()
{
    buckets_.clear();
    layers_.clear();
}

void HoverIndex::rebuild(const TimelineDrawState& draw_state, const LayerMap& layers)
{
    layers_ = layers;
    buckets_.assign(layers.size(), {});

    for (const auto& [key, state] : draw_state)
    {
        if (!state.visible || state.row < 0)
            continue;
        auto row = static_cast<size_t>(state.row);
        if (row >= buckets_.size())
            continue;
        buckets_[row].push_back(HoverSpan{state.left, state.left + state.width, key});
    }

    for (auto& spans : buckets_)
    {
        std::stable_sort(spans.begin(), spans.end(),
                         [](const HoverSpan& a, const HoverSpan& b) { return a.start_x < b.start_x; });
    }
}

std::optional<DrawStateKey> HoverIndex::hit_test(double x, double y, double row_height) const
{
    if (buckets_.empty() || row_height <= 0.0 || y < 0.0)
        return std::nullopt;

    auto row = static_cast<size_t>(std::floor(y / row_height));
    if (row >= buckets_.size())
        return std::nullopt;

    for (const auto& span : buckets_[row])
    {
        if (span.start_x > x)
            break;
        if (x <= span.end_x)
            return span.key;
    }
    return std::nullopt;
}

size_t HoverIndex::span_count() const
{
    size_t count = 0;
    for (const auto& spans : buckets_)
        count += spans.size();
    return count;
}

const std::vector<HoverSpan>& HoverIndex::bucket(size_t row) const
{
    if (row >= buckets_.size())
        return kEmptyBucket;
    return buckets_[row];
}

const std::vector<HoverSpan>& HoverIndex::bucket(const std::string& layer) const
{
    auto it = layers_.find(layer);
    if (it == layers_.end())
        return kEmptyBucket;
    return bucket(it->second);
}

}   // namespace tlviz
