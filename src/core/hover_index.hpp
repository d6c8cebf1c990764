#pragma once

#include <optional>
#include <string>
#include <tlviz/geometry.hpp>
#include <vector>

namespace tlviz
{

// Horizontal extent of one visible rectangle, inclusive at both ends.
struct HoverSpan
{
    double       start_x = 0.0;
    double       end_x   = 0.0;
    DrawStateKey key;
};

// Per-row spans of the visible rectangles, rebuilt on every redraw.
class HoverIndex
{
   public:
    HoverIndex() = default;

    void rebuild(const TimelineDrawState& draw_state, const LayerMap& layers);
    void clear();

    // First span on the row under y that contains x.
    std::optional<DrawStateKey> hit_test(double x, double y, double row_height) const;

    size_t row_count() const { return buckets_.size(); }
    size_t span_count() const;

    // Spans of a row, ordered by start_x. Empty for unknown rows.
    const std::vector<HoverSpan>& bucket(size_t row) const;
    const std::vector<HoverSpan>& bucket(const std::string& layer) const;

   private:
    std::vector<std::vector<HoverSpan>> buckets_;
    LayerMap                            layers_;
};

}   // namespace tlviz
