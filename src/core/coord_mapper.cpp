#include "coord_mapper.hpp"

namespace tlviz
{

double time_to_x(const ViewportSnapshot& vp, double time)
{
    if (time < vp.draw_time_start)
        return OFFSCREEN_LEFT;

    if (time > vp.draw_time_end)
        return vp.timeline_end();

    double range = vp.draw_time_end - vp.draw_time_start;
    return vp.timeline_start + (time - vp.draw_time_start) / range * vp.timeline_width;
}

bool is_over_timeline(const ViewportSnapshot& vp, double x)
{
    return x >= vp.timeline_start && x < vp.timeline_end();
}

double x_ratio(const ViewportSnapshot& vp, double x)
{
    if (!is_over_timeline(vp, x))
        return NOT_OVER_TIMELINE;

    return (x - vp.timeline_start) / vp.timeline_width;
}

double x_to_time(const ViewportSnapshot& vp, double x)
{
    double ratio = x_ratio(vp, x);
    if (ratio == NOT_OVER_TIMELINE)
        return NOT_OVER_TIMELINE;

    return vp.draw_time_start + (vp.draw_time_end - vp.draw_time_start) * ratio;
}

}   // namespace tlviz
