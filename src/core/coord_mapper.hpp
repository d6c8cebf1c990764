#pragma once

#include <tlviz/geometry.hpp>

namespace tlviz
{

// Coordinate mapping between timeline time and horizontal pixels.
// All functions are pure over the given viewport snapshot.

// Returned by time_to_x() for times left of the visible window.
inline constexpr double OFFSCREEN_LEFT = -1.0;

// Returned by x_to_time()/x_ratio() when x is outside the time area.
inline constexpr double NOT_OVER_TIMELINE = -1.0;

// Pixel position of a time. Times past the window end clamp to the right
// edge of the time area.
double time_to_x(const ViewportSnapshot& vp, double time);

// Time under a pixel position, for x in [timeline_start, timeline_end).
double x_to_time(const ViewportSnapshot& vp, double x);

// Fraction [0, 1) of the time area left of x.
double x_ratio(const ViewportSnapshot& vp, double x);

// True if x lies within [timeline_start, timeline_end).
bool is_over_timeline(const ViewportSnapshot& vp, double x);

}   // namespace tlviz
