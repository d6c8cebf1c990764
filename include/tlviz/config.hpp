#pragma once

#include <optional>
#include <string>

namespace tlviz
{

// Construction-time options for TimelineVisualizer.
struct VisualizerConfig
{
    // Track playhead time; enables auto-play and the playback-speed fields
    // of ViewportRequest. Also switches update_timeline() to incremental
    // stitching at the playhead.
    bool draw_playhead = false;

    // Time step. The default visible range and the wheel pan distance are
    // both expressed in multiples of it.
    double step_size = 1.0;

    // Visible time range at zoom 100, in steps.
    double default_draw_range = 500.0;

    // Share of the canvas width taken by the layer label column, [0, 1).
    double label_width_fraction = 0.25;

    double default_zoom = 100.0;

    // Multiplicative zoom change per wheel delta unit (> 1).
    double zoom_factor = 1.001;

    // Wheel pan distance multiplier (pan = delta * pan_factor * step_size).
    double pan_factor = 1.0;

    // Upper bound for a layer row height, in pixels.
    double max_layer_height = 60.0;

    // Instance rectangle height as a fraction of the row height, (0, 1].
    double object_height_fraction = 0.8;

    // Playhead/auto-play speed, time units per second.
    double playhead_speed = 1.0;

    // When set, retained past schedules are trimmed to start no earlier
    // than playhead - history_window after each incremental update.
    std::optional<double> history_window;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;

    std::string serialize() const;

    // Parses the output of serialize(); keys that are absent keep their
    // current value. Throws std::invalid_argument on malformed values or
    // when the result fails validate().
    void deserialize(const std::string& json);
};

// Reads and deserializes a config file. Throws std::runtime_error if the
// file cannot be read.
VisualizerConfig load_config(const std::string& path);

}   // namespace tlviz
