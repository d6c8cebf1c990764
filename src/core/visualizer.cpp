#include <algorithm>
#include <stdexcept>
#include <tlviz/logger.hpp>
#include <tlviz/visualizer.hpp>

#include "anim/playhead.hpp"
#include "core/draw_state.hpp"
#include "core/hover_index.hpp"
#include "core/layers.hpp"
#include "core/trim_merge.hpp"
#include "core/viewport_controller.hpp"
#include "render/render_driver.hpp"
#include "ui/input.hpp"

namespace tlviz
{

namespace
{

DrawSurface& lookup_surface(SurfaceRegistry& surfaces, const std::string& surface_id)
{
    DrawSurface* surface = surfaces.find(surface_id);
    if (!surface)
    {
        TLVIZ_LOG_ERROR("visualizer", "Surface '{}' not found", surface_id);
        throw std::runtime_error("Surface \"" + surface_id + "\" not found");
    }
    return *surface;
}

const VisualizerConfig& validated(const VisualizerConfig& config)
{
    config.validate();
    return config;
}

}   // anonymous namespace

// ─── Construction ───────────────────────────────────────────────────────────

TimelineVisualizer::TimelineVisualizer(SurfaceRegistry&        surfaces,
                                       const std::string&      surface_id,
                                       Resolver&               resolver,
                                       const VisualizerConfig& config)
    : surface_(&lookup_surface(surfaces, surface_id)), resolver_(resolver), config_(validated(config))
{
    viewport_    = std::make_unique<ViewportController>(config_);
    playhead_    = std::make_unique<PlayheadLoop>(config_.draw_playhead, config_.playhead_speed);
    hover_index_ = std::make_unique<HoverIndex>();
    input_       = std::make_unique<InputHandler>(*viewport_, config_);

    input_->set_on_viewport_changed([this]() { redraw(); });
    input_->set_on_pointer_move([this](double x, double y) { update_hover(x, y); });

    update_canvas_geometry();
    playhead_->compute_position(viewport_->snapshot());

    TLVIZ_LOG_INFO("visualizer", "Created on surface '{}' ({}x{}), playhead {}", surface_id,
                   surface_->width(), surface_->height(), config_.draw_playhead);
}

TimelineVisualizer::~TimelineVisualizer() = default;

void TimelineVisualizer::update_canvas_geometry()
{
    viewport_->set_canvas_width(surface_->width());
    geometry_ = compute_layer_geometry(geometry_.rows, surface_->height(), config_);
}

// ─── Schedules ──────────────────────────────────────────────────────────────

void TimelineVisualizer::set_timeline(const std::vector<TimelineObject>& objects,
                                      const ResolveOptions&              options)
{
    ResolvedTimeline resolved = resolver_.resolve(objects, options);

    schedules_.clear();
    push_schedule(std::move(resolved));
    rebuild_layers();

    viewport_->reset_window(options.time.value_or(viewport_->draw_time_start()));
    playhead_->set_time(viewport_->draw_time_start());

    TLVIZ_LOG_INFO("visualizer", "Timeline set: {} objects, {} instances, window [{}, {})",
                   schedules_.back().timeline.objects.size(), schedules_.back().timeline.instance_count(),
                   viewport_->draw_time_start(), viewport_->draw_time_end());
    redraw();
}

void TimelineVisualizer::update_timeline(const std::vector<TimelineObject>& objects,
                                         std::optional<ResolveOptions>      options)
{
    ResolveOptions opts = options.value_or(ResolveOptions{0.0, std::nullopt, std::nullopt});

    if (schedules_.empty())
    {
        set_timeline(objects, opts);
        return;
    }

    if (config_.draw_playhead)
        opts.time = playhead_->time();

    ResolvedTimeline resolved = resolver_.resolve(objects, opts);

    if (config_.draw_playhead)
    {
        double seam = playhead_->time();

        ResolvedTimeline present = trim_timeline(resolved, TrimRange{seam, std::nullopt});
        ResolvedTimeline past    = trim_timeline(schedules_.back().timeline, TrimRange{std::nullopt, seam});

        MergeResult merged = merge_timelines(std::move(past), std::move(present));
        if (!merged.mismatched_ids.empty())
        {
            TLVIZ_LOG_DEBUG("visualizer", "{} objects not stitched at t={}", merged.mismatched_ids.size(),
                            seam);
        }

        schedules_.back().timeline = std::move(merged.past);
        push_schedule(std::move(merged.present));
        discard_expired_history();

        TLVIZ_LOG_DEBUG("visualizer", "Stitched update at t={}, {} schedules retained", seam,
                        schedules_.size());
    }
    else
    {
        schedules_.back() = RetainedSchedule{next_generation_++, std::move(resolved)};
        TLVIZ_LOG_DEBUG("visualizer", "Replaced schedule, generation {}", schedules_.back().generation);
    }

    rebuild_layers();
    redraw();
}

void TimelineVisualizer::push_schedule(ResolvedTimeline timeline)
{
    schedules_.push_back(RetainedSchedule{next_generation_++, std::move(timeline)});
}

void TimelineVisualizer::discard_expired_history()
{
    if (schedules_.size() < 2)
        return;

    // The newest schedule is never trimmed or discarded.
    auto past_end = schedules_.end() - 1;

    double horizon = 0.0;
    if (config_.history_window)
    {
        horizon = playhead_->time() - *config_.history_window;
        if (horizon > 0.0)
        {
            for (auto it = schedules_.begin(); it != past_end; ++it)
                it->timeline = trim_timeline(it->timeline, TrimRange{horizon, std::nullopt});
        }
    }

    auto removed = std::remove_if(schedules_.begin(), past_end,
                                  [](const RetainedSchedule& s) { return s.timeline.objects.empty(); });
    if (removed != past_end)
    {
        TLVIZ_LOG_DEBUG("visualizer", "Discarded {} empty schedules (horizon t={})", past_end - removed,
                        horizon);
        schedules_.erase(removed, past_end);
    }
}

void TimelineVisualizer::rebuild_layers()
{
    std::vector<const ResolvedTimeline*> timelines;
    timelines.reserve(schedules_.size());
    for (const auto& schedule : schedules_)
        timelines.push_back(&schedule.timeline);

    LayerMap rows = collect_layers(timelines);
    if (rows == geometry_.rows)
        return;

    geometry_ = compute_layer_geometry(std::move(rows), surface_->height(), config_);
    TLVIZ_LOG_DEBUG("visualizer", "Layers changed: {} rows of {} px", geometry_.rows.size(),
                    geometry_.row_height);
}

const RetainedSchedule* TimelineVisualizer::find_schedule(uint64_t generation) const
{
    for (const auto& schedule : schedules_)
    {
        if (schedule.generation == generation)
            return &schedule;
    }
    return nullptr;
}

// ─── Viewport ───────────────────────────────────────────────────────────────

void TimelineVisualizer::set_viewport(const ViewportRequest& request)
{
    if (!config_.draw_playhead)
    {
        const char* field = nullptr;
        if (request.play_speed)
            field = "play_speed";
        else if (request.play_playhead)
            field = "play_playhead";
        else if (request.playhead_time)
            field = "playhead_time";

        if (field)
        {
            TLVIZ_LOG_ERROR("viewport", "set_viewport: {} requires draw_playhead", field);
            throw std::invalid_argument(std::string("set_viewport: ") + field
                                        + " was set, but draw_playhead is disabled");
        }
    }

    if (request.zoom && !(*request.zoom > 0.0))
    {
        TLVIZ_LOG_ERROR("viewport", "set_viewport: zoom must be > 0");
        throw std::invalid_argument("set_viewport: zoom must be > 0");
    }

    bool changed = false;

    if (request.zoom)
    {
        viewport_->set_zoom(*request.zoom);
        changed = true;
    }

    if (request.timestamp)
    {
        viewport_->jump_to(*request.timestamp);
        changed = true;
    }

    if (request.play_viewport)
    {
        playhead_->set_viewport_playing(*request.play_viewport);
        changed = true;
    }

    if (request.play_speed)
    {
        playhead_->set_speed(*request.play_speed);
        changed = true;
    }

    if (request.play_playhead)
    {
        playhead_->set_playing(*request.play_playhead);
        changed = true;
    }

    if (request.playhead_time)
    {
        playhead_->set_time(*request.playhead_time);
        changed = true;
    }

    if (changed)
    {
        TLVIZ_LOG_DEBUG("viewport", "Viewport [{}, {}) zoom {}", viewport_->draw_time_start(),
                        viewport_->draw_time_end(), viewport_->zoom());
        redraw();
    }
}

double TimelineVisualizer::draw_time_start() const
{
    return viewport_->draw_time_start();
}

double TimelineVisualizer::draw_time_end() const
{
    return viewport_->draw_time_end();
}

double TimelineVisualizer::zoom() const
{
    return viewport_->zoom();
}

ViewportSnapshot TimelineVisualizer::viewport() const
{
    return viewport_->snapshot();
}

void TimelineVisualizer::resize()
{
    update_canvas_geometry();
    TLVIZ_LOG_DEBUG("visualizer", "Resized to {}x{}", surface_->width(), surface_->height());
    redraw();
}

// ─── Playhead ───────────────────────────────────────────────────────────────

double TimelineVisualizer::playhead_time() const
{
    return playhead_->time();
}

double TimelineVisualizer::playhead_position() const
{
    return playhead_->position();
}

bool TimelineVisualizer::playhead_playing() const
{
    return playhead_->playing();
}

bool TimelineVisualizer::viewport_playing() const
{
    return playhead_->viewport_playing();
}

double TimelineVisualizer::play_speed() const
{
    return playhead_->speed();
}

void TimelineVisualizer::update_draw()
{
    update_draw_at(Clock::now());
}

void TimelineVisualizer::update_draw_at(Clock::time_point now)
{
    switch (playhead_->tick(now, *viewport_))
    {
        case TickResult::ViewportMoved:
            redraw();
            break;
        case TickResult::PlayheadMoved:
            ++playhead_redraw_count_;
            break;
        case TickResult::Idle:
            break;
    }
}

// ─── Input ──────────────────────────────────────────────────────────────────

bool TimelineVisualizer::on_mouse_button(int button, int action, int mods, double x, double y)
{
    return input_->on_mouse_button(button, action, mods, x, y);
}

bool TimelineVisualizer::on_mouse_move(double x, double y)
{
    return input_->on_mouse_move(x, y);
}

bool TimelineVisualizer::on_scroll(double delta_x, double delta_y, double cursor_x, double cursor_y)
{
    return input_->on_scroll(delta_x, delta_y, cursor_x, cursor_y);
}

bool TimelineVisualizer::on_key(int key, int action, int mods)
{
    return input_->on_key(key, action, mods);
}

bool TimelineVisualizer::on_mouse_leave()
{
    last_pointer_.reset();
    set_hover(std::nullopt, 0.0, 0.0);
    return false;
}

void TimelineVisualizer::update_hover(double x, double y)
{
    last_pointer_ = PointerPosition{x, y};
    set_hover(hover_index_->hit_test(x, y, geometry_.row_height), x, y);
}

void TimelineVisualizer::set_hover(std::optional<DrawStateKey> key, double x, double y)
{
    if (key == hovered_key_)
        return;

    std::optional<HoveredObject> hovered;
    if (key)
    {
        const RetainedSchedule* schedule = find_schedule(key->generation);
        if (schedule)
        {
            auto obj = schedule->timeline.objects.find(key->object_id);
            if (obj != schedule->timeline.objects.end())
            {
                const auto& instances = obj->second.resolved.instances;
                auto        inst      = std::find_if(instances.begin(), instances.end(),
                                                     [&](const Instance& i) { return i.id == key->instance_id; });
                if (inst != instances.end())
                    hovered = HoveredObject{obj->second, *inst, PointerPosition{x, y}};
            }
        }

        if (!hovered)
        {
            TLVIZ_LOG_WARN("hover", "Stale hover key {}", key->to_string());
            key.reset();
            if (!hovered_key_)
                return;
        }
    }

    hovered_key_ = std::move(key);
    hovered_     = std::move(hovered);

    if (hovered_key_)
        TLVIZ_LOG_TRACE("hover", "Hover {}", hovered_key_->to_string());
    else
        TLVIZ_LOG_TRACE("hover", "Hover cleared");

    if (on_hover_)
        on_hover_(hovered_);
}

// ─── Drawing ────────────────────────────────────────────────────────────────

void TimelineVisualizer::redraw()
{
    ViewportSnapshot vp = viewport_->snapshot();

    draw_state_.clear();
    for (const auto& schedule : schedules_)
        derive_draw_state_into(draw_state_, schedule.timeline, schedule.generation, vp, geometry_);

    hover_index_->rebuild(draw_state_, geometry_.rows);
    playhead_->compute_position(vp);
    ++redraw_count_;

    // Content may have moved under a stationary pointer.
    if (last_pointer_)
        set_hover(hover_index_->hit_test(last_pointer_->x, last_pointer_->y, geometry_.row_height),
                  last_pointer_->x, last_pointer_->y);
}

void TimelineVisualizer::render()
{
    ViewportSnapshot vp = viewport_->snapshot();

    RenderFrame frame;
    frame.viewport      = &vp;
    frame.layers        = &geometry_;
    frame.draw_state    = &draw_state_;
    frame.canvas_height = surface_->height();
    frame.draw_playhead = config_.draw_playhead;
    frame.playhead_x    = playhead_->position();

    RenderDriver driver(*surface_);
    driver.paint(frame);
}

const HoverIndex& TimelineVisualizer::hover_index() const
{
    return *hover_index_;
}

}   // namespace tlviz
