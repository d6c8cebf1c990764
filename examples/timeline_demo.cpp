// Opens a viewer on a small generated show: a few layers of repeating clips,
// re-resolved every ten seconds at the playhead.
//
// Usage: timeline_demo [visualizer-config.json]

#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <tlviz/tlviz.hpp>
#include <variant>

#include "app/viewer_app.hpp"

using namespace tlviz;

namespace
{

// Understands literal numbers only: start, end or duration, and repeating.
class ToyResolver : public Resolver
{
   public:
    ResolvedTimeline resolve(const std::vector<TimelineObject>& objects,
                             const ResolveOptions&              options) override
    {
        double horizon = options.limit_time.value_or(600.0);
        int    limit   = options.limit_count.value_or(50);

        ResolvedTimeline tl;
        tl.options = options;
        for (const auto& obj : objects)
        {
            ResolvedTimelineObject resolved;
            resolved.object = obj;

            for (const auto& enable : obj.enable)
            {
                double                start = number(enable.start, obj.id);
                std::optional<double> end;
                if (enable.end)
                    end = number(enable.end, obj.id);
                else if (enable.duration)
                    end = start + number(enable.duration, obj.id);

                double period = enable.repeating ? number(enable.repeating, obj.id) : 0.0;
                for (int n = 0; n < limit; ++n)
                {
                    double offset = period * n;
                    if (start + offset > horizon)
                        break;
                    Instance inst;
                    inst.id    = obj.id + "_" + std::to_string(n);
                    inst.start = start + offset;
                    if (end)
                        inst.end = *end + offset;
                    resolved.resolved.instances.push_back(inst);
                    if (period <= 0.0)
                        break;
                }
            }

            resolved.resolved.resolved = !obj.disabled;
            tl.layers[obj.layer].push_back(obj.id);
            tl.statistics.resolved_instance_count +=
                static_cast<uint32_t>(resolved.resolved.instances.size());
            ++tl.statistics.resolved_object_count;
            tl.objects.emplace(obj.id, std::move(resolved));
        }
        return tl;
    }

   private:
    static double number(const std::optional<EnableValue>& value, const std::string& id)
    {
        if (!value)
            return 0.0;
        if (const double* d = std::get_if<double>(&*value))
            return *d;
        throw std::runtime_error("ToyResolver: object '" + id
                                 + "' uses an expression; only numbers are supported");
    }
};

TimelineObject clip(std::string id, std::string layer, double start, double duration, double repeat)
{
    TimelineObject obj;
    obj.id    = std::move(id);
    obj.layer = std::move(layer);

    TimelineEnable enable;
    enable.start     = start;
    enable.duration  = duration;
    enable.repeating = repeat;
    obj.enable.push_back(enable);
    return obj;
}

std::vector<TimelineObject> make_show(int revision)
{
    double stretch = 1.0 + 0.25 * (revision % 3);
    return {
        clip("camera1", "video", 0.0, 8.0 * stretch, 20.0),
        clip("camera2", "video", 10.0, 6.0, 20.0),
        clip("lower_third", "graphics", 2.0, 4.0 * stretch, 15.0),
        clip("music", "audio", 0.0, 45.0, 60.0),
        clip("jingle", "audio", 50.0, 5.0, 60.0),
    };
}

}   // anonymous namespace

int main(int argc, char** argv)
{
    ToyResolver resolver;

    ViewerConfig cfg;
    cfg.title     = "tlviz demo";
    cfg.log_level = LogLevel::Debug;
    if (argc > 1)
        cfg.config_path = argv[1];
    cfg.visualizer.draw_playhead      = true;
    cfg.visualizer.default_draw_range = 120.0;
    cfg.visualizer.history_window     = 60.0;

    try
    {
        ViewerApp app(resolver, cfg);
        app.init();

        auto& viz = app.visualizer();
        viz.set_timeline(make_show(0), ResolveOptions{0.0, std::nullopt, std::nullopt});

        ViewportRequest play;
        if (viz.playhead_enabled())
            play.play_playhead = true;
        play.zoom = 50.0;
        viz.set_viewport(play);

        int revision = 0;
        app.set_on_frame(
            [&](TimelineVisualizer& v, double elapsed)
            {
                int due = static_cast<int>(std::floor(elapsed / 10.0));
                if (due <= revision)
                    return;
                revision = due;
                TLVIZ_LOG_INFO("demo", "Revision {} at t={}", revision, v.playhead_time());
                v.update_timeline(make_show(revision));
            });

        return app.run();
    }
    catch (const std::exception& e)
    {
        TLVIZ_LOG_CRITICAL("demo", "{}", e.what());
        return 1;
    }
}
