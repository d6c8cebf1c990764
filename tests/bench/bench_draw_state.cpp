#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include "core/draw_state.hpp"
#include "core/hover_index.hpp"
#include "core/layers.hpp"
#include "core/trim_merge.hpp"

using namespace tlviz;

// --- Helpers ---

static ResolvedTimeline make_schedule(int objects, int instances_per_object, int layers)
{
    ResolvedTimeline tl;
    for (int o = 0; o < objects; ++o)
    {
        ResolvedTimelineObject obj;
        obj.object.id         = "obj" + std::to_string(o);
        obj.object.layer      = "layer" + std::to_string(o % layers);
        obj.resolved.resolved = true;
        for (int i = 0; i < instances_per_object; ++i)
        {
            double start = o * 0.5 + i * 10.0;
            obj.resolved.instances.push_back(
                Instance{obj.object.id + "_" + std::to_string(i), start, start + 6.0});
        }
        tl.layers[obj.object.layer].push_back(obj.object.id);
        tl.objects.emplace(obj.object.id, std::move(obj));
    }
    return tl;
}

static ViewportSnapshot make_viewport()
{
    ViewportSnapshot vp;
    vp.draw_time_start = 100.0;
    vp.draw_time_end   = 600.0;
    vp.canvas_width    = 1920.0;
    vp.timeline_start  = 480.0;
    vp.timeline_width  = 1440.0;
    return vp;
}

static LayerGeometry make_geometry(const ResolvedTimeline& tl)
{
    return compute_layer_geometry(collect_layers({&tl}), 1080.0, VisualizerConfig{});
}

// --- Draw state ---

static void BM_DeriveDrawState(benchmark::State& state)
{
    const int        objects  = static_cast<int>(state.range(0));
    ResolvedTimeline tl       = make_schedule(objects, 20, 16);
    LayerGeometry    geometry = make_geometry(tl);
    ViewportSnapshot vp       = make_viewport();

    for (auto _ : state)
    {
        auto ds = derive_draw_state(tl, 0, vp, geometry);
        benchmark::DoNotOptimize(ds);
    }
    state.SetItemsProcessed(state.iterations() * objects * 20);
}
BENCHMARK(BM_DeriveDrawState)->Arg(100)->Arg(1000)->Arg(5000);

// --- Hover ---

static void BM_HoverRebuild(benchmark::State& state)
{
    ResolvedTimeline  tl       = make_schedule(static_cast<int>(state.range(0)), 20, 16);
    LayerGeometry     geometry = make_geometry(tl);
    TimelineDrawState ds       = derive_draw_state(tl, 0, make_viewport(), geometry);
    HoverIndex        index;

    for (auto _ : state)
    {
        index.rebuild(ds, geometry.rows);
        benchmark::DoNotOptimize(index.span_count());
    }
}
BENCHMARK(BM_HoverRebuild)->Arg(100)->Arg(1000);

static void BM_HoverHitTest(benchmark::State& state)
{
    ResolvedTimeline  tl       = make_schedule(1000, 20, 16);
    LayerGeometry     geometry = make_geometry(tl);
    TimelineDrawState ds       = derive_draw_state(tl, 0, make_viewport(), geometry);
    HoverIndex        index;
    index.rebuild(ds, geometry.rows);

    double x = 480.0;
    for (auto _ : state)
    {
        auto hit = index.hit_test(x, geometry.row_height * 3.5, geometry.row_height);
        benchmark::DoNotOptimize(hit);
        x = x >= 1919.0 ? 480.0 : x + 7.0;
    }
}
BENCHMARK(BM_HoverHitTest);

// --- Trim / merge ---

static void BM_TrimAndMerge(benchmark::State& state)
{
    ResolvedTimeline previous = make_schedule(static_cast<int>(state.range(0)), 20, 16);
    ResolvedTimeline current  = previous;
    const double     seam     = 95.0;

    for (auto _ : state)
    {
        auto present = trim_timeline(current, TrimRange{seam, std::nullopt});
        auto past    = trim_timeline(previous, TrimRange{std::nullopt, seam});
        auto merged  = merge_timelines(std::move(past), std::move(present));
        benchmark::DoNotOptimize(merged);
    }
}
BENCHMARK(BM_TrimAndMerge)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
