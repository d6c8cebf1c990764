#pragma once

#include <map>
#include <string>
#include <string_view>
#include <tlviz/color.hpp>

namespace tlviz
{

enum class TextAlign
{
    Left,
    Center,
};

// Immediate-mode 2D drawing target. Coordinates are pixels with the origin
// at the surface's top-left corner.
class DrawSurface
{
   public:
    virtual ~DrawSurface() = default;

    virtual float width() const  = 0;
    virtual float height() const = 0;

    virtual void fill_rect(float x, float y, float w, float h, const Color& color) = 0;
    virtual void stroke_rect(float x, float y, float w, float h, const Color& color, float thickness) = 0;
    virtual void draw_text(float x, float y, std::string_view text, const Color& color, float size,
                           TextAlign align) = 0;

    // Restrict subsequent drawing to a rectangle until pop_clip().
    virtual void push_clip(float x, float y, float w, float h) = 0;
    virtual void pop_clip() = 0;
};

// Names the drawing surfaces a host makes available. Surfaces are not owned
// and must outlive every visualizer constructed against them.
class SurfaceRegistry
{
   public:
    SurfaceRegistry() = default;

    SurfaceRegistry(const SurfaceRegistry&)            = delete;
    SurfaceRegistry& operator=(const SurfaceRegistry&) = delete;

    // Replaces any surface previously registered under the same id; a null
    // surface removes it.
    void register_surface(const std::string& id, DrawSurface* surface);
    void unregister_surface(const std::string& id);

    // nullptr if no surface carries this id.
    DrawSurface* find(const std::string& id) const;

    size_t size() const { return surfaces_.size(); }

   private:
    std::map<std::string, DrawSurface*> surfaces_;
};

}   // namespace tlviz
