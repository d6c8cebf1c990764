#include <tlviz/logger.hpp>
#include <tlviz/surface.hpp>

namespace tlviz
{

void SurfaceRegistry::register_surface(const std::string& id, DrawSurface* surface)
{
    if (!surface)
    {
        unregister_surface(id);
        return;
    }
    surfaces_[id] = surface;
    TLVIZ_LOG_DEBUG("render", "Registered surface '{}'", id);
}

void SurfaceRegistry::unregister_surface(const std::string& id)
{
    surfaces_.erase(id);
}

DrawSurface* SurfaceRegistry::find(const std::string& id) const
{
    auto it = surfaces_.find(id);
    if (it == surfaces_.end())
        return nullptr;
    return it->second;
}

}   // namespace tlviz
