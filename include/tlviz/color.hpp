#pragma once

#include <cstdint>

namespace tlviz
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color&) const = default;

    // Packed 0xAABBGGRR, the layout ImGui's IM_COL32 produces.
    constexpr uint32_t to_abgr32() const
    {
        auto channel = [](float v) -> uint32_t
        {
            if (v <= 0.0f)
                return 0u;
            if (v >= 1.0f)
                return 255u;
            return static_cast<uint32_t>(v * 255.0f + 0.5f);
        };
        return (channel(a) << 24) | (channel(b) << 16) | (channel(g) << 8) | channel(r);
    }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

// 8-bit channel helper for colours specified the way CSS writes them.
inline constexpr Color rgba8(int r, int g, int b, float a = 1.0f)
{
    return Color{r / 255.0f, g / 255.0f, b / 255.0f, a};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
}   // namespace colors

}   // namespace tlviz
