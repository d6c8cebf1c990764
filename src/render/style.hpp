#pragma once

#include <tlviz/color.hpp>

namespace tlviz::style
{

// Colours
constexpr Color BACKGROUND       = rgba8(0x33, 0x33, 0x33);
constexpr Color LABEL_BACKGROUND = rgba8(0x66, 0x66, 0x66);
constexpr Color PLAYHEAD         = rgba8(255, 0, 0, 0.5f);
constexpr Color ROW_LINE         = colors::black;
constexpr Color TEXT             = colors::white;
constexpr Color OBJECT_FILL      = rgba8(22, 102, 247, 0.75f);
constexpr Color OBJECT_BORDER    = rgba8(232, 240, 255, 0.85f);

// Thickness (px)
constexpr float PLAYHEAD_WIDTH      = 5.0f;
constexpr float ROW_LINE_THICKNESS  = 1.0f;
constexpr float OBJECT_BORDER_WIDTH = 1.0f;

// Font
constexpr float TEXT_SIZE = 16.0f;

}   // namespace tlviz::style
