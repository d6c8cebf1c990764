#pragma once

// Umbrella header: include this for the full public API.

#include <tlviz/color.hpp>
#include <tlviz/config.hpp>
#include <tlviz/geometry.hpp>
#include <tlviz/logger.hpp>
#include <tlviz/surface.hpp>
#include <tlviz/timeline.hpp>
#include <tlviz/visualizer.hpp>
