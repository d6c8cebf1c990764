#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <tlviz/config.hpp>
#include <tlviz/logger.hpp>

namespace tlviz
{

namespace
{

[[noreturn]] void reject(const std::string& message)
{
    TLVIZ_LOG_ERROR("config", "{}", message);
    throw std::invalid_argument(message);
}

// Position just past "key": and any whitespace, or npos.
size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return pos;
    pos = json.find_first_not_of(" \t\r\n", pos + search.size());
    if (pos == std::string::npos || json[pos] != ':')
        reject("config: expected ':' after \"" + key + "\"");
    return json.find_first_not_of(" \t\r\n", pos + 1);
}

}   // anonymous namespace

void VisualizerConfig::validate() const
{
    if (!(step_size > 0.0))
        reject("config: step_size must be > 0");
    if (!(default_draw_range > 0.0))
        reject("config: default_draw_range must be > 0");
    if (!(label_width_fraction >= 0.0 && label_width_fraction < 1.0))
        reject("config: label_width_fraction must be in [0, 1)");
    if (!(default_zoom > 0.0))
        reject("config: default_zoom must be > 0");
    if (!(zoom_factor > 1.0))
        reject("config: zoom_factor must be > 1");
    if (!(pan_factor > 0.0))
        reject("config: pan_factor must be > 0");
    if (!(max_layer_height > 0.0))
        reject("config: max_layer_height must be > 0");
    if (!(object_height_fraction > 0.0 && object_height_fraction <= 1.0))
        reject("config: object_height_fraction must be in (0, 1]");
    if (history_window && !(*history_window >= 0.0))
        reject("config: history_window must be >= 0");
}

std::string VisualizerConfig::serialize() const
{
    std::ostringstream ss;
    ss << std::setprecision(15);
    ss << "{\"draw_playhead\":" << (draw_playhead ? "true" : "false")
       << ",\"step_size\":" << step_size << ",\"default_draw_range\":" << default_draw_range
       << ",\"label_width_fraction\":" << label_width_fraction
       << ",\"default_zoom\":" << default_zoom << ",\"zoom_factor\":" << zoom_factor
       << ",\"pan_factor\":" << pan_factor << ",\"max_layer_height\":" << max_layer_height
       << ",\"object_height_fraction\":" << object_height_fraction
       << ",\"playhead_speed\":" << playhead_speed << ",\"history_window\":";
    if (history_window)
        ss << *history_window;
    else
        ss << "null";
    ss << "}";
    return ss.str();
}

void VisualizerConfig::deserialize(const std::string& json)
{
    VisualizerConfig parsed = *this;

    auto extract_double = [&](const std::string& key, double& out)
    {
        auto pos = find_value(json, key);
        if (pos == std::string::npos)
            return;
        try
        {
            out = std::stod(json.substr(pos));
        }
        catch (const std::exception&)
        {
            reject("config: \"" + key + "\" is not a number");
        }
    };

    auto extract_bool = [&](const std::string& key, bool& out)
    {
        auto pos = find_value(json, key);
        if (pos == std::string::npos)
            return;
        if (json.compare(pos, 4, "true") == 0)
            out = true;
        else if (json.compare(pos, 5, "false") == 0)
            out = false;
        else
            reject("config: \"" + key + "\" is not a boolean");
    };

    extract_bool("draw_playhead", parsed.draw_playhead);
    extract_double("step_size", parsed.step_size);
    extract_double("default_draw_range", parsed.default_draw_range);
    extract_double("label_width_fraction", parsed.label_width_fraction);
    extract_double("default_zoom", parsed.default_zoom);
    extract_double("zoom_factor", parsed.zoom_factor);
    extract_double("pan_factor", parsed.pan_factor);
    extract_double("max_layer_height", parsed.max_layer_height);
    extract_double("object_height_fraction", parsed.object_height_fraction);
    extract_double("playhead_speed", parsed.playhead_speed);

    auto hw = find_value(json, "history_window");
    if (hw != std::string::npos)
    {
        if (json.compare(hw, 4, "null") == 0)
            parsed.history_window.reset();
        else
        {
            double window = 0.0;
            extract_double("history_window", window);
            parsed.history_window = window;
        }
    }

    parsed.validate();
    *this = parsed;
}

VisualizerConfig load_config(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        TLVIZ_LOG_ERROR("config", "Cannot open config file '{}'", path);
        throw std::runtime_error("config: cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    VisualizerConfig config;
    config.deserialize(buffer.str());
    TLVIZ_LOG_INFO("config", "Loaded config from '{}'", path);
    return config;
}

}   // namespace tlviz
