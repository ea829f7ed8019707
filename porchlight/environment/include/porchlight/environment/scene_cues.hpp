#pragma once

#include <porchlight/environment/time_of_day.hpp>

namespace porchlight::environment {

// Decorative toggles for the house scene, driven by the time-of-day period
struct SceneCues {
    bool window_glow = false;     // Warm light behind the windows
    bool pathway_lights = false;  // Lamps along the front path
    bool chimney_smoke = false;
    bool stars = false;
    bool clouds = true;           // Drifting daytime clouds

    bool operator==(const SceneCues& other) const = default;
};

SceneCues compute_scene_cues(TimePeriod period);

} // namespace porchlight::environment
