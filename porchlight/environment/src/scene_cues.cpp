#include <porchlight/environment/scene_cues.hpp>

namespace porchlight::environment {

SceneCues compute_scene_cues(TimePeriod period) {
    SceneCues cues;
    const bool night = period == TimePeriod::Night;
    const bool after_dark = night || period == TimePeriod::Evening;

    cues.window_glow = night;
    cues.pathway_lights = after_dark;
    cues.chimney_smoke = after_dark;
    cues.stars = night;
    cues.clouds = !night;
    return cues;
}

} // namespace porchlight::environment
