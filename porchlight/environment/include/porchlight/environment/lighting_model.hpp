#pragma once

#include <porchlight/core/math.hpp>
#include <porchlight/environment/curve.hpp>
#include <porchlight/environment/color_gradient.hpp>

namespace porchlight::core {
    struct LightingSettings;
}

namespace porchlight::environment {

using namespace porchlight::core;

// Everything the renderer needs to configure the scene lights for one frame.
// Directions point from the scene towards the light.
struct LightingState {
    float ambient_intensity = 0.0f;
    Color ambient_color{1.0f};

    float sun_intensity = 0.0f;
    Color sun_color{1.0f};
    Vec3 sun_direction{0.0f, 1.0f, 0.0f};

    float moon_intensity = 0.0f;
    Color moon_color{1.0f};
    Vec3 moon_direction{0.0f, 1.0f, 0.0f};

    Color sky_color{0.0f};              // Background / clear colour

    float orientation_degrees = 0.0f;   // Sun/moon group rotation about +Y
};

bool operator==(const LightingState& a, const LightingState& b);

// Authored lighting data, built once and evaluated every frame
struct LightingModelConfig {
    // Intensity curves sampled uniformly over the day (index 0 = midnight)
    Curve sun_intensity;
    Curve moon_intensity;
    Curve ambient_intensity;

    // Colour ramps with breakpoints packed around sunrise and sunset
    ColorGradient sun_color;
    ColorGradient moon_color;
    ColorGradient sky_color;

    Color ambient_color{1.0f};

    // Light group base directions before the day rotation
    Vec3 sun_base_direction{0.0f, 0.70710678f, 0.70710678f};
    Vec3 moon_base_direction{0.0f, 0.70710678f, -0.70710678f};
};

// Pre-built curves and gradients for the house scene
namespace LightingPresets {
    // Bright from mid-morning to mid-afternoon, zero at night
    Curve default_sun_intensity();

    // Moonlight, zero through the day. Dawn and dusk leave both lights dim.
    Curve default_moon_intensity();

    // Sky fill light, never fully dark
    Curve default_ambient_intensity();

    // Deep orange at the horizon, warm morning/evening, white at midday
    ColorGradient default_sun_color();

    // Cool blue, slightly brighter around midnight
    ColorGradient default_moon_color();

    // Night navy, sunrise peach, daytime blue, sunset coral
    ColorGradient default_sky_color();

    // All of the above
    LightingModelConfig default_config();
}

// Replace preset curves/gradients with any overrides present in the settings
LightingModelConfig apply_lighting_settings(LightingModelConfig config, const core::LightingSettings& settings);

// Day/night lighting: maps a normalized time of day to a LightingState.
// compute() has no side effects; the same input gives bit-identical output.
class LightingModel {
public:
    LightingModel();
    explicit LightingModel(LightingModelConfig config);

    // time_of_day in [0, 1] (0 = midnight, 0.5 = noon). Out-of-range and NaN clamp.
    LightingState compute(float time_of_day) const;

    // t * 360 - 180
    static float orientation_for(float time_of_day);

    const LightingModelConfig& get_config() const { return m_config; }

private:
    LightingModelConfig m_config;
};

} // namespace porchlight::environment
