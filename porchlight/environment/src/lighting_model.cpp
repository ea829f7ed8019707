#include <porchlight/environment/lighting_model.hpp>
#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/log.hpp>
#include <utility>

namespace porchlight::environment {

bool operator==(const LightingState& a, const LightingState& b) {
    return a.ambient_intensity == b.ambient_intensity &&
           a.ambient_color == b.ambient_color &&
           a.sun_intensity == b.sun_intensity &&
           a.sun_color == b.sun_color &&
           a.sun_direction == b.sun_direction &&
           a.moon_intensity == b.moon_intensity &&
           a.moon_color == b.moon_color &&
           a.moon_direction == b.moon_direction &&
           a.sky_color == b.sky_color &&
           a.orientation_degrees == b.orientation_degrees;
}

// Pre-built lighting presets. Curves carry 13 keys, one every two hours.
namespace LightingPresets {

Curve default_sun_intensity() {
    return Curve({
        0.0f,   // 00:00
        0.0f,   // 02:00
        0.0f,   // 04:00
        0.15f,  // 06:00 sunrise
        0.9f,   // 08:00
        1.3f,   // 10:00
        1.5f,   // 12:00 noon
        1.3f,   // 14:00
        0.9f,   // 16:00
        0.15f,  // 18:00 sunset
        0.0f,   // 20:00
        0.0f,   // 22:00
        0.0f    // 24:00
    });
}

Curve default_moon_intensity() {
    return Curve({
        0.6f,   // 00:00
        0.55f,  // 02:00
        0.35f,  // 04:00
        0.05f,  // 06:00
        0.0f,   // 08:00
        0.0f,   // 10:00
        0.0f,   // 12:00
        0.0f,   // 14:00
        0.0f,   // 16:00
        0.05f,  // 18:00
        0.35f,  // 20:00
        0.55f,  // 22:00
        0.6f    // 24:00
    });
}

Curve default_ambient_intensity() {
    return Curve({
        0.15f, 0.15f, 0.2f, 0.35f, 0.55f, 0.65f, 0.7f,
        0.65f, 0.55f, 0.35f, 0.2f, 0.15f, 0.15f
    });
}

ColorGradient default_sun_color() {
    return ColorGradient::from_hex({
        {0.21f, "#ff5e3a"},  // Sunrise at the horizon
        {0.25f, "#ff8c4a"},
        {0.29f, "#ffc78a"},
        {0.35f, "#fff1dc"},
        {0.50f, "#fffaf0"},  // Noon
        {0.65f, "#fff1dc"},
        {0.71f, "#ffc78a"},
        {0.75f, "#ff8c4a"},
        {0.79f, "#ff5e3a"}   // Sunset
    });
}

ColorGradient default_moon_color() {
    return ColorGradient::from_hex({
        {0.0f, "#c6d4ff"},
        {0.2f, "#9fb4ff"},
        {0.8f, "#9fb4ff"},
        {1.0f, "#c6d4ff"}
    });
}

ColorGradient default_sky_color() {
    return ColorGradient::from_hex({
        {0.0f, "#0b1026"},   // Midnight
        {0.2f, "#1c2452"},
        {0.24f, "#f4a36c"},  // Sunrise
        {0.3f, "#9cc7ff"},
        {0.5f, "#6fb7ff"},   // Noon
        {0.7f, "#9cc7ff"},
        {0.76f, "#f08a5d"},  // Sunset
        {0.8f, "#2b2d5c"},
        {1.0f, "#0b1026"}
    });
}

LightingModelConfig default_config() {
    LightingModelConfig config;
    config.sun_intensity = default_sun_intensity();
    config.moon_intensity = default_moon_intensity();
    config.ambient_intensity = default_ambient_intensity();
    config.sun_color = default_sun_color();
    config.moon_color = default_moon_color();
    config.sky_color = default_sky_color();
    config.ambient_color = Color{1.0f};
    return config;
}

} // namespace LightingPresets

static void build_gradient(const std::vector<ColorStopSetting>& settings, const char* name, ColorGradient& out) {
    if (settings.empty()) return;

    std::vector<ColorStop> stops;
    for (const auto& s : settings) {
        if (auto color = parse_hex_color(s.color)) {
            stops.emplace_back(s.position, *color);
        } else {
            core::log(core::LogLevel::Warn, "[Environment] Invalid colour '{}' in lighting.{}, skipped", s.color, name);
        }
    }
    if (stops.empty()) {
        core::log(core::LogLevel::Warn, "[Environment] lighting.{} has no usable stops, keeping preset", name);
        return;
    }
    out = ColorGradient(std::move(stops));
}

LightingModelConfig apply_lighting_settings(LightingModelConfig config, const core::LightingSettings& settings) {
    if (!settings.sun_intensity.empty()) config.sun_intensity = Curve(settings.sun_intensity);
    if (!settings.moon_intensity.empty()) config.moon_intensity = Curve(settings.moon_intensity);
    if (!settings.ambient_intensity.empty()) config.ambient_intensity = Curve(settings.ambient_intensity);

    build_gradient(settings.sun_color, "sun_color", config.sun_color);
    build_gradient(settings.moon_color, "moon_color", config.moon_color);
    build_gradient(settings.sky_color, "sky_color", config.sky_color);

    if (!settings.ambient_color.empty()) {
        if (auto color = parse_hex_color(settings.ambient_color)) {
            config.ambient_color = *color;
        } else {
            core::log(core::LogLevel::Warn, "[Environment] Invalid ambient_color '{}', keeping preset", settings.ambient_color);
        }
    }
    return config;
}

LightingModel::LightingModel() : m_config(LightingPresets::default_config()) {}

LightingModel::LightingModel(LightingModelConfig config) : m_config(std::move(config)) {}

float LightingModel::orientation_for(float time_of_day) {
    return time_of_day * 360.0f - 180.0f;
}

LightingState LightingModel::compute(float time_of_day) const {
    const float t = sanitize(time_of_day, 0.0f, 1.0f);

    LightingState state;
    state.orientation_degrees = orientation_for(t);

    // Brightness and colour are evaluated independently and only combined by the renderer
    state.sun_intensity = m_config.sun_intensity.evaluate(t);
    state.moon_intensity = m_config.moon_intensity.evaluate(t);
    state.ambient_intensity = m_config.ambient_intensity.evaluate(t);

    state.sun_color = m_config.sun_color.evaluate(t);
    state.moon_color = m_config.moon_color.evaluate(t);
    state.sky_color = m_config.sky_color.evaluate(t);
    state.ambient_color = m_config.ambient_color;

    state.sun_direction = glm::normalize(rotate_about_up(m_config.sun_base_direction, state.orientation_degrees));
    state.moon_direction = glm::normalize(rotate_about_up(m_config.moon_base_direction, state.orientation_degrees));

    return state;
}

} // namespace porchlight::environment
