#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace porchlight::core {

struct WindowSettings {
    uint32_t width = 1280;
    uint32_t height = 720;
    bool vsync = true;
    std::string title = "Porchlight";
};

struct TimeSettings {
    float day_length_seconds = 120.0f;   // Real seconds per full day/night cycle
    float start_time = 0.6f;             // Normalized start (0 = midnight, 0.5 = noon)
    float time_scale = 1.0f;
    bool use_local_clock = false;        // Start from the machine's wall-clock hour
};

struct CameraSettings {
    float damping_rate = 1.2f;           // Per-second convergence rate
    float max_delta_time = 0.1f;         // Frame delta clamp (seconds)
    float angular_speed = 0.15f;         // Orbit phase speed (radians/second)
    float orbit_radius = 3.0f;
    float bob_amplitude = 0.25f;
    float bob_frequency = 0.37f;         // Vertical bob speed (radians/second)
};

// A gradient stop as written in the settings file: [position, "#rrggbb"]
struct ColorStopSetting {
    float position = 0.0f;
    std::string color;
};

// Optional overrides for the authored lighting presets. Empty = keep preset.
struct LightingSettings {
    std::vector<float> sun_intensity;
    std::vector<float> moon_intensity;
    std::vector<float> ambient_intensity;
    std::vector<ColorStopSetting> sun_color;
    std::vector<ColorStopSetting> moon_color;
    std::vector<ColorStopSetting> sky_color;
    std::string ambient_color;
};

struct DecorSettings {
    static constexpr uint32_t MAX_COUNT = 10000;   // Per decor kind

    uint32_t seed = 0;                   // 0 = choose a random seed at mount
    uint32_t grass_count = 240;
    uint32_t cobblestone_count = 36;
};

struct ProjectSettings {
    std::string project_name = "Porchlight";

    WindowSettings window;
    TimeSettings time;
    CameraSettings camera;
    LightingSettings lighting;
    DecorSettings decor;

    // Singleton access
    static ProjectSettings& get();

    // Load settings from JSON file. Missing keys keep their current values,
    // out-of-range decor counts keep theirs with a warning.
    bool load(const std::string& path);

    // Parse settings from a JSON document held in memory
    bool load_from_string(const std::string& content);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    // Reset to defaults
    void reset();
};

} // namespace porchlight::core
