#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/filesystem.hpp>
#include <porchlight/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace porchlight::core {

using json = nlohmann::json;

ProjectSettings& ProjectSettings::get() {
    static ProjectSettings instance;
    return instance;
}

static std::vector<float> read_float_array(const json& j, const char* key) {
    std::vector<float> values;
    if (!j.contains(key)) return values;

    const auto& arr = j[key];
    if (!arr.is_array()) {
        log(LogLevel::Warn, "[Settings] lighting.{} is not an array, ignored", key);
        return values;
    }
    for (const auto& v : arr) {
        if (v.is_number()) {
            values.push_back(v.get<float>());
        } else {
            log(LogLevel::Warn, "[Settings] lighting.{} has a non-numeric entry, skipped", key);
        }
    }
    return values;
}

static std::vector<ColorStopSetting> read_stop_array(const json& j, const char* key) {
    std::vector<ColorStopSetting> stops;
    if (!j.contains(key)) return stops;

    const auto& arr = j[key];
    if (!arr.is_array()) {
        log(LogLevel::Warn, "[Settings] lighting.{} is not an array, ignored", key);
        return stops;
    }
    for (const auto& entry : arr) {
        if (entry.is_array() && entry.size() >= 2 && entry[0].is_number() && entry[1].is_string()) {
            stops.push_back(ColorStopSetting{entry[0].get<float>(), entry[1].get<std::string>()});
        } else {
            log(LogLevel::Warn, "[Settings] lighting.{} entries must be [position, \"#hex\"], skipped", key);
        }
    }
    return stops;
}

static uint32_t read_count(const json& j, const char* key, uint32_t fallback, uint32_t max_value) {
    if (!j.contains(key)) return fallback;

    const auto& v = j[key];
    if (!v.is_number_integer()) {
        log(LogLevel::Warn, "[Settings] decor.{} must be a whole number, using {}", key, fallback);
        return fallback;
    }

    int64_t count = v.get<int64_t>();
    if (count < 0 || count > static_cast<int64_t>(max_value)) {
        log(LogLevel::Warn, "[Settings] decor.{} = {} is outside [0, {}], using {}",
            key, count, max_value, fallback);
        return fallback;
    }
    return static_cast<uint32_t>(count);
}

static json write_stop_array(const std::vector<ColorStopSetting>& stops) {
    json arr = json::array();
    for (const auto& stop : stops) {
        arr.push_back({stop.position, stop.color});
    }
    return arr;
}

bool ProjectSettings::load(const std::string& path) {
    if (!FileSystem::exists(path)) {
        log(LogLevel::Warn, "[Settings] {} not found", path);
        return false;
    }
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "[Settings] {} is empty or unreadable", path);
        return false;
    }
    if (!load_from_string(content)) {
        log(LogLevel::Error, "[Settings] Failed to parse {}", path);
        return false;
    }
    log(LogLevel::Info, "[Settings] Loaded {}", path);
    return true;
}

bool ProjectSettings::load_from_string(const std::string& content) {
    try {
        json j = json::parse(content);

        project_name = j.value("project_name", project_name);

        if (j.contains("window")) {
            auto& w = j["window"];
            window.width = w.value("width", window.width);
            window.height = w.value("height", window.height);
            window.vsync = w.value("vsync", window.vsync);
            window.title = w.value("title", window.title);
        }

        if (j.contains("time")) {
            auto& t = j["time"];
            time.day_length_seconds = t.value("day_length_seconds", time.day_length_seconds);
            time.start_time = t.value("start_time", time.start_time);
            time.time_scale = t.value("time_scale", time.time_scale);
            time.use_local_clock = t.value("use_local_clock", time.use_local_clock);
        }

        if (j.contains("camera")) {
            auto& c = j["camera"];
            camera.damping_rate = c.value("damping_rate", camera.damping_rate);
            camera.max_delta_time = c.value("max_delta_time", camera.max_delta_time);
            camera.angular_speed = c.value("angular_speed", camera.angular_speed);
            camera.orbit_radius = c.value("orbit_radius", camera.orbit_radius);
            camera.bob_amplitude = c.value("bob_amplitude", camera.bob_amplitude);
            camera.bob_frequency = c.value("bob_frequency", camera.bob_frequency);
        }

        if (j.contains("lighting")) {
            auto& l = j["lighting"];
            lighting.sun_intensity = read_float_array(l, "sun_intensity");
            lighting.moon_intensity = read_float_array(l, "moon_intensity");
            lighting.ambient_intensity = read_float_array(l, "ambient_intensity");
            lighting.sun_color = read_stop_array(l, "sun_color");
            lighting.moon_color = read_stop_array(l, "moon_color");
            lighting.sky_color = read_stop_array(l, "sky_color");
            lighting.ambient_color = l.value("ambient_color", lighting.ambient_color);
        }

        if (j.contains("decor")) {
            auto& d = j["decor"];
            decor.seed = d.value("seed", decor.seed);
            decor.grass_count = read_count(d, "grass_count", decor.grass_count, DecorSettings::MAX_COUNT);
            decor.cobblestone_count = read_count(d, "cobblestone_count", decor.cobblestone_count,
                                                 DecorSettings::MAX_COUNT);
        }

        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] JSON error: {}", e.what());
        return false;
    }
}

bool ProjectSettings::save(const std::string& path) const {
    json j;

    j["project_name"] = project_name;

    j["window"] = {
        {"width", window.width},
        {"height", window.height},
        {"vsync", window.vsync},
        {"title", window.title}
    };

    j["time"] = {
        {"day_length_seconds", time.day_length_seconds},
        {"start_time", time.start_time},
        {"time_scale", time.time_scale},
        {"use_local_clock", time.use_local_clock}
    };

    j["camera"] = {
        {"damping_rate", camera.damping_rate},
        {"max_delta_time", camera.max_delta_time},
        {"angular_speed", camera.angular_speed},
        {"orbit_radius", camera.orbit_radius},
        {"bob_amplitude", camera.bob_amplitude},
        {"bob_frequency", camera.bob_frequency}
    };

    json l = json::object();
    if (!lighting.sun_intensity.empty()) l["sun_intensity"] = lighting.sun_intensity;
    if (!lighting.moon_intensity.empty()) l["moon_intensity"] = lighting.moon_intensity;
    if (!lighting.ambient_intensity.empty()) l["ambient_intensity"] = lighting.ambient_intensity;
    if (!lighting.sun_color.empty()) l["sun_color"] = write_stop_array(lighting.sun_color);
    if (!lighting.moon_color.empty()) l["moon_color"] = write_stop_array(lighting.moon_color);
    if (!lighting.sky_color.empty()) l["sky_color"] = write_stop_array(lighting.sky_color);
    if (!lighting.ambient_color.empty()) l["ambient_color"] = lighting.ambient_color;
    j["lighting"] = l;

    j["decor"] = {
        {"seed", decor.seed},
        {"grass_count", decor.grass_count},
        {"cobblestone_count", decor.cobblestone_count}
    };

    if (!FileSystem::write_text(path, j.dump(4))) {
        log(LogLevel::Error, "[Settings] Could not write {}", path);
        return false;
    }
    return true;
}

void ProjectSettings::reset() {
    *this = ProjectSettings{};
}

} // namespace porchlight::core
