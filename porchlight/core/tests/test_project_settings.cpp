#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/filesystem.hpp>
#include <porchlight/core/log.hpp>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

using namespace porchlight::core;
using Catch::Matchers::WithinAbs;

static std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

namespace {

class WarningSink : public ILogSink {
public:
    void log(LogLevel level, const std::string& /*category*/, const std::string& message) override {
        if (level == LogLevel::Warn) {
            warnings.push_back(message);
        }
    }

    bool saw(const std::string& fragment) const {
        for (const auto& w : warnings) {
            if (w.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> warnings;
};

} // namespace

TEST_CASE("ProjectSettings defaults", "[core][settings]") {
    ProjectSettings settings;

    REQUIRE(settings.project_name == "Porchlight");
    REQUIRE(settings.window.width == 1280);
    REQUIRE(settings.window.height == 720);
    REQUIRE_THAT(settings.time.day_length_seconds, WithinAbs(120.0f, 0.001f));
    REQUIRE_THAT(settings.time.start_time, WithinAbs(0.6f, 0.001f));
    REQUIRE_THAT(settings.camera.damping_rate, WithinAbs(1.2f, 0.001f));
    REQUIRE_THAT(settings.camera.max_delta_time, WithinAbs(0.1f, 0.001f));
    REQUIRE(settings.lighting.sun_intensity.empty());
    REQUIRE(settings.decor.seed == 0);
}

TEST_CASE("ProjectSettings parses JSON", "[core][settings]") {
    ProjectSettings settings;

    SECTION("Partial document keeps other defaults") {
        REQUIRE(settings.load_from_string(R"({"camera": {"damping_rate": 2.5}})"));
        REQUIRE_THAT(settings.camera.damping_rate, WithinAbs(2.5f, 0.001f));
        REQUIRE_THAT(settings.camera.orbit_radius, WithinAbs(3.0f, 0.001f));
        REQUIRE(settings.window.width == 1280);
    }

    SECTION("Lighting overrides") {
        const char* doc = R"({
            "lighting": {
                "sun_intensity": [0.0, 1.0, 0.0],
                "sun_color": [[0.0, "#ff0000"], [1.0, "#0000ff"]],
                "ambient_color": "#202030"
            }
        })";
        REQUIRE(settings.load_from_string(doc));
        REQUIRE(settings.lighting.sun_intensity.size() == 3);
        REQUIRE(settings.lighting.sun_color.size() == 2);
        REQUIRE(settings.lighting.sun_color[1].color == "#0000ff");
        REQUIRE(settings.lighting.ambient_color == "#202030");
        REQUIRE(settings.lighting.moon_intensity.empty());
    }

    SECTION("Malformed lighting entries are skipped") {
        const char* doc = R"({
            "lighting": {
                "moon_intensity": [0.5, "bright", 0.1],
                "moon_color": [[0.0, "#ffffff"], ["oops"]]
            }
        })";
        REQUIRE(settings.load_from_string(doc));
        REQUIRE(settings.lighting.moon_intensity.size() == 2);
        REQUIRE(settings.lighting.moon_color.size() == 1);
    }

    SECTION("Invalid JSON fails and keeps values") {
        settings.decor.seed = 77;
        REQUIRE_FALSE(settings.load_from_string("{ not json"));
        REQUIRE(settings.decor.seed == 77);
    }

    SECTION("Decor counts within range are read") {
        REQUIRE(settings.load_from_string(R"({"decor": {"grass_count": 12, "cobblestone_count": 0}})"));
        REQUIRE(settings.decor.grass_count == 12);
        REQUIRE(settings.decor.cobblestone_count == 0);
    }

    SECTION("Out-of-range decor counts keep their values") {
        const char* doc = R"({
            "decor": {"seed": 9, "grass_count": -1, "cobblestone_count": 50000}
        })";
        REQUIRE(settings.load_from_string(doc));
        REQUIRE(settings.decor.grass_count == 240);
        REQUIRE(settings.decor.cobblestone_count == 36);
        REQUIRE(settings.decor.seed == 9);
    }

    SECTION("Non-integer decor counts keep their values") {
        REQUIRE(settings.load_from_string(R"({"decor": {"grass_count": 12.5, "cobblestone_count": "many"}})"));
        REQUIRE(settings.decor.grass_count == 240);
        REQUIRE(settings.decor.cobblestone_count == 36);
    }

    SECTION("Type mismatch fails") {
        REQUIRE_FALSE(settings.load_from_string(R"({"window": {"width": "wide"}})"));
    }
}

TEST_CASE("ProjectSettings save and load round trip", "[core][settings]") {
    std::string path = temp_path("porchlight_settings_test.json");

    ProjectSettings out;
    out.project_name = "Round Trip";
    out.time.start_time = 0.25f;
    out.camera.angular_speed = 0.4f;
    out.decor.seed = 1234;
    out.lighting.sky_color = {{0.0f, "#000000"}, {1.0f, "#ffffff"}};
    REQUIRE(out.save(path));

    ProjectSettings in;
    REQUIRE(in.load(path));
    REQUIRE(in.project_name == "Round Trip");
    REQUIRE_THAT(in.time.start_time, WithinAbs(0.25f, 0.0001f));
    REQUIRE_THAT(in.camera.angular_speed, WithinAbs(0.4f, 0.0001f));
    REQUIRE(in.decor.seed == 1234);
    REQUIRE(in.lighting.sky_color.size() == 2);
    REQUIRE(in.lighting.sky_color[1].color == "#ffffff");

    std::remove(path.c_str());
}

TEST_CASE("ProjectSettings missing and empty files", "[core][settings]") {
    WarningSink sink;
    add_log_sink(&sink);
    set_log_level(LogLevel::Info);
    ProjectSettings settings;

    SECTION("Missing file") {
        std::string path = temp_path("porchlight_does_not_exist.json");
        REQUIRE_FALSE(FileSystem::exists(path));
        REQUIRE_FALSE(settings.load(path));
        REQUIRE(sink.saw("not found"));
        REQUIRE(settings.project_name == "Porchlight");
    }

    SECTION("Empty file") {
        std::string path = temp_path("porchlight_empty_settings.json");
        REQUIRE(FileSystem::write_text(path, ""));
        REQUIRE(FileSystem::exists(path));
        REQUIRE_FALSE(settings.load(path));
        REQUIRE(sink.saw("is empty"));
        REQUIRE_FALSE(sink.saw("not found"));
        std::remove(path.c_str());
    }

    remove_log_sink(&sink);
}

TEST_CASE("ProjectSettings reset", "[core][settings]") {
    ProjectSettings settings;
    settings.project_name = "Changed";
    settings.lighting.sun_intensity = {1.0f};
    settings.reset();
    REQUIRE(settings.project_name == "Porchlight");
    REQUIRE(settings.lighting.sun_intensity.empty());
}
