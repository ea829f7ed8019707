#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <porchlight/core/color.hpp>

using namespace porchlight::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("parse_hex_color", "[core][color]") {
    SECTION("Six digit form") {
        auto c = parse_hex_color("#ff8000");
        REQUIRE(c.has_value());
        REQUIRE_THAT(c->r, WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(c->g, WithinAbs(128.0f / 255.0f, 0.0001f));
        REQUIRE_THAT(c->b, WithinAbs(0.0f, 0.0001f));
    }

    SECTION("Three digit form expands nibbles") {
        auto c = parse_hex_color("#f0a");
        REQUIRE(c.has_value());
        REQUIRE_THAT(c->r, WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(c->g, WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(c->b, WithinAbs(170.0f / 255.0f, 0.0001f));
    }

    SECTION("Hash is optional and case is ignored") {
        auto c = parse_hex_color("FFFFFF");
        REQUIRE(c.has_value());
        REQUIRE(*c == Color{1.0f});
    }

    SECTION("Malformed input") {
        REQUIRE_FALSE(parse_hex_color("").has_value());
        REQUIRE_FALSE(parse_hex_color("#12345").has_value());
        REQUIRE_FALSE(parse_hex_color("#gg0000").has_value());
    }
}

TEST_CASE("Hex formatting", "[core][color]") {
    REQUIRE(to_hex_string(Color{1.0f, 0.0f, 0.0f}) == "#ff0000");
    REQUIRE(to_hex_string(Color{2.0f, -1.0f, 0.5f}) == "#ff0080");
    REQUIRE(to_rgba8(Color{1.0f, 0.0f, 0.0f}) == 0xFF0000FFu);
}

TEST_CASE("sRGB transfer functions", "[core][color]") {
    SECTION("Endpoints are fixed") {
        REQUIRE_THAT(srgb_to_linear(Color{0.0f}).r, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(srgb_to_linear(Color{1.0f}).r, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("Mid grey") {
        // sRGB 0.5 is roughly 21.4% linear
        REQUIRE_THAT(srgb_to_linear(Color{0.5f}).g, WithinAbs(0.2140f, 0.001f));
        REQUIRE_THAT(linear_to_srgb(Vec3{0.2140f}).g, WithinAbs(0.5f, 0.001f));
    }

    SECTION("Out of range linear values are clamped") {
        Color c = linear_to_srgb(Vec3{-0.5f, 2.0f, 0.0f});
        REQUIRE_THAT(c.r, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(c.g, WithinAbs(1.0f, 1e-5f));
    }
}

TEST_CASE("OKLab conversion", "[core][color]") {
    SECTION("White has unit lightness and no chroma") {
        OkLab lab = linear_to_oklab(Vec3{1.0f});
        REQUIRE_THAT(lab.x, WithinAbs(1.0f, 0.001f));
        REQUIRE_THAT(lab.y, WithinAbs(0.0f, 0.001f));
        REQUIRE_THAT(lab.z, WithinAbs(0.0f, 0.001f));
    }

    SECTION("Black maps to the origin") {
        OkLab lab = linear_to_oklab(Vec3{0.0f});
        REQUIRE_THAT(lab.x, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("Round trip preserves a saturated colour") {
        Vec3 linear{0.8f, 0.2f, 0.05f};
        Vec3 back = oklab_to_linear(linear_to_oklab(linear));
        REQUIRE_THAT(back.r, WithinAbs(linear.r, 0.001f));
        REQUIRE_THAT(back.g, WithinAbs(linear.g, 0.001f));
        REQUIRE_THAT(back.b, WithinAbs(linear.b, 0.001f));
    }
}

TEST_CASE("mix_oklab", "[core][color]") {
    Color warm{1.0f, 0.4f, 0.2f};
    Color cool{0.2f, 0.4f, 1.0f};

    SECTION("Endpoints return inputs exactly") {
        REQUIRE(mix_oklab(warm, cool, 0.0f) == warm);
        REQUIRE(mix_oklab(warm, cool, 1.0f) == cool);
        REQUIRE(mix_oklab(warm, cool, -3.0f) == warm);
        REQUIRE(mix_oklab(warm, cool, 7.0f) == cool);
    }

    SECTION("Black to white midpoint is perceptual mid grey") {
        Color grey = mix_oklab(Color{0.0f}, Color{1.0f}, 0.5f);
        // OKLab L = 0.5 -> linear 0.125 -> sRGB ~0.3886
        REQUIRE_THAT(grey.r, WithinAbs(0.3886f, 0.002f));
        REQUIRE_THAT(grey.g, WithinAbs(grey.r, 0.001f));
        REQUIRE_THAT(grey.b, WithinAbs(grey.r, 0.001f));
    }

    SECTION("Result stays within display range") {
        Color c = mix_oklab(Color{1.0f, 0.0f, 0.0f}, Color{0.0f, 0.0f, 1.0f}, 0.5f);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(c[i] >= 0.0f);
            REQUIRE(c[i] <= 1.0f);
        }
    }
}
