#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <porchlight/environment/curve.hpp>
#include <algorithm>
#include <limits>
#include <vector>

using namespace porchlight::environment;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Curve construction", "[environment][curve]") {
    SECTION("Default curve is a single zero") {
        Curve curve;
        REQUIRE(curve.size() == 1);
        REQUIRE(curve.evaluate(0.3f) == 0.0f);
    }

    SECTION("Empty input is replaced") {
        Curve curve(std::vector<float>{});
        REQUIRE(curve.size() == 1);
        REQUIRE(curve.evaluate(0.0f) == 0.0f);
        REQUIRE(curve.evaluate(1.0f) == 0.0f);
    }

    SECTION("Single point curve is constant") {
        Curve curve({0.7f});
        REQUIRE(curve.evaluate(-5.0f) == 0.7f);
        REQUIRE(curve.evaluate(0.5f) == 0.7f);
        REQUIRE(curve.evaluate(5.0f) == 0.7f);
    }
}

// ============================================================================
// Evaluation
// ============================================================================

TEST_CASE("Curve reproduces end points", "[environment][curve]") {
    std::vector<std::vector<float>> authored = {
        {0.0f, 1.0f},
        {0.3f, 0.9f, 0.1f},
        {1.5f, -2.0f, 4.0f, 0.25f, 3.0f},
        {0.0f, 0.0f, 0.15f, 0.9f, 1.3f, 1.5f, 1.3f, 0.9f, 0.15f, 0.0f, 0.0f}
    };

    for (const auto& points : authored) {
        Curve curve(points);
        REQUIRE(curve.evaluate(0.0f) == points.front());
        REQUIRE(curve.evaluate(1.0f) == points.back());
    }
}

TEST_CASE("Curve reproduces every keyframe exactly", "[environment][curve]") {
    // Indices that are exactly representable keep floor == ceil
    std::vector<float> points = {2.0f, 4.0f, -1.0f, 8.0f, 0.5f};
    Curve curve(points);
    for (size_t i = 0; i < points.size(); ++i) {
        float position = static_cast<float>(i) / 4.0f;
        REQUIRE(curve.evaluate(position) == points[i]);
    }
}

TEST_CASE("Curve interpolates linearly inside a segment", "[environment][curve]") {
    Curve curve({0.0f, 10.0f, 0.0f});

    REQUIRE_THAT(curve.evaluate(0.25f), WithinAbs(5.0f, 1e-5f));
    REQUIRE_THAT(curve.evaluate(0.5f), WithinAbs(10.0f, 1e-5f));
    REQUIRE_THAT(curve.evaluate(0.75f), WithinAbs(5.0f, 1e-5f));
    REQUIRE_THAT(curve.evaluate(0.1f), WithinAbs(2.0f, 1e-5f));
}

TEST_CASE("Curve is monotonic within each segment", "[environment][curve]") {
    std::vector<float> points = {0.0f, 1.0f, 0.2f, 0.2f, 3.0f, -1.0f};
    Curve curve(points);
    const size_t segments = points.size() - 1;
    const float eps = 1e-6f;

    for (size_t s = 0; s < segments; ++s) {
        float a = points[s];
        float b = points[s + 1];
        float lo = std::min(a, b);
        float hi = std::max(a, b);

        float previous = a;
        for (int step = 0; step <= 50; ++step) {
            float value = (static_cast<float>(s) + static_cast<float>(step) / 50.0f) / static_cast<float>(segments);
            float result = curve.evaluate(value);

            // No overshoot
            REQUIRE(result >= lo - eps);
            REQUIRE(result <= hi + eps);

            // Moves in one direction only
            if (b >= a) {
                REQUIRE(result >= previous - eps);
            } else {
                REQUIRE(result <= previous + eps);
            }
            previous = result;
        }
    }
}

TEST_CASE("Curve clamps out-of-range input", "[environment][curve]") {
    Curve curve({0.3f, 0.9f, 0.1f});

    REQUIRE(curve.evaluate(-1.0f) == curve.evaluate(0.0f));
    REQUIRE(curve.evaluate(2.0f) == curve.evaluate(1.0f));
    REQUIRE(curve.evaluate(-1000.0f) == 0.3f);
    REQUIRE(curve.evaluate(std::numeric_limits<float>::infinity()) == 0.1f);
    REQUIRE(curve.evaluate(-std::numeric_limits<float>::infinity()) == 0.3f);
}

TEST_CASE("Curve treats NaN as zero", "[environment][curve]") {
    Curve curve({0.3f, 0.9f, 0.1f});
    REQUIRE(curve.evaluate(std::numeric_limits<float>::quiet_NaN()) == 0.3f);
}
