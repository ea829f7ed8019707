#pragma once

#include <porchlight/core/color.hpp>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

namespace porchlight::environment {

using core::Color;

struct ColorStop {
    float position = 0.0f;
    Color color{0.0f};

    ColorStop() = default;
    ColorStop(float p, const Color& c) : position(p), color(c) {}
};

// Multi-stop colour gradient over non-uniform breakpoints. Blends in OKLab so
// hue transitions (sunrise orange to midday white) stay perceptually even.
class ColorGradient {
public:
    ColorGradient();

    // Stops are sorted by position. Fewer than two stops are padded (logged).
    explicit ColorGradient(std::vector<ColorStop> stops);

    // Convenience for authored presets: {{0.25f, "#ffb36b"}, ...}.
    // Unparseable colours become black (logged).
    static ColorGradient from_hex(std::initializer_list<std::pair<float, std::string_view>> stops);

    Color evaluate(float value) const;

    size_t size() const { return m_stops.size(); }
    const std::vector<ColorStop>& stops() const { return m_stops; }

private:
    std::vector<ColorStop> m_stops;
};

} // namespace porchlight::environment
