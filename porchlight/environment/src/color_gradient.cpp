#include <porchlight/environment/color_gradient.hpp>
#include <porchlight/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace porchlight::environment {

ColorGradient::ColorGradient()
    : m_stops{ColorStop{0.0f, Color{0.0f}}, ColorStop{1.0f, Color{1.0f}}} {}

ColorGradient::ColorGradient(std::vector<ColorStop> stops) : m_stops(std::move(stops)) {
    std::stable_sort(m_stops.begin(), m_stops.end(),
        [](const ColorStop& a, const ColorStop& b) { return a.position < b.position; });

    if (m_stops.empty()) {
        core::log(core::LogLevel::Warn, "[Environment] ColorGradient created without stops, using black");
        m_stops.emplace_back(0.0f, Color{0.0f});
    }
    if (m_stops.size() == 1) {
        core::log(core::LogLevel::Warn, "[Environment] ColorGradient needs two stops, duplicating {}",
                  core::to_hex_string(m_stops[0].color));
        m_stops.push_back(m_stops[0]);
    }
}

ColorGradient ColorGradient::from_hex(std::initializer_list<std::pair<float, std::string_view>> stops) {
    std::vector<ColorStop> parsed;
    parsed.reserve(stops.size());
    for (const auto& [position, hex] : stops) {
        auto color = core::parse_hex_color(hex);
        if (!color) {
            core::log(core::LogLevel::Warn, "[Environment] Invalid colour '{}' in gradient, using black", hex);
        }
        parsed.emplace_back(position, color.value_or(Color{0.0f}));
    }
    return ColorGradient(std::move(parsed));
}

Color ColorGradient::evaluate(float value) const {
    const ColorStop& first = m_stops.front();
    const ColorStop& last = m_stops.back();

    if (std::isnan(value) || value <= first.position) {
        return first.color;
    }
    if (value >= last.position) {
        return last.color;
    }

    // First stop strictly past value; its predecessor is the lower bracket
    auto upper = std::upper_bound(m_stops.begin(), m_stops.end(), value,
        [](float v, const ColorStop& stop) { return v < stop.position; });
    const ColorStop& high = *upper;
    const ColorStop& low = *(upper - 1);

    const float width = high.position - low.position;
    if (width <= 0.0f) {
        return low.color;
    }

    float t = (value - low.position) / width;
    return core::mix_oklab(low.color, high.color, t);
}

} // namespace porchlight::environment
