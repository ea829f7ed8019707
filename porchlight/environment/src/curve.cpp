#include <porchlight/environment/curve.hpp>
#include <porchlight/core/log.hpp>
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace porchlight::environment {

Curve::Curve() : m_points{0.0f} {}

Curve::Curve(std::vector<float> points) : m_points(std::move(points)) {
    if (m_points.empty()) {
        core::log(core::LogLevel::Warn, "[Environment] Curve created without control points, using 0");
        m_points.push_back(0.0f);
    }
}

float Curve::evaluate(float value) const {
    if (m_points.size() == 1) {
        return m_points[0];
    }
    if (std::isnan(value)) {
        value = 0.0f;
    }

    const float count = static_cast<float>(m_points.size() - 1);
    const float scaled = count * value;

    // Clamping the indices (not the input) keeps out-of-range values on the end points
    const float low = std::clamp(std::floor(scaled), 0.0f, count);
    const float high = std::clamp(std::ceil(scaled), 0.0f, count);

    const size_t low_index = static_cast<size_t>(low);
    const size_t high_index = static_cast<size_t>(high);

    if (low_index == high_index) {
        return m_points[low_index];
    }

    const float low_pos = low / count;
    const float high_pos = high / count;
    const float width = high_pos - low_pos;
    if (width <= 0.0f) {
        return m_points[low_index];
    }

    float t = std::clamp((value - low_pos) / width, 0.0f, 1.0f);
    return glm::mix(m_points[low_index], m_points[high_index], t);
}

} // namespace porchlight::environment
