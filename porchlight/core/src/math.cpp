#include <porchlight/core/math.hpp>
#include <algorithm>
#include <cmath>

namespace porchlight::core {

float sanitize(float value, float lo, float hi, float fallback) {
    if (std::isnan(value)) {
        value = fallback;
    }
    return std::clamp(value, lo, hi);
}

Vec3 rotate_about_up(const Vec3& v, float degrees) {
    Quat rotation = glm::angleAxis(glm::radians(degrees), WorldUp);
    return rotation * v;
}

Vec3 lerp_clamped(const Vec3& a, const Vec3& b, float t) {
    return glm::mix(a, b, std::clamp(t, 0.0f, 1.0f));
}

} // namespace porchlight::core
