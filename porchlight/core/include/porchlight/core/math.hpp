#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace porchlight::core {

// Vector types
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

// Matrix types
using Mat3 = glm::mat3;
using Mat4 = glm::mat4;

// Quaternion
using Quat = glm::quat;

// World up axis (+Y)
inline const Vec3 WorldUp{0.0f, 1.0f, 0.0f};

// Replaces NaN with a fallback, then clamps to [lo, hi]
float sanitize(float value, float lo, float hi, float fallback = 0.0f);

// Rotates a vector about +Y by the given angle in degrees
Vec3 rotate_about_up(const Vec3& v, float degrees);

// Linear interpolation with t clamped to [0, 1]
Vec3 lerp_clamped(const Vec3& a, const Vec3& b, float t);

} // namespace porchlight::core
