#pragma once

#include <vector>
#include <cstddef>

namespace porchlight::environment {

// Piecewise-linear curve over [0, 1]. Control point i sits at i / (N - 1).
// Inputs outside [0, 1] clamp to the end points; there is no extrapolation.
class Curve {
public:
    // A single zero point
    Curve();

    // Empty input is replaced with a single zero point (logged)
    explicit Curve(std::vector<float> points);

    float evaluate(float value) const;

    size_t size() const { return m_points.size(); }
    const std::vector<float>& points() const { return m_points; }

private:
    std::vector<float> m_points;
};

} // namespace porchlight::environment
