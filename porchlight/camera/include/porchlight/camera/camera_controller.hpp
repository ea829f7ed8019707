#pragma once

#include <porchlight/core/math.hpp>
#include <porchlight/camera/camera_mode.hpp>
#include <functional>
#include <vector>
#include <cstdint>

namespace porchlight::core {
    struct CameraSettings;
}

namespace porchlight::camera {

using namespace porchlight::core;

// ============================================================================
// Camera Values
// ============================================================================

struct CameraTarget {
    Vec3 position{0.0f};
    Vec3 look_at{0.0f};
};

// Damped camera pose read by the renderer. One writer: CameraController::update.
struct CameraState {
    Vec3 current_position{0.0f};
    Vec3 current_look_at{0.0f};
    double accumulated_time = 0.0;      // Seconds of sanitized dt since mount
};

// ============================================================================
// Rig Configuration
// ============================================================================

struct CameraRigConfig {
    // Fixed shots
    CameraTarget welcome_shot{Vec3(0.0f, 6.0f, 18.0f), Vec3(0.0f, 1.0f, 0.0f)};
    CameraTarget interior_shot{Vec3(0.0f, 1.6f, -1.5f), Vec3(0.0f, 1.5f, -6.0f)};

    // Focus orbit. Login circles a point side_offset along +X from orbit_center,
    // signup the point mirrored to -X.
    Vec3 orbit_center{0.0f, 2.5f, 9.0f};
    float side_offset = 4.0f;
    float orbit_radius = 3.0f;
    float angular_speed = 0.15f;        // Orbit phase (radians/second)

    // Vertical bob layered on the orbit
    float bob_amplitude = 0.25f;
    float bob_frequency = 0.37f;        // Radians/second, unrelated to angular_speed

    // Look-at point relative to orbit_center; x points toward the form side
    Vec3 look_at_offset{1.5f, -1.0f, -9.0f};

    // Damping
    float damping_rate = 1.2f;          // Per second
    float max_delta_time = 0.1f;        // dt clamp for stalled frames
};

// Rig defaults with the tunables from project settings applied
CameraRigConfig make_rig_config(const core::CameraSettings& settings);

// ============================================================================
// Camera Controller
// ============================================================================

// Resolves the camera mode from UI inputs and moves the camera toward the mode's
// target each tick with frame-rate independent damping.
class CameraController {
public:
    explicit CameraController(const CameraRigConfig& config = {});

    // Latest UI state. Takes effect on the next update.
    void set_inputs(const CameraInputs& inputs);
    const CameraInputs& inputs() const { return m_inputs; }

    CameraMode mode() const { return m_mode; }

    // Advance one frame: sanitize dt, resolve the mode, accumulate time,
    // then approach the target with alpha = clamp(dt * damping_rate, 0, 1)
    void update(float dt);

    // Target for a mode at the given accumulated time (pure)
    CameraTarget compute_target(CameraMode mode, double time) const;

    // Target used by the last update
    const CameraTarget& target() const { return m_target; }

    const CameraState& state() const { return m_state; }
    const CameraRigConfig& config() const { return m_config; }

    // Scene mount: clear the authenticated latch and time, place the camera at the
    // welcome shot (or at start)
    void reset();
    void reset(const CameraTarget& start);

    // NaN and negative become 0, large values clamp to max_delta_time
    float sanitize_delta(float dt) const;

    // Event callbacks
    using ModeCallback = std::function<void(CameraMode old_mode, CameraMode new_mode)>;

    uint32_t on_mode_change(ModeCallback callback);
    void remove_callback(uint32_t id);

private:
    CameraTarget orbit_target(float side, double time) const;
    void set_mode(CameraMode new_mode);

    CameraRigConfig m_config;
    CameraInputs m_inputs;
    CameraMode m_mode = CameraMode::Welcome;
    CameraState m_state;
    CameraTarget m_target;

    struct ModeCallbackEntry {
        uint32_t id;
        ModeCallback callback;
    };
    std::vector<ModeCallbackEntry> m_callbacks;
    uint32_t m_next_callback_id = 1;
};

} // namespace porchlight::camera
