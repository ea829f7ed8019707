#include <porchlight/camera/camera_controller.hpp>
#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace porchlight::camera {

CameraRigConfig make_rig_config(const core::CameraSettings& settings) {
    CameraRigConfig config;

    if (settings.damping_rate > 0.0f) {
        config.damping_rate = settings.damping_rate;
    } else {
        core::log(core::LogLevel::Warn, "[Camera] damping_rate must be positive, using {}", config.damping_rate);
    }

    if (settings.max_delta_time > 0.0f) {
        config.max_delta_time = settings.max_delta_time;
    } else {
        core::log(core::LogLevel::Warn, "[Camera] max_delta_time must be positive, using {}", config.max_delta_time);
    }

    config.angular_speed = settings.angular_speed;
    config.orbit_radius = std::max(0.0f, settings.orbit_radius);
    config.bob_amplitude = settings.bob_amplitude;
    config.bob_frequency = settings.bob_frequency;
    return config;
}

CameraController::CameraController(const CameraRigConfig& config)
    : m_config(config) {
    reset();
}

void CameraController::set_inputs(const CameraInputs& inputs) {
    m_inputs = inputs;
}

void CameraController::update(float dt) {
    dt = sanitize_delta(dt);

    // Transition first so a mode change retargets this same tick
    set_mode(resolve_camera_mode(m_inputs, m_mode));

    m_state.accumulated_time += dt;
    m_target = compute_target(m_mode, m_state.accumulated_time);

    float alpha = dt * m_config.damping_rate;
    m_state.current_position = lerp_clamped(m_state.current_position, m_target.position, alpha);
    m_state.current_look_at = lerp_clamped(m_state.current_look_at, m_target.look_at, alpha);
}

CameraTarget CameraController::compute_target(CameraMode mode, double time) const {
    switch (mode) {
        case CameraMode::Welcome:
            return m_config.welcome_shot;
        case CameraMode::LoginFocus:
            return orbit_target(1.0f, time);
        case CameraMode::SignupFocus:
            return orbit_target(-1.0f, time);
        case CameraMode::Authenticated:
            return m_config.interior_shot;
        default:
            return m_config.welcome_shot;
    }
}

CameraTarget CameraController::orbit_target(float side, double time) const {
    const Vec3& center = m_config.orbit_center;
    // Phases stay in double so long sessions keep frame-sized resolution
    double phase = time * m_config.angular_speed;
    float bob = m_config.bob_amplitude * static_cast<float>(std::sin(time * m_config.bob_frequency));

    // Only the x terms carry the side, so the two orbits mirror about center.x
    float lateral = m_config.side_offset + m_config.orbit_radius * static_cast<float>(std::cos(phase));

    CameraTarget target;
    target.position = Vec3(
        center.x + side * lateral,
        center.y + bob,
        center.z + m_config.orbit_radius * static_cast<float>(std::sin(phase))
    );
    target.look_at = Vec3(
        center.x + side * m_config.look_at_offset.x,
        center.y + m_config.look_at_offset.y,
        center.z + m_config.look_at_offset.z
    );
    return target;
}

void CameraController::reset() {
    reset(m_config.welcome_shot);
}

void CameraController::reset(const CameraTarget& start) {
    m_state.current_position = start.position;
    m_state.current_look_at = start.look_at;
    m_state.accumulated_time = 0.0;
    m_mode = resolve_camera_mode(m_inputs, CameraMode::Welcome);
    m_target = compute_target(m_mode, 0.0f);
}

float CameraController::sanitize_delta(float dt) const {
    if (!(dt > 0.0f)) {
        return 0.0f;
    }
    return std::min(dt, m_config.max_delta_time);
}

void CameraController::set_mode(CameraMode new_mode) {
    if (new_mode == m_mode) return;

    CameraMode old_mode = m_mode;
    m_mode = new_mode;
    core::log(core::LogLevel::Info, "[Camera] Mode changed: {} -> {}",
              camera_mode_to_string(old_mode), camera_mode_to_string(new_mode));

    // Callbacks may add or remove entries while being dispatched
    auto callbacks = m_callbacks;
    for (auto& entry : callbacks) {
        if (entry.callback) {
            entry.callback(old_mode, new_mode);
        }
    }
}

uint32_t CameraController::on_mode_change(ModeCallback callback) {
    uint32_t id = m_next_callback_id++;
    m_callbacks.push_back({id, std::move(callback)});
    return id;
}

void CameraController::remove_callback(uint32_t id) {
    m_callbacks.erase(
        std::remove_if(m_callbacks.begin(), m_callbacks.end(),
            [id](const auto& entry) { return entry.id == id; }),
        m_callbacks.end()
    );
}

} // namespace porchlight::camera
