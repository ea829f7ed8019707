#include <porchlight/scene/door_animator.hpp>
#include <porchlight/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace porchlight::scene {

float ease_in_out(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return t < 0.5f
        ? 2.0f * t * t
        : 1.0f - std::pow(-2.0f * t + 2.0f, 2.0f) / 2.0f;
}

DoorAnimator::DoorAnimator(const DoorConfig& config)
    : m_config(config) {
    if (m_config.swing_duration < 0.0f) {
        core::log(core::LogLevel::Warn, "[Scene] Door swing_duration must not be negative, using 0");
        m_config.swing_duration = 0.0f;
    }
    m_config.reveal_delay = std::max(0.0f, m_config.reveal_delay);
    m_config.reveal_fade = std::max(0.0f, m_config.reveal_fade);
}

void DoorAnimator::open() {
    set_open(true);
}

void DoorAnimator::close() {
    set_open(false);
}

void DoorAnimator::set_open(bool open) {
    if (open == m_open) return;

    m_open = open;
    m_open_time = 0.0f;
    core::log(core::LogLevel::Debug, "[Scene] Door {}", open ? "opening" : "closing");
}

void DoorAnimator::update(float dt) {
    if (!(dt > 0.0f)) {
        return;
    }

    // Zero duration snaps
    float step = m_config.swing_duration > 0.0f ? dt / m_config.swing_duration : 1.0f;
    m_progress = std::clamp(m_progress + (m_open ? step : -step), 0.0f, 1.0f);

    if (m_open) {
        m_open_time += dt;
        float since = m_open_time - m_config.reveal_delay;
        float target = 0.0f;
        if (since > 0.0f) {
            target = m_config.reveal_fade > 0.0f ? std::min(1.0f, since / m_config.reveal_fade) : 1.0f;
        }
        m_reveal = std::max(m_reveal, target);
    } else {
        float fade_step = m_config.reveal_fade > 0.0f ? dt / m_config.reveal_fade : 1.0f;
        m_reveal = std::max(0.0f, m_reveal - fade_step);
    }
}

void DoorAnimator::reset() {
    m_open = false;
    m_progress = 0.0f;
    m_open_time = 0.0f;
    m_reveal = 0.0f;
}

bool DoorAnimator::is_moving() const {
    return m_open ? m_progress < 1.0f : m_progress > 0.0f;
}

float DoorAnimator::angle() const {
    return m_config.open_angle_degrees * ease_in_out(m_progress);
}

DoorState DoorAnimator::state() const {
    DoorState state;
    state.angle_degrees = angle();
    state.interior_reveal = m_reveal;
    state.open = m_open;
    return state;
}

} // namespace porchlight::scene
