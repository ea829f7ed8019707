#pragma once

namespace porchlight::scene {

struct DoorConfig {
    float open_angle_degrees = -85.0f;  // Swing about the hinge (+Y)
    float swing_duration = 0.8f;        // Seconds for a full open or close
    float reveal_delay = 0.4f;          // Interior starts fading in this long after opening
    float reveal_fade = 0.3f;           // Seconds for the interior fade
};

struct DoorState {
    float angle_degrees = 0.0f;
    float interior_reveal = 0.0f;       // Interior view opacity (0-1)
    bool open = false;                  // Commanded state, the swing may still be running
};

// Ease-in-out used for the door swing (quadratic, symmetric about 0.5)
float ease_in_out(float t);

// Front door swing driven by login attempts: opens on submit, closes on failure
class DoorAnimator {
public:
    explicit DoorAnimator(const DoorConfig& config = {});

    void open();
    void close();
    void set_open(bool open);

    // Advance the swing (dt in seconds, non-positive values are ignored)
    void update(float dt);

    // Snap back to closed
    void reset();

    bool is_open() const { return m_open; }
    bool is_moving() const;
    float progress() const { return m_progress; }
    float angle() const;
    float interior_reveal() const { return m_reveal; }

    DoorState state() const;
    const DoorConfig& config() const { return m_config; }

private:
    DoorConfig m_config;
    bool m_open = false;
    float m_progress = 0.0f;            // Linear swing progress, 0 = closed, 1 = open
    float m_open_time = 0.0f;           // Seconds since the last open()
    float m_reveal = 0.0f;
};

} // namespace porchlight::scene
