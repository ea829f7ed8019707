#pragma once

#include <functional>
#include <memory>
#include <string>
#include <cstdint>

namespace porchlight::environment {

// Coarse periods used for decorative scene cues
enum class TimePeriod : uint8_t {
    Morning,    // 6:00 - 12:00
    Afternoon,  // 12:00 - 17:00
    Evening,    // 17:00 - 20:00
    Night       // 20:00 - 6:00
};

// Get string name for TimePeriod
const char* time_period_to_string(TimePeriod period);

// Period for a clock hour in [0, 24)
TimePeriod period_for_hour(float hour);

// Normalized time of day (0-1) for the machine's local wall-clock time
float local_clock_normalized_time();

// Configuration for the TimeOfDay clock
struct TimeOfDayConfig {
    float day_length_seconds = 120.0f;  // Real seconds per full cycle
    float start_time = 0.6f;            // Normalized start (0 = midnight, 0.5 = noon)
    float time_scale = 1.0f;
    bool use_local_clock = false;       // Ignore start_time, start at the wall-clock time
};

// Day/night clock producing the normalized time-of-day value fed to LightingModel
class TimeOfDay {
public:
    // Upper bound for time_scale, larger requests are clamped
    static constexpr float MAX_TIME_SCALE = 10000.0f;

    TimeOfDay();
    ~TimeOfDay();

    // Non-copyable
    TimeOfDay(const TimeOfDay&) = delete;
    TimeOfDay& operator=(const TimeOfDay&) = delete;

    // Initialize with configuration
    void initialize(const TimeOfDayConfig& config = {});

    // Advance the clock (dt in seconds, negative and non-finite values are ignored)
    void update(double dt);

    // Time control
    void set_normalized_time(float t);     // Wraps into [0, 1)
    float get_normalized_time() const;
    void set_hour(float hour);             // 0-24, wraps
    float get_hour() const;
    void set_time_scale(float scale);      // 1.0 = normal, 0.0 = paused, clamped to MAX_TIME_SCALE
    float get_time_scale() const;
    void pause();
    void resume();
    bool is_paused() const;

    // Day counter, incremented on each wrap past midnight
    int get_day() const;

    TimePeriod get_current_period() const;

    // Format: "HH:MM"
    std::string get_time_string() const;

    const TimeOfDayConfig& get_config() const;

    // Event callbacks
    using PeriodCallback = std::function<void(TimePeriod old_period, TimePeriod new_period)>;

    // Register callback for period changes (morning -> afternoon, etc.)
    uint32_t on_period_change(PeriodCallback callback);

    // Remove callback by ID
    void remove_callback(uint32_t id);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace porchlight::environment
