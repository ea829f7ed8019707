#include <porchlight/environment/time_of_day.hpp>
#include <porchlight/core/log.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <format>
#include <limits>
#include <utility>
#include <vector>

namespace porchlight::environment {

const char* time_period_to_string(TimePeriod period) {
    switch (period) {
        case TimePeriod::Morning: return "Morning";
        case TimePeriod::Afternoon: return "Afternoon";
        case TimePeriod::Evening: return "Evening";
        case TimePeriod::Night: return "Night";
        default: return "Unknown";
    }
}

TimePeriod period_for_hour(float hour) {
    if (hour >= 6.0f && hour < 12.0f) return TimePeriod::Morning;
    if (hour >= 12.0f && hour < 17.0f) return TimePeriod::Afternoon;
    if (hour >= 17.0f && hour < 20.0f) return TimePeriod::Evening;
    return TimePeriod::Night;
}

float local_clock_normalized_time() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    float seconds = static_cast<float>(local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec);
    return seconds / 86400.0f;
}

static float clamp_time_scale(float scale) {
    if (!(scale > 0.0f)) return 0.0f;
    if (scale > TimeOfDay::MAX_TIME_SCALE) {
        core::log(core::LogLevel::Warn, "[Environment] time_scale {} too large, using {}",
                  scale, TimeOfDay::MAX_TIME_SCALE);
        return TimeOfDay::MAX_TIME_SCALE;
    }
    return scale;
}

static float wrap01(float t) {
    if (std::isnan(t)) return 0.0f;
    t = t - std::floor(t);
    // floor can leave exactly 1.0 for tiny negative inputs
    return t >= 1.0f ? 0.0f : t;
}

// Implementation struct
struct TimeOfDay::Impl {
    TimeOfDayConfig config;
    float current_time = 0.6f;
    float time_scale = 1.0f;
    bool paused = false;
    int current_day = 0;
    TimePeriod current_period = TimePeriod::Afternoon;

    struct PeriodCallbackEntry {
        uint32_t id;
        TimeOfDay::PeriodCallback callback;
    };
    std::vector<PeriodCallbackEntry> period_callbacks;
    uint32_t next_callback_id = 1;

    float hour() const { return current_time * 24.0f; }

    void refresh_period() {
        TimePeriod new_period = period_for_hour(hour());
        if (new_period == current_period) return;

        TimePeriod old_period = current_period;
        current_period = new_period;
        core::log(core::LogLevel::Debug, "[Environment] Period changed: {} -> {}",
                  time_period_to_string(old_period), time_period_to_string(new_period));
        // Callbacks may add or remove entries while being dispatched
        auto callbacks = period_callbacks;
        for (auto& entry : callbacks) {
            if (entry.callback) {
                entry.callback(old_period, new_period);
            }
        }
    }
};

TimeOfDay::TimeOfDay() : m_impl(std::make_unique<Impl>()) {}

TimeOfDay::~TimeOfDay() = default;

void TimeOfDay::initialize(const TimeOfDayConfig& config) {
    m_impl->config = config;
    if (m_impl->config.day_length_seconds <= 0.0f) {
        core::log(core::LogLevel::Warn, "[Environment] day_length_seconds must be positive, using 120");
        m_impl->config.day_length_seconds = 120.0f;
    }

    m_impl->current_time = config.use_local_clock ? local_clock_normalized_time() : wrap01(config.start_time);
    m_impl->time_scale = clamp_time_scale(config.time_scale);
    m_impl->paused = false;
    m_impl->current_day = 0;
    m_impl->current_period = period_for_hour(m_impl->hour());

    core::log(core::LogLevel::Info, "[Environment] TimeOfDay initialized at {} ({})",
              get_time_string(), time_period_to_string(m_impl->current_period));
}

void TimeOfDay::update(double dt) {
    if (m_impl->paused || m_impl->time_scale <= 0.0f || !(dt > 0.0) || !std::isfinite(dt)) {
        return;
    }

    double t = m_impl->current_time + dt / m_impl->config.day_length_seconds * m_impl->time_scale;
    if (!std::isfinite(t)) {
        return;
    }

    double whole_days = std::floor(t);
    m_impl->current_time = wrap01(static_cast<float>(t - whole_days));

    double day_room = static_cast<double>(std::numeric_limits<int>::max() - m_impl->current_day);
    m_impl->current_day += static_cast<int>(std::min(whole_days, day_room));

    m_impl->refresh_period();
}

void TimeOfDay::set_normalized_time(float t) {
    m_impl->current_time = wrap01(t);
    m_impl->refresh_period();
}

float TimeOfDay::get_normalized_time() const {
    return m_impl->current_time;
}

void TimeOfDay::set_hour(float hour) {
    set_normalized_time(hour / 24.0f);
}

float TimeOfDay::get_hour() const {
    return m_impl->hour();
}

void TimeOfDay::set_time_scale(float scale) {
    m_impl->time_scale = clamp_time_scale(scale);
}

float TimeOfDay::get_time_scale() const {
    return m_impl->time_scale;
}

void TimeOfDay::pause() {
    m_impl->paused = true;
}

void TimeOfDay::resume() {
    m_impl->paused = false;
}

bool TimeOfDay::is_paused() const {
    return m_impl->paused;
}

int TimeOfDay::get_day() const {
    return m_impl->current_day;
}

TimePeriod TimeOfDay::get_current_period() const {
    return m_impl->current_period;
}

std::string TimeOfDay::get_time_string() const {
    int total_minutes = static_cast<int>(m_impl->current_time * 24.0f * 60.0f);
    int hours = (total_minutes / 60) % 24;
    int minutes = total_minutes % 60;
    return std::format("{:02d}:{:02d}", hours, minutes);
}

const TimeOfDayConfig& TimeOfDay::get_config() const {
    return m_impl->config;
}

uint32_t TimeOfDay::on_period_change(PeriodCallback callback) {
    uint32_t id = m_impl->next_callback_id++;
    m_impl->period_callbacks.push_back({id, std::move(callback)});
    return id;
}

void TimeOfDay::remove_callback(uint32_t id) {
    auto& callbacks = m_impl->period_callbacks;
    callbacks.erase(
        std::remove_if(callbacks.begin(), callbacks.end(),
            [id](const auto& entry) { return entry.id == id; }),
        callbacks.end()
    );
}

} // namespace porchlight::environment
