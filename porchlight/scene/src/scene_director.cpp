#include <porchlight/scene/scene_director.hpp>
#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/log.hpp>

namespace porchlight::scene {

SceneDirectorConfig make_director_config(const core::ProjectSettings& settings) {
    SceneDirectorConfig config;

    config.time.day_length_seconds = settings.time.day_length_seconds;
    config.time.start_time = settings.time.start_time;
    config.time.time_scale = settings.time.time_scale;
    config.time.use_local_clock = settings.time.use_local_clock;

    config.lighting = environment::apply_lighting_settings(
        environment::LightingPresets::default_config(), settings.lighting);
    config.camera = camera::make_rig_config(settings.camera);
    config.decor = make_decor_config(settings.decor);
    return config;
}

// Implementation struct
struct SceneDirector::Impl {
    SceneDirectorConfig config;

    environment::TimeOfDay clock;
    environment::LightingModel lighting;
    camera::CameraController camera;
    DoorAnimator door;
    DecorLayout decor;

    camera::CameraInputs inputs;
    ISceneRenderer* renderer = nullptr;
    bool mounted = false;

    SceneFrame frame;
    uint64_t frame_count = 0;

    explicit Impl(const SceneDirectorConfig& c)
        : config(c)
        , lighting(c.lighting)
        , camera(c.camera)
        , door(c.door) {
        clock.initialize(config.time);
    }
};

SceneDirector::SceneDirector(const SceneDirectorConfig& config)
    : m_impl(std::make_unique<Impl>(config)) {}

SceneDirector::~SceneDirector() = default;

void SceneDirector::mount(ISceneRenderer* renderer) {
    if (m_impl->mounted) {
        unmount();
    }

    m_impl->clock.initialize(m_impl->config.time);
    m_impl->camera.set_inputs(m_impl->inputs);
    m_impl->camera.reset();
    m_impl->door.reset();
    m_impl->decor = scatter_decor(m_impl->config.decor);

    m_impl->frame = SceneFrame{};
    m_impl->frame_count = 0;
    m_impl->renderer = renderer;
    m_impl->mounted = true;

    if (m_impl->renderer) {
        m_impl->renderer->set_decor(m_impl->decor);
    }

    core::log(core::LogLevel::Info, "[Scene] Mounted ({} decor instances, camera {})",
              m_impl->decor.instances.size(), camera::camera_mode_to_string(m_impl->camera.mode()));
}

void SceneDirector::unmount() {
    if (!m_impl->mounted) return;

    m_impl->renderer = nullptr;
    m_impl->mounted = false;
    core::log(core::LogLevel::Info, "[Scene] Unmounted after {} frames", m_impl->frame_count);
}

bool SceneDirector::is_mounted() const {
    return m_impl->mounted;
}

void SceneDirector::tick(float dt) {
    if (!m_impl->mounted) {
        return;
    }

    auto& impl = *m_impl;
    float step = impl.camera.sanitize_delta(dt);

    // Inputs reach the camera before its update resolves the mode
    impl.camera.set_inputs(impl.inputs);

    impl.clock.update(step);
    float time_of_day = impl.clock.get_normalized_time();
    impl.frame.lighting = impl.lighting.compute(time_of_day);
    impl.frame.period = impl.clock.get_current_period();
    impl.frame.cues = environment::compute_scene_cues(impl.frame.period);

    impl.camera.update(step);

    impl.door.update(step);

    impl.frame.frame_index = impl.frame_count++;
    impl.frame.delta_time = step;
    impl.frame.time_of_day = time_of_day;
    impl.frame.camera_mode = impl.camera.mode();
    impl.frame.camera = impl.camera.state();
    impl.frame.door = impl.door.state();

    if (impl.renderer) {
        impl.renderer->submit(impl.frame);
    }
}

void SceneDirector::set_auth_mode(camera::AuthMode mode) {
    m_impl->inputs.mode = mode;
}

void SceneDirector::set_show_welcome(bool show) {
    m_impl->inputs.show_welcome = show;
}

void SceneDirector::set_authenticated(bool authenticated) {
    m_impl->inputs.is_authenticated = authenticated;
}

const camera::CameraInputs& SceneDirector::inputs() const {
    return m_impl->inputs;
}

void SceneDirector::begin_login_attempt() {
    core::log(core::LogLevel::Debug, "[Scene] Login attempt");
    m_impl->door.open();
}

void SceneDirector::login_failed() {
    core::log(core::LogLevel::Debug, "[Scene] Login failed");
    m_impl->door.close();
}

void SceneDirector::login_succeeded() {
    core::log(core::LogLevel::Info, "[Scene] Login succeeded");
    m_impl->inputs.is_authenticated = true;
    m_impl->door.open();
}

environment::TimeOfDay& SceneDirector::time_of_day() {
    return m_impl->clock;
}

const environment::TimeOfDay& SceneDirector::time_of_day() const {
    return m_impl->clock;
}

const environment::LightingModel& SceneDirector::lighting_model() const {
    return m_impl->lighting;
}

const camera::CameraController& SceneDirector::camera() const {
    return m_impl->camera;
}

const DoorAnimator& SceneDirector::door() const {
    return m_impl->door;
}

const DecorLayout& SceneDirector::decor() const {
    return m_impl->decor;
}

const SceneFrame& SceneDirector::frame() const {
    return m_impl->frame;
}

uint64_t SceneDirector::frame_count() const {
    return m_impl->frame_count;
}

} // namespace porchlight::scene
