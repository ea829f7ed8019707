#pragma once

#include <porchlight/scene/scene_renderer.hpp>
#include <porchlight/environment/time_of_day.hpp>
#include <porchlight/environment/lighting_model.hpp>
#include <porchlight/camera/camera_controller.hpp>
#include <porchlight/scene/door_animator.hpp>
#include <porchlight/scene/decor_scatter.hpp>
#include <memory>
#include <cstdint>

namespace porchlight::core {
    struct ProjectSettings;
}

namespace porchlight::scene {

struct SceneDirectorConfig {
    environment::TimeOfDayConfig time;
    environment::LightingModelConfig lighting = environment::LightingPresets::default_config();
    camera::CameraRigConfig camera;
    DoorConfig door;
    DecorConfig decor;
};

// Director config from the loaded project settings
SceneDirectorConfig make_director_config(const core::ProjectSettings& settings);

// Per-frame orchestration of the house scene. Each tick runs, in order:
//   1. camera mode transition from the latest UI inputs
//   2. clock advance and lighting evaluation
//   3. damped camera update
//   4. door swing
//   5. renderer submission
class SceneDirector {
public:
    explicit SceneDirector(const SceneDirectorConfig& config = {});
    ~SceneDirector();

    // Non-copyable
    SceneDirector(const SceneDirector&) = delete;
    SceneDirector& operator=(const SceneDirector&) = delete;

    // Scene lifecycle. mount() resets the camera and door, scatters the decor and
    // hands it to the renderer (which may be null). Must outlive the mount.
    void mount(ISceneRenderer* renderer);
    void unmount();
    bool is_mounted() const;

    // Advance one frame. Ignored while unmounted.
    void tick(float dt);

    // UI inputs
    void set_auth_mode(camera::AuthMode mode);
    void set_show_welcome(bool show);
    void set_authenticated(bool authenticated);
    const camera::CameraInputs& inputs() const;

    // Login flow: the door opens on submit and closes again if it fails
    void begin_login_attempt();
    void login_failed();
    void login_succeeded();

    // Subsystems
    environment::TimeOfDay& time_of_day();
    const environment::TimeOfDay& time_of_day() const;
    const environment::LightingModel& lighting_model() const;
    const camera::CameraController& camera() const;
    const DoorAnimator& door() const;
    const DecorLayout& decor() const;

    // Last submitted frame
    const SceneFrame& frame() const;
    uint64_t frame_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace porchlight::scene
