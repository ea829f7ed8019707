#pragma once

#include <porchlight/environment/lighting_model.hpp>
#include <porchlight/environment/scene_cues.hpp>
#include <porchlight/environment/time_of_day.hpp>
#include <porchlight/camera/camera_controller.hpp>
#include <porchlight/scene/door_animator.hpp>
#include <porchlight/scene/decor_scatter.hpp>
#include <cstdint>

namespace porchlight::scene {

// Everything computed for one tick, handed to the renderer read-only
struct SceneFrame {
    uint64_t frame_index = 0;
    float delta_time = 0.0f;            // Sanitized dt used for this tick

    float time_of_day = 0.0f;
    environment::TimePeriod period = environment::TimePeriod::Afternoon;
    environment::LightingState lighting;
    environment::SceneCues cues;

    camera::CameraMode camera_mode = camera::CameraMode::Welcome;
    camera::CameraState camera;

    DoorState door;
};

// Consumer of the animation output. Owns all static geometry (house, garden,
// windows) and only reads the values pushed to it.
class ISceneRenderer {
public:
    virtual ~ISceneRenderer() = default;

    // Called once when the scene mounts
    virtual void set_decor(const DecorLayout& layout) = 0;

    // Called once per tick after all animation state is updated
    virtual void submit(const SceneFrame& frame) = 0;
};

} // namespace porchlight::scene
