// House Entrance Demo
// Drives the SceneDirector from a GLFW frame loop. The clear colour follows the
// sky gradient; lighting, camera and door values are logged.

#include <porchlight/core/core.hpp>
#include <porchlight/scene/scene.hpp>

#include <GLFW/glfw3.h>

#include <algorithm>
#include <memory>
#include <string>

using namespace porchlight::core;
namespace scene = porchlight::scene;
namespace camera = porchlight::camera;
namespace env = porchlight::environment;

// Renderer stand-in: clears to the sky colour and reports the animation state.
// House and garden geometry are owned elsewhere.
class LoggingSceneRenderer : public scene::ISceneRenderer {
public:
    void set_decor(const scene::DecorLayout& layout) override {
        log(LogLevel::Info, "[Render] Decor: {} grass, {} cobblestones (seed {})",
            layout.count(scene::DecorKind::Grass),
            layout.count(scene::DecorKind::Cobblestone),
            layout.seed);
    }

    void submit(const scene::SceneFrame& frame) override {
        const Color& sky = frame.lighting.sky_color;
        glClearColor(sky.r, sky.g, sky.b, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        // Report every 2 seconds
        m_log_timer += frame.delta_time;
        if (m_log_timer < 2.0f) return;
        m_log_timer = 0.0f;

        const auto& light = frame.lighting;
        const auto& cam = frame.camera;
        log(LogLevel::Info, "[Render] t={:.3f} {} sun={:.2f} {} moon={:.2f} {} ambient={:.2f} sky={}",
            frame.time_of_day, env::time_period_to_string(frame.period),
            light.sun_intensity, to_hex_string(light.sun_color),
            light.moon_intensity, to_hex_string(light.moon_color),
            light.ambient_intensity, to_hex_string(light.sky_color));
        log(LogLevel::Info, "[Render] camera {} pos=({:.2f}, {:.2f}, {:.2f}) look=({:.2f}, {:.2f}, {:.2f}) door={:.1f}",
            camera::camera_mode_to_string(frame.camera_mode),
            cam.current_position.x, cam.current_position.y, cam.current_position.z,
            cam.current_look_at.x, cam.current_look_at.y, cam.current_look_at.z,
            frame.door.angle_degrees);
    }

private:
    float m_log_timer = 0.0f;
};

class HouseEntranceDemo {
public:
    int run(int argc, char** argv) {
        std::string settings_path = argc > 1 ? argv[1] : "porchlight.json";
        auto& settings = ProjectSettings::get();
        if (!settings.load(settings_path)) {
            log(LogLevel::Warn, "Using default settings");
        }

        if (!glfwInit()) {
            log(LogLevel::Fatal, "Failed to initialize GLFW");
            return 1;
        }
        glfwSetErrorCallback([](int error, const char* description) {
            log(LogLevel::Error, "[GLFW] Error ({}): {}", error, description);
        });

        m_window = glfwCreateWindow(static_cast<int>(settings.window.width),
                                    static_cast<int>(settings.window.height),
                                    settings.window.title.c_str(), nullptr, nullptr);
        if (!m_window) {
            log(LogLevel::Fatal, "Failed to create window");
            glfwTerminate();
            return 1;
        }
        glfwMakeContextCurrent(m_window);
        glfwSwapInterval(settings.window.vsync ? 1 : 0);
        glfwSetWindowUserPointer(m_window, this);
        glfwSetKeyCallback(m_window, key_callback);

        m_director = std::make_unique<scene::SceneDirector>(scene::make_director_config(settings));
        m_director->time_of_day().on_period_change([](env::TimePeriod old_p, env::TimePeriod new_p) {
            log(LogLevel::Info, "[Environment] Period changed: {} -> {}",
                env::time_period_to_string(old_p),
                env::time_period_to_string(new_p));
        });
        m_director->mount(&m_renderer);

        log(LogLevel::Info, "House Entrance Demo initialized (porchlight {})", PORCHLIGHT_VERSION);
        log(LogLevel::Info, "Controls:");
        log(LogLevel::Info, "  Enter: Dismiss/show welcome");
        log(LogLevel::Info, "  Tab: Toggle login/signup");
        log(LogLevel::Info, "  L: Login attempt, F: fail it, S: succeed");
        log(LogLevel::Info, "  Space: Pause/Resume time, +/-: time speed");
        log(LogLevel::Info, "  R: Remount the scene");

        double last = glfwGetTime();
        while (!glfwWindowShouldClose(m_window)) {
            glfwPollEvents();

            double now = glfwGetTime();
            float dt = static_cast<float>(now - last);
            last = now;

            int width = 0;
            int height = 0;
            glfwGetFramebufferSize(m_window, &width, &height);
            glViewport(0, 0, width, height);

            m_director->tick(dt);
            glfwSwapBuffers(m_window);
        }

        m_director->unmount();
        m_director.reset();
        glfwDestroyWindow(m_window);
        glfwTerminate();
        log(LogLevel::Info, "House Entrance Demo shut down");
        return 0;
    }

private:
    static void key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
        if (action != GLFW_PRESS) return;
        auto* app = static_cast<HouseEntranceDemo*>(glfwGetWindowUserPointer(window));
        if (app) {
            app->handle_key(key);
        }
    }

    void handle_key(int key) {
        auto& director = *m_director;
        auto& tod = director.time_of_day();

        switch (key) {
            case GLFW_KEY_ESCAPE:
                glfwSetWindowShouldClose(m_window, GLFW_TRUE);
                break;
            case GLFW_KEY_ENTER:
                director.set_show_welcome(!director.inputs().show_welcome);
                break;
            case GLFW_KEY_TAB:
                director.set_auth_mode(director.inputs().mode == camera::AuthMode::Login
                    ? camera::AuthMode::Signup : camera::AuthMode::Login);
                log(LogLevel::Info, "[Input] Form: {}", camera::auth_mode_to_string(director.inputs().mode));
                break;
            case GLFW_KEY_L:
                director.begin_login_attempt();
                break;
            case GLFW_KEY_F:
                director.login_failed();
                break;
            case GLFW_KEY_S:
                director.login_succeeded();
                break;
            case GLFW_KEY_R:
                director.set_authenticated(false);
                director.set_show_welcome(true);
                director.mount(&m_renderer);
                break;
            case GLFW_KEY_SPACE:
                if (tod.is_paused()) {
                    tod.resume();
                    log(LogLevel::Info, "[Time] Resumed");
                } else {
                    tod.pause();
                    log(LogLevel::Info, "[Time] Paused");
                }
                break;
            case GLFW_KEY_EQUAL:
            case GLFW_KEY_KP_ADD:
                tod.set_time_scale(std::min(tod.get_time_scale() * 2.0f, 32.0f));
                log(LogLevel::Info, "[Time] Speed: {:.1f}x", tod.get_time_scale());
                break;
            case GLFW_KEY_MINUS:
            case GLFW_KEY_KP_SUBTRACT:
                tod.set_time_scale(std::max(tod.get_time_scale() * 0.5f, 0.125f));
                log(LogLevel::Info, "[Time] Speed: {:.1f}x", tod.get_time_scale());
                break;
            default:
                break;
        }
    }

    GLFWwindow* m_window = nullptr;
    LoggingSceneRenderer m_renderer;
    std::unique_ptr<scene::SceneDirector> m_director;
};

int main(int argc, char** argv) {
    HouseEntranceDemo app;
    return app.run(argc, argv);
}
