#include <porchlight/camera/camera_mode.hpp>

namespace porchlight::camera {

const char* auth_mode_to_string(AuthMode mode) {
    switch (mode) {
        case AuthMode::Login: return "Login";
        case AuthMode::Signup: return "Signup";
        default: return "Unknown";
    }
}

const char* camera_mode_to_string(CameraMode mode) {
    switch (mode) {
        case CameraMode::Welcome: return "Welcome";
        case CameraMode::LoginFocus: return "LoginFocus";
        case CameraMode::SignupFocus: return "SignupFocus";
        case CameraMode::Authenticated: return "Authenticated";
        default: return "Unknown";
    }
}

CameraMode resolve_camera_mode(const CameraInputs& inputs, CameraMode current) {
    if (current == CameraMode::Authenticated || inputs.is_authenticated) {
        return CameraMode::Authenticated;
    }
    if (inputs.show_welcome) {
        return CameraMode::Welcome;
    }
    return inputs.mode == AuthMode::Login ? CameraMode::LoginFocus : CameraMode::SignupFocus;
}

} // namespace porchlight::camera
