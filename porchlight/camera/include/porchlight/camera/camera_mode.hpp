#pragma once

#include <cstdint>

namespace porchlight::camera {

// Which form the UI is showing
enum class AuthMode : uint8_t {
    Login,
    Signup
};

// Camera behaviour, one per UI state
enum class CameraMode : uint8_t {
    Welcome,        // Fixed wide establishing shot
    LoginFocus,     // Orbit on the +X side of the house
    SignupFocus,    // Mirror of LoginFocus on the -X side
    Authenticated   // Fixed interior shot
};

// UI state supplied by the host application
struct CameraInputs {
    AuthMode mode = AuthMode::Login;
    bool is_authenticated = false;
    bool show_welcome = true;
};

const char* auth_mode_to_string(AuthMode mode);
const char* camera_mode_to_string(CameraMode mode);

// Priority-ordered transition table:
//   1. authenticated -> Authenticated (never left again once reached)
//   2. show_welcome  -> Welcome
//   3. Login         -> LoginFocus
//   4. otherwise     -> SignupFocus
CameraMode resolve_camera_mode(const CameraInputs& inputs, CameraMode current);

} // namespace porchlight::camera
