#pragma once

// Umbrella header for porchlight::camera module
#include <porchlight/camera/camera_mode.hpp>
#include <porchlight/camera/camera_controller.hpp>
