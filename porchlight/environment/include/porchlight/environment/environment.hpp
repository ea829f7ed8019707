#pragma once

// Umbrella header for porchlight::environment module
#include <porchlight/environment/curve.hpp>
#include <porchlight/environment/color_gradient.hpp>
#include <porchlight/environment/lighting_model.hpp>
#include <porchlight/environment/time_of_day.hpp>
#include <porchlight/environment/scene_cues.hpp>
