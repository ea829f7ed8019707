#pragma once

// Umbrella header for porchlight::scene module
#include <porchlight/scene/door_animator.hpp>
#include <porchlight/scene/decor_scatter.hpp>
#include <porchlight/scene/scene_renderer.hpp>
#include <porchlight/scene/scene_director.hpp>
