#pragma once

// Umbrella header for porchlight::core module
#include <porchlight/core/log.hpp>
#include <porchlight/core/math.hpp>
#include <porchlight/core/color.hpp>
#include <porchlight/core/filesystem.hpp>
#include <porchlight/core/project_settings.hpp>
