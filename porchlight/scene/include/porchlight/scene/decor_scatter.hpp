#pragma once

#include <porchlight/core/math.hpp>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace porchlight::core {
    struct DecorSettings;
}

namespace porchlight::scene {

using namespace porchlight::core;

enum class DecorKind : uint8_t {
    Grass,
    Cobblestone
};

const char* decor_kind_to_string(DecorKind kind);

struct DecorInstance {
    DecorKind kind = DecorKind::Grass;
    Vec3 position{0.0f};
    float rotation = 0.0f;      // Radians about +Y
    float scale = 1.0f;
};

// Front yard layout. The house door sits at the origin facing +Z; the path runs
// straight out from it and splits the lawn in two.
struct DecorConfig {
    uint32_t seed = 0;                      // 0 = pick one at scatter time
    uint32_t grass_count = 240;
    uint32_t cobblestone_count = 36;

    float lawn_half_width = 12.0f;          // Lawn spans [-w, w] in x
    float yard_near_z = 1.0f;
    float yard_far_z = 14.0f;
    float path_half_width = 0.9f;           // Grass keeps out of [-p, p] in x

    float grass_scale_min = 0.6f;
    float grass_scale_max = 1.4f;
    float stone_scale_min = 0.7f;
    float stone_scale_max = 1.1f;
};

DecorConfig make_decor_config(const core::DecorSettings& settings);

struct DecorLayout {
    uint32_t seed = 0;                      // Seed that produced this layout
    std::vector<DecorInstance> instances;

    size_t count(DecorKind kind) const;
};

// Returns requested, or a fresh seed from std::random_device when it is 0
uint32_t resolve_decor_seed(uint32_t requested);

// Place grass tufts on the lawn and cobblestones along the path. The same seed
// always produces the same layout.
DecorLayout scatter_decor(const DecorConfig& config);

} // namespace porchlight::scene
