#include <porchlight/scene/decor_scatter.hpp>
#include <porchlight/core/project_settings.hpp>
#include <porchlight/core/log.hpp>
#include <algorithm>
#include <random>

namespace porchlight::scene {

const char* decor_kind_to_string(DecorKind kind) {
    switch (kind) {
        case DecorKind::Grass: return "Grass";
        case DecorKind::Cobblestone: return "Cobblestone";
        default: return "Unknown";
    }
}

static uint32_t capped_count(const char* name, uint32_t requested) {
    if (requested > core::DecorSettings::MAX_COUNT) {
        core::log(core::LogLevel::Warn, "[Scene] {} count {} capped at {}",
                  name, requested, core::DecorSettings::MAX_COUNT);
        return core::DecorSettings::MAX_COUNT;
    }
    return requested;
}

DecorConfig make_decor_config(const core::DecorSettings& settings) {
    DecorConfig config;
    config.seed = settings.seed;
    config.grass_count = capped_count("Grass", settings.grass_count);
    config.cobblestone_count = capped_count("Cobblestone", settings.cobblestone_count);
    return config;
}

size_t DecorLayout::count(DecorKind kind) const {
    return static_cast<size_t>(std::count_if(instances.begin(), instances.end(),
        [kind](const DecorInstance& instance) { return instance.kind == kind; }));
}

uint32_t resolve_decor_seed(uint32_t requested) {
    if (requested != 0) {
        return requested;
    }

    std::random_device rd;
    uint32_t seed = 0;
    while (seed == 0) {
        seed = rd();
    }
    return seed;
}

DecorLayout scatter_decor(const DecorConfig& config) {
    DecorLayout layout;
    layout.seed = resolve_decor_seed(config.seed);
    layout.instances.reserve(static_cast<size_t>(config.grass_count) + config.cobblestone_count);

    std::mt19937 gen(layout.seed);
    std::uniform_real_distribution<float> unit_dist(0.0f, 1.0f);
    std::uniform_real_distribution<float> angle_dist(0.0f, 6.28318f);
    std::bernoulli_distribution side_dist(0.5);

    float near_z = std::min(config.yard_near_z, config.yard_far_z);
    float far_z = std::max(config.yard_near_z, config.yard_far_z);
    float path = std::max(0.0f, config.path_half_width);
    float lawn = std::max(path, config.lawn_half_width);

    // Grass: uniform over the lawn on either side of the path
    for (uint32_t i = 0; i < config.grass_count; ++i) {
        float side = side_dist(gen) ? 1.0f : -1.0f;
        float x = side * (path + unit_dist(gen) * (lawn - path));
        float z = near_z + unit_dist(gen) * (far_z - near_z);

        DecorInstance instance;
        instance.kind = DecorKind::Grass;
        instance.position = Vec3(x, 0.0f, z);
        instance.rotation = angle_dist(gen);
        instance.scale = config.grass_scale_min + unit_dist(gen) * (config.grass_scale_max - config.grass_scale_min);
        layout.instances.push_back(instance);
    }

    // Cobblestones: one per slot along the path, jittered inside the slot
    if (config.cobblestone_count > 0) {
        float slot = (far_z - near_z) / static_cast<float>(config.cobblestone_count);
        for (uint32_t i = 0; i < config.cobblestone_count; ++i) {
            float x = (unit_dist(gen) * 2.0f - 1.0f) * path * 0.6f;
            float z = near_z + (static_cast<float>(i) + 0.2f + unit_dist(gen) * 0.6f) * slot;

            DecorInstance instance;
            instance.kind = DecorKind::Cobblestone;
            instance.position = Vec3(x, 0.0f, z);
            instance.rotation = angle_dist(gen);
            instance.scale = config.stone_scale_min + unit_dist(gen) * (config.stone_scale_max - config.stone_scale_min);
            layout.instances.push_back(instance);
        }
    }

    core::log(core::LogLevel::Info, "[Scene] Scattered {} grass and {} cobblestones (seed {})",
              config.grass_count, config.cobblestone_count, layout.seed);
    return layout;
}

} // namespace porchlight::scene
