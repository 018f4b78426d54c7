#pragma once

#include "config/TerrainConfig.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <random>

namespace Strata {

/**
 * @brief Surface material bands
 */
enum class TerrainMaterial : uint8_t {
    Snow,
    Rock,
    Grass,
    Dirt,
    Sand
};

[[nodiscard]] const char* TerrainMaterialToString(TerrainMaterial material);

/**
 * @brief Base color of a material, linear RGB in [0, 1]
 */
[[nodiscard]] glm::vec3 GetMaterialColor(TerrainMaterial material);

/**
 * @brief Deterministic height/slope material rule with optional color jitter
 */
class TerrainMaterialRule {
public:
    explicit TerrainMaterialRule(const MaterialConfig& config = {});

    /**
     * @brief Pick the material for a surface point
     * @param worldY Height of the point
     * @param normal Unit surface normal, used to detect steep slopes in the grass band
     */
    [[nodiscard]] TerrainMaterial Classify(float worldY, const glm::vec3& normal) const;

    /**
     * @brief Material color with a small random brightness jitter
     */
    [[nodiscard]] glm::vec3 ShadeVertex(float worldY, const glm::vec3& normal);

    [[nodiscard]] const MaterialConfig& GetConfig() const { return m_config; }

private:
    MaterialConfig m_config;
    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_jitter;
};

} // namespace Strata
