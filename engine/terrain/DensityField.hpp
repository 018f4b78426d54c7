#pragma once

#include "config/TerrainConfig.hpp"
#include "terrain/NoiseGenerator.hpp"
#include <glm/glm.hpp>

namespace Strata {

/**
 * @brief Procedural signed density field
 *
 * Density is positive inside solid terrain and negative in open air. Only the sign
 * relative to the iso level is meaningful; values are never clamped.
 *
 * Terms, in order: planar bias, macro terrain noise, ridges, cave carving,
 * floating islands above a height threshold, and high-frequency detail.
 */
class DensityField {
public:
    explicit DensityField(const DensityConfig& config = {});

    /**
     * @brief Evaluate density at a world position
     */
    [[nodiscard]] float Density(float x, float y, float z) const noexcept;
    [[nodiscard]] float Density(const glm::vec3& p) const noexcept { return Density(p.x, p.y, p.z); }

    /**
     * @brief Central-difference gradient (six evaluations)
     */
    [[nodiscard]] glm::vec3 Gradient(const glm::vec3& p, float h) const noexcept;

    [[nodiscard]] const DensityConfig& GetConfig() const noexcept { return m_config; }

private:
    [[nodiscard]] float CaveNoise(float x, float y, float z) const noexcept;

    DensityConfig m_config;
    NoiseGenerator m_terrainNoise;
    NoiseGenerator m_caveNoise;
    NoiseGenerator m_detailNoise;
};

} // namespace Strata
