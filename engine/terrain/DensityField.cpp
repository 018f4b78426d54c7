#include "terrain/DensityField.hpp"
#include <algorithm>
#include <cmath>

namespace Strata {

DensityField::DensityField(const DensityConfig& config)
    : m_config(config)
    , m_terrainNoise(config.seed)
    , m_caveNoise(config.seed * 31u + 1u)
    , m_detailNoise(config.seed * 131u + 7u) {
}

float DensityField::Density(float x, float y, float z) const noexcept {
    const DensityConfig& c = m_config;

    // Positive below the nominal ground plane
    float density = -y + c.groundLevel;

    if (c.terrainAmplitude != 0.0f) {
        const float s = c.densityScale;
        density += m_terrainNoise.Perlin(x * s, y * s * 0.5f, z * s) * c.terrainAmplitude;
    }

    if (c.ridgeAmplitude != 0.0f) {
        const float s = c.densityScale * 0.5f;
        const float ridge = std::abs(m_terrainNoise.Perlin(x * s, 0.0f, z * s));
        density += (1.0f - ridge) * c.ridgeAmplitude;
    }

    // Clamp down rather than subtract so enclosed voids open up
    if (c.caveAmplitude > 0.0f && y < c.caveCeiling) {
        const float cave = CaveNoise(x, y, z);
        if (cave < c.caveThreshold) {
            density = std::min(density, cave * c.caveAmplitude);
        }
    }

    if (c.islandAmplitude != 0.0f && y > c.islandMinHeight) {
        const float island = m_detailNoise.Perlin(x * 0.02f, y * 0.01f, z * 0.02f);
        if (island > c.islandCutoff) {
            density += (island - c.islandCutoff) * c.islandAmplitude;
        }
    }

    if (c.detailAmplitude != 0.0f) {
        const float f = c.detailFrequency;
        density += m_detailNoise.Perlin(x * f, y * f, z * f) * c.detailAmplitude;
    }

    return density;
}

glm::vec3 DensityField::Gradient(const glm::vec3& p, float h) const noexcept {
    return glm::vec3(
        Density(p.x + h, p.y, p.z) - Density(p.x - h, p.y, p.z),
        Density(p.x, p.y + h, p.z) - Density(p.x, p.y - h, p.z),
        Density(p.x, p.y, p.z + h) - Density(p.x, p.y, p.z - h)
    ) / (2.0f * h);
}

float DensityField::CaveNoise(float x, float y, float z) const noexcept {
    const float f1 = m_config.caveFrequencyPrimary;
    const float f2 = m_config.caveFrequencySecondary;
    return m_caveNoise.Perlin(x * f1, y * f1, z * f1) +
           m_caveNoise.Perlin(x * f2, y * f2, z * f2) * 0.5f;
}

} // namespace Strata
