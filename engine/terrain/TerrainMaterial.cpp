#include "terrain/TerrainMaterial.hpp"
#include <cmath>

namespace Strata {

namespace {

glm::vec3 HexToColor(uint32_t hex) {
    return glm::vec3(
        static_cast<float>((hex >> 16) & 0xff) / 255.0f,
        static_cast<float>((hex >> 8) & 0xff) / 255.0f,
        static_cast<float>(hex & 0xff) / 255.0f
    );
}

} // namespace

const char* TerrainMaterialToString(TerrainMaterial material) {
    switch (material) {
        case TerrainMaterial::Snow:  return "snow";
        case TerrainMaterial::Rock:  return "rock";
        case TerrainMaterial::Grass: return "grass";
        case TerrainMaterial::Dirt:  return "dirt";
        case TerrainMaterial::Sand:  return "sand";
    }
    return "unknown";
}

glm::vec3 GetMaterialColor(TerrainMaterial material) {
    switch (material) {
        case TerrainMaterial::Snow:  return HexToColor(0xffffff);
        case TerrainMaterial::Rock:  return HexToColor(0x808080);
        case TerrainMaterial::Grass: return HexToColor(0x3a5f3a);
        case TerrainMaterial::Dirt:  return HexToColor(0x8b6635);
        case TerrainMaterial::Sand:  return HexToColor(0xc2b280);
    }
    return glm::vec3(1.0f, 0.0f, 1.0f);
}

TerrainMaterialRule::TerrainMaterialRule(const MaterialConfig& config)
    : m_config(config)
    , m_rng(config.jitterSeed)
    , m_jitter(-0.5f, 0.5f) {
}

TerrainMaterial TerrainMaterialRule::Classify(float worldY, const glm::vec3& normal) const {
    if (worldY > m_config.snowHeight) {
        return TerrainMaterial::Snow;
    }
    if (worldY > m_config.rockHeight) {
        return TerrainMaterial::Rock;
    }
    if (worldY > m_config.grassHeight) {
        const bool steep = std::abs(normal.y) < m_config.slopeThreshold;
        return steep ? TerrainMaterial::Rock : TerrainMaterial::Grass;
    }
    if (worldY > m_config.dirtHeight) {
        return TerrainMaterial::Dirt;
    }
    return TerrainMaterial::Sand;
}

glm::vec3 TerrainMaterialRule::ShadeVertex(float worldY, const glm::vec3& normal) {
    glm::vec3 color = GetMaterialColor(Classify(worldY, normal));
    if (m_config.colorJitter > 0.0f) {
        const float variation = m_jitter(m_rng) * m_config.colorJitter;
        color = glm::clamp(color + glm::vec3(variation), glm::vec3(0.0f), glm::vec3(1.0f));
    }
    return color;
}

} // namespace Strata
