#include "terrain/VoxelTerrain.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Strata {

namespace {

const TerrainConfig& RequireValid(const TerrainConfig& config) {
    const std::string error = ValidateTerrainConfig(config);
    if (!error.empty()) {
        throw std::invalid_argument("Invalid terrain config: " + error);
    }
    return config;
}

} // namespace

VoxelTerrain::VoxelTerrain(const TerrainConfig& config)
    : m_config(RequireValid(config))
    , m_field(m_config.density)
    , m_chunks(m_config, [this](const glm::vec3& p) { return m_field.Density(p); })
    , m_editor(m_chunks)
    , m_query(m_field, m_config) {
    spdlog::info("VoxelTerrain: seed {}, chunk size {}, voxel size {}, render distance {}",
                 m_config.density.seed, m_config.streaming.chunkSize,
                 m_config.streaming.voxelSize, m_config.streaming.renderDistance);
}

void VoxelTerrain::Tick(const glm::vec3& viewerPosition, float deltaTime) {
    m_chunks.Tick(viewerPosition, deltaTime);
}

std::optional<TerrainRaycastHit> VoxelTerrain::Raycast(const glm::vec3& origin, const glm::vec3& direction) const {
    return m_query.Raycast(origin, direction, m_config.query.defaultRaycastDistance);
}

} // namespace Strata
