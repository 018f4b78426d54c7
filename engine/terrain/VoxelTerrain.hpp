#pragma once

#include "config/TerrainConfig.hpp"
#include "terrain/ChunkManager.hpp"
#include "terrain/DensityField.hpp"
#include "terrain/SurfaceQuery.hpp"
#include "terrain/TerrainEditor.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace Strata {

/**
 * @brief Streaming voxel terrain
 *
 * Features:
 * - Procedural density field with ridges, caves and floating islands
 * - Marching cubes meshing with height/slope materials
 * - Chunk streaming around a viewer with hysteresis and LOD tiers
 * - Sphere brush editing with immediate re-meshing
 * - Height and raycast queries
 *
 * Rendering is left to the host through the chunk manager callbacks.
 */
class VoxelTerrain {
public:
    /**
     * @brief Build the terrain subsystem
     * @throws std::invalid_argument if the configuration fails validation
     */
    explicit VoxelTerrain(const TerrainConfig& config = {});

    VoxelTerrain(const VoxelTerrain&) = delete;
    VoxelTerrain& operator=(const VoxelTerrain&) = delete;

    /**
     * @brief Drive streaming, queue draining and LOD
     */
    void Tick(const glm::vec3& viewerPosition, float deltaTime);

    // =========================================================================
    // Chunks
    // =========================================================================

    bool LoadChunk(int cx, int cy, int cz) { return m_chunks.LoadChunk(glm::ivec3(cx, cy, cz)); }
    bool LoadChunk(const glm::ivec3& coord) { return m_chunks.LoadChunk(coord); }

    bool UnloadChunk(int cx, int cy, int cz) { return m_chunks.UnloadChunk(glm::ivec3(cx, cy, cz)); }
    bool UnloadChunk(const glm::ivec3& coord) { return m_chunks.UnloadChunk(coord); }

    // =========================================================================
    // Editing
    // =========================================================================

    TerrainEditResult ModifyTerrain(const glm::vec3& point, float radius, float strength, EditOperation op) {
        return m_editor.ModifyTerrain(point, radius, strength, op);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] float HeightAt(float x, float z) const { return m_query.HeightAt(x, z); }

    /**
     * @brief Raycast with the configured default range
     */
    [[nodiscard]] std::optional<TerrainRaycastHit> Raycast(const glm::vec3& origin, const glm::vec3& direction) const;
    [[nodiscard]] std::optional<TerrainRaycastHit> Raycast(const glm::vec3& origin, const glm::vec3& direction,
                                                           float maxDistance) const {
        return m_query.Raycast(origin, direction, maxDistance);
    }

    /**
     * @brief Procedural density at a world position, ignoring edits
     */
    [[nodiscard]] float GetDensity(const glm::vec3& worldPos) const { return m_field.Density(worldPos); }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] ChunkManager& GetChunkManager() { return m_chunks; }
    [[nodiscard]] const ChunkManager& GetChunkManager() const { return m_chunks; }
    [[nodiscard]] const DensityField& GetDensityField() const { return m_field; }
    [[nodiscard]] const TerrainConfig& GetConfig() const { return m_config; }

private:
    TerrainConfig m_config;
    DensityField m_field;
    ChunkManager m_chunks;
    TerrainEditor m_editor;
    SurfaceQuery m_query;
};

} // namespace Strata
