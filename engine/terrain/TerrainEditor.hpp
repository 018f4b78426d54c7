#pragma once

#include "terrain/ChunkManager.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Strata {

/**
 * @brief Sphere brush operation
 */
enum class EditOperation : uint8_t {
    Add,        // Raise density with linear falloff
    Subtract,   // Lower density with linear falloff
    Set         // Assign strength directly, no falloff
};

[[nodiscard]] const char* EditOperationToString(EditOperation op);

/**
 * @brief Outcome of a terrain edit
 */
struct TerrainEditResult {
    std::vector<glm::ivec3> affectedChunks;
    size_t changedSamples = 0;

    [[nodiscard]] bool IsEmpty() const { return affectedChunks.empty(); }
};

/**
 * @brief Applies sphere brushes to resident chunk density and re-meshes the result
 *
 * Chunks that are not resident are skipped. Edits write to every chunk that shares a
 * boundary sample so neighbouring meshes stay seamless.
 */
class TerrainEditor {
public:
    explicit TerrainEditor(ChunkManager& chunks);

    /**
     * @brief Modify terrain inside a sphere
     * @param point Brush center in world space
     * @param radius Brush radius; values <= 0 do nothing
     * @param strength Density delta at the center, or the assigned value for Set
     * @param op Brush operation
     */
    TerrainEditResult ModifyTerrain(const glm::vec3& point, float radius, float strength, EditOperation op);

private:
    size_t ApplyToChunk(VoxelChunk& chunk, const glm::vec3& point, float radius,
                        float strength, EditOperation op) const;

    ChunkManager& m_chunks;
};

} // namespace Strata
