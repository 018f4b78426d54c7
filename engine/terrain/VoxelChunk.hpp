#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace Strata {

/**
 * @brief Streaming state of a chunk coordinate
 */
enum class ChunkState : uint8_t {
    Absent,
    QueuedLoad,
    Loaded,
    Dirty,
    QueuedUnload
};

/**
 * @brief Render detail tier, a pure function of viewer distance
 */
enum class LodLevel : uint8_t {
    Full,       // Full detail
    Reduced,    // Same geometry drawn at reduced detail (wireframe)
    Hidden      // Resident and editable but not drawn
};

[[nodiscard]] const char* ChunkStateToString(ChunkState state);
[[nodiscard]] const char* LodLevelToString(LodLevel lod);

/**
 * @brief Triangle soup produced by the mesher, in world space
 */
struct ChunkMesh {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec3> colors;
    std::vector<uint32_t> indices;

    [[nodiscard]] bool IsEmpty() const { return indices.empty(); }
    [[nodiscard]] size_t GetTriangleCount() const { return indices.size() / 3; }
    [[nodiscard]] size_t GetVertexCount() const { return positions.size(); }

    void Clear();
};

/**
 * @brief Cubic region of N^3 voxels backed by an (N+1)^3 density sample grid
 *
 * Neighbouring chunks duplicate their shared boundary samples so each chunk can be
 * meshed on its own.
 */
class VoxelChunk {
public:
    VoxelChunk(const glm::ivec3& coord, int size, float voxelSize);

    [[nodiscard]] const glm::ivec3& GetCoord() const { return m_coord; }
    [[nodiscard]] int GetSize() const { return m_size; }
    [[nodiscard]] int GetSamplesPerAxis() const { return m_size + 1; }
    [[nodiscard]] float GetVoxelSize() const { return m_voxelSize; }

    // =========================================================================
    // Density Samples
    // =========================================================================

    [[nodiscard]] float GetDensity(int x, int y, int z) const { return m_density[GetIndex(x, y, z)]; }
    void SetDensity(int x, int y, int z, float density) { m_density[GetIndex(x, y, z)] = density; }

    [[nodiscard]] std::vector<float>& GetSamples() { return m_density; }
    [[nodiscard]] const std::vector<float>& GetSamples() const { return m_density; }

    /**
     * @brief Set every sample to one value
     */
    void Fill(float density);

    /**
     * @brief Trilinear sample at a world position, clamped to the chunk's grid
     */
    [[nodiscard]] float SampleDensity(const glm::vec3& worldPos) const;

    /**
     * @brief World position of a grid sample
     */
    [[nodiscard]] glm::vec3 GetSamplePosition(int x, int y, int z) const;

    [[nodiscard]] int GetIndex(int x, int y, int z) const {
        const int n = m_size + 1;
        return x + y * n + z * n * n;
    }

    // =========================================================================
    // Bounds
    // =========================================================================

    [[nodiscard]] glm::vec3 GetWorldOrigin() const;
    [[nodiscard]] glm::vec3 GetBoundsMax() const;
    [[nodiscard]] glm::vec3 GetCenter() const;

    /**
     * @brief Sphere test against the chunk bounds (closest point method)
     */
    [[nodiscard]] bool IntersectsSphere(const glm::vec3& center, float radius) const;

    // =========================================================================
    // Mesh
    // =========================================================================

    [[nodiscard]] const ChunkMesh& GetMesh() const { return m_mesh; }
    void SetMesh(ChunkMesh&& mesh) { m_mesh = std::move(mesh); }
    void ReleaseMesh();

    /**
     * @brief Dirty chunks hold density that no longer matches their mesh
     */
    [[nodiscard]] bool IsDirty() const { return m_dirty; }
    void SetDirty(bool dirty) { m_dirty = dirty; }

    /**
     * @brief Edited chunks hold density that differs from the procedural field
     */
    [[nodiscard]] bool IsEdited() const { return m_edited; }
    void SetEdited(bool edited) { m_edited = edited; }

    [[nodiscard]] LodLevel GetLod() const { return m_lod; }
    void SetLod(LodLevel lod) { m_lod = lod; }

private:
    glm::ivec3 m_coord;
    int m_size;
    float m_voxelSize;
    std::vector<float> m_density;
    ChunkMesh m_mesh;
    bool m_dirty = true;
    bool m_edited = false;
    LodLevel m_lod = LodLevel::Full;
};

} // namespace Strata
