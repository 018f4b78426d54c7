#pragma once

#include "config/TerrainConfig.hpp"
#include "terrain/MarchingCubesTables.hpp"
#include "terrain/TerrainMaterial.hpp"
#include "terrain/VoxelChunk.hpp"
#include <glm/glm.hpp>
#include <array>
#include <bitset>
#include <functional>

namespace Strata {

/**
 * @brief Scalar field callback used for gradient normals
 */
using DensitySampler = std::function<float(const glm::vec3&)>;

/**
 * @brief Edge and triangle lookup tables driving polygonization
 *
 * Rows of the triangle table list edge indices in groups of three, terminated by -1.
 */
struct TriangulationTable {
    const std::array<uint16_t, 256>* edges = &MarchingCubesTables::kEdgeTable;
    const std::array<std::array<int8_t, 16>, 256>* triangles = &MarchingCubesTables::kTriTable;
};

/**
 * @brief Marching cubes isosurface extractor
 *
 * A corner lies outside the surface when its density is below the iso level.
 * Configurations 0 and 255 emit nothing. A configuration the table cannot
 * triangulate also emits nothing and is logged once per mesher.
 */
class MarchingCubes {
public:
    /// Maximum vertices a single cube can emit (five triangles)
    static constexpr int MAX_CUBE_VERTICES = 15;

    explicit MarchingCubes(const MaterialConfig& material = {},
                           const TriangulationTable& table = {});

    /**
     * @brief Rebuild a chunk's mesh from its density grid
     *
     * Vertices are placed in world space. Normals are the normalized negative
     * gradient of @p sampler; a vanishing gradient falls back to +Y. The chunk's
     * dirty flag is cleared once the new mesh is installed.
     */
    void GenerateMesh(VoxelChunk& chunk, float isoLevel, const DensitySampler& sampler);

    /**
     * @brief Triangulate one cube
     * @param corners Densities at the eight corners, in table corner order
     * @param vertices Receives cube-local vertex positions in [0, 1]^3
     * @return Number of vertices written, always a multiple of three
     */
    int PolygonizeCube(const std::array<float, 8>& corners, float isoLevel,
                       std::array<glm::vec3, MAX_CUBE_VERTICES>& vertices);

    /**
     * @brief Corner configuration index (bit i set when corner i is below iso)
     */
    [[nodiscard]] static int GetCubeIndex(const std::array<float, 8>& corners, float isoLevel);

    /**
     * @brief Point on a cube edge where the linear interpolant crosses the iso level
     *
     * Falls back to the edge midpoint when both densities are numerically equal.
     */
    [[nodiscard]] static glm::vec3 InterpolateVertex(const glm::vec3& p1, const glm::vec3& p2,
                                                     float v1, float v2, float isoLevel);

    /**
     * @brief Unit surface normal from a density sampler
     */
    [[nodiscard]] static glm::vec3 CalculateNormal(const DensitySampler& sampler,
                                                   const glm::vec3& pos, float step);

    /**
     * @brief Number of distinct configurations reported as untriangulatable
     */
    [[nodiscard]] size_t GetMissingConfigurationCount() const { return m_reportedMissing.count(); }

    [[nodiscard]] TerrainMaterialRule& GetMaterialRule() { return m_material; }

private:
    TerrainMaterialRule m_material;
    TriangulationTable m_table;
    std::bitset<256> m_reportedMissing;
};

} // namespace Strata
