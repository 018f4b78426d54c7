#include "terrain/MarchingCubes.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Strata {

namespace {

constexpr float kDegenerateEpsilon = 1e-6f;
constexpr float kGradientEpsilon = 1e-6f;

glm::vec3 CornerPosition(int corner) {
    const auto& offset = MarchingCubesTables::kCornerOffsets[corner];
    return glm::vec3(static_cast<float>(offset[0]),
                     static_cast<float>(offset[1]),
                     static_cast<float>(offset[2]));
}

} // namespace

MarchingCubes::MarchingCubes(const MaterialConfig& material, const TriangulationTable& table)
    : m_material(material)
    , m_table(table) {
}

int MarchingCubes::GetCubeIndex(const std::array<float, 8>& corners, float isoLevel) {
    int cubeIndex = 0;
    for (int i = 0; i < 8; ++i) {
        if (corners[i] < isoLevel) {
            cubeIndex |= (1 << i);
        }
    }
    return cubeIndex;
}

glm::vec3 MarchingCubes::InterpolateVertex(const glm::vec3& p1, const glm::vec3& p2,
                                           float v1, float v2, float isoLevel) {
    if (std::abs(v2 - v1) < kDegenerateEpsilon) {
        return (p1 + p2) * 0.5f;
    }
    const float t = glm::clamp((isoLevel - v1) / (v2 - v1), 0.0f, 1.0f);
    return p1 + t * (p2 - p1);
}

glm::vec3 MarchingCubes::CalculateNormal(const DensitySampler& sampler, const glm::vec3& pos, float step) {
    const glm::vec3 gradient(
        sampler(pos + glm::vec3(step, 0.0f, 0.0f)) - sampler(pos - glm::vec3(step, 0.0f, 0.0f)),
        sampler(pos + glm::vec3(0.0f, step, 0.0f)) - sampler(pos - glm::vec3(0.0f, step, 0.0f)),
        sampler(pos + glm::vec3(0.0f, 0.0f, step)) - sampler(pos - glm::vec3(0.0f, 0.0f, step))
    );

    const float length = glm::length(gradient);
    if (!(length > kGradientEpsilon)) {
        return glm::vec3(0.0f, 1.0f, 0.0f);
    }
    // Density grows into the solid, so the outward normal is the negated gradient
    return -gradient / length;
}

int MarchingCubes::PolygonizeCube(const std::array<float, 8>& corners, float isoLevel,
                                  std::array<glm::vec3, MAX_CUBE_VERTICES>& vertices) {
    const int cubeIndex = GetCubeIndex(corners, isoLevel);
    if (cubeIndex == 0 || cubeIndex == 255) {
        return 0;
    }

    const uint16_t edgeMask = (*m_table.edges)[cubeIndex];
    const auto& row = (*m_table.triangles)[cubeIndex];

    // Reject rows that are empty or reference edges the surface does not cross
    bool valid = edgeMask != 0 && row[0] != -1;
    int count = 0;
    for (; valid && count < MAX_CUBE_VERTICES && row[count] != -1; ++count) {
        const int edge = row[count];
        if (edge < 0 || edge >= 12 || (edgeMask & (1 << edge)) == 0) {
            valid = false;
        }
    }
    if (valid && count % 3 != 0) {
        valid = false;
    }

    if (!valid) {
        if (!m_reportedMissing.test(static_cast<size_t>(cubeIndex))) {
            m_reportedMissing.set(static_cast<size_t>(cubeIndex));
            spdlog::warn("MarchingCubes: no triangulation for cube configuration {}", cubeIndex);
        }
        return 0;
    }

    std::array<glm::vec3, 12> edgeVertices{};
    for (int edge = 0; edge < 12; ++edge) {
        if (edgeMask & (1 << edge)) {
            const int a = MarchingCubesTables::kEdgeCorners[edge][0];
            const int b = MarchingCubesTables::kEdgeCorners[edge][1];
            edgeVertices[edge] = InterpolateVertex(CornerPosition(a), CornerPosition(b),
                                                   corners[a], corners[b], isoLevel);
        }
    }

    for (int i = 0; i < count; ++i) {
        vertices[i] = edgeVertices[row[i]];
    }
    return count;
}

void MarchingCubes::GenerateMesh(VoxelChunk& chunk, float isoLevel, const DensitySampler& sampler) {
    ChunkMesh mesh;

    const int size = chunk.GetSize();
    const float voxelSize = chunk.GetVoxelSize();
    const glm::vec3 origin = chunk.GetWorldOrigin();
    const float normalStep = m_material.GetConfig().normalStep;

    std::array<float, 8> corners{};
    std::array<glm::vec3, MAX_CUBE_VERTICES> cubeVertices{};

    for (int z = 0; z < size; ++z) {
        for (int y = 0; y < size; ++y) {
            for (int x = 0; x < size; ++x) {
                for (int c = 0; c < 8; ++c) {
                    const auto& offset = MarchingCubesTables::kCornerOffsets[c];
                    corners[c] = chunk.GetDensity(x + offset[0], y + offset[1], z + offset[2]);
                }

                const int count = PolygonizeCube(corners, isoLevel, cubeVertices);
                if (count == 0) {
                    continue;
                }

                const glm::vec3 cell(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));
                for (int i = 0; i < count; ++i) {
                    const glm::vec3 position = origin + (cell + cubeVertices[i]) * voxelSize;
                    const glm::vec3 normal = CalculateNormal(sampler, position, normalStep);

                    mesh.indices.push_back(static_cast<uint32_t>(mesh.positions.size()));
                    mesh.positions.push_back(position);
                    mesh.normals.push_back(normal);
                    mesh.colors.push_back(m_material.ShadeVertex(position.y, normal));
                }
            }
        }
    }

    chunk.SetMesh(std::move(mesh));
    chunk.SetDirty(false);
}

} // namespace Strata
