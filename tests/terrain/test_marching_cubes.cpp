/**
 * @file test_marching_cubes.cpp
 * @brief Unit tests for cube polygonization, chunk meshing and vertex materials
 */

#include <gtest/gtest.h>

#include "terrain/MarchingCubes.hpp"
#include "terrain/TerrainMaterial.hpp"
#include "terrain/VoxelChunk.hpp"

#include "utils/TestHelpers.hpp"

#include <array>
#include <cmath>

using namespace Strata;
using namespace Strata::Test;

namespace {

std::array<float, 8> CornersForConfiguration(int configuration) {
    std::array<float, 8> corners{};
    for (int i = 0; i < 8; ++i) {
        corners[i] = (configuration & (1 << i)) ? -1.0f : 1.0f;
    }
    return corners;
}

void FillChunk(VoxelChunk& chunk, const DensitySampler& sampler) {
    const int samples = chunk.GetSamplesPerAxis();
    for (int z = 0; z < samples; ++z) {
        for (int y = 0; y < samples; ++y) {
            for (int x = 0; x < samples; ++x) {
                chunk.SetDensity(x, y, z, sampler(chunk.GetSamplePosition(x, y, z)));
            }
        }
    }
}

} // namespace

// =============================================================================
// Cube Polygonization Tests
// =============================================================================

class MarchingCubesTest : public ::testing::Test {
protected:
    MaterialConfig material = MakeFlatConfig().material;
    MarchingCubes mesher{material};
    std::array<glm::vec3, MarchingCubes::MAX_CUBE_VERTICES> vertices{};
};

TEST_F(MarchingCubesTest, CubeIndexSetsBitsForCornersBelowIso) {
    EXPECT_EQ(0, MarchingCubes::GetCubeIndex(CornersForConfiguration(0), 0.0f));
    EXPECT_EQ(255, MarchingCubes::GetCubeIndex(CornersForConfiguration(255), 0.0f));
    EXPECT_EQ(0x5a, MarchingCubes::GetCubeIndex(CornersForConfiguration(0x5a), 0.0f));

    // A corner exactly at the iso level counts as inside
    std::array<float, 8> atIso{};
    EXPECT_EQ(0, MarchingCubes::GetCubeIndex(atIso, 0.0f));
}

TEST_F(MarchingCubesTest, UniformCubesEmitNothing) {
    EXPECT_EQ(0, mesher.PolygonizeCube(CornersForConfiguration(0), 0.0f, vertices));
    EXPECT_EQ(0, mesher.PolygonizeCube(CornersForConfiguration(255), 0.0f, vertices));
}

TEST_F(MarchingCubesTest, EveryMixedConfigurationProducesTriangles) {
    for (int configuration = 1; configuration < 255; ++configuration) {
        const int count = mesher.PolygonizeCube(CornersForConfiguration(configuration), 0.0f, vertices);

        ASSERT_GT(count, 0) << "configuration " << configuration;
        EXPECT_LE(count, MarchingCubes::MAX_CUBE_VERTICES) << "configuration " << configuration;
        EXPECT_EQ(0, count % 3) << "configuration " << configuration;

        // Densities of +-1 put every vertex at the midpoint of a cube edge
        for (int i = 0; i < count; ++i) {
            const glm::vec3& v = vertices[i];
            int onFace = 0;
            int atMidpoint = 0;
            for (int axis = 0; axis < 3; ++axis) {
                if (v[axis] == 0.0f || v[axis] == 1.0f) ++onFace;
                if (v[axis] == 0.5f) ++atMidpoint;
            }
            EXPECT_EQ(2, onFace) << "configuration " << configuration;
            EXPECT_EQ(1, atMidpoint) << "configuration " << configuration;
        }
    }
    EXPECT_EQ(0u, mesher.GetMissingConfigurationCount());
}

TEST_F(MarchingCubesTest, InterpolatesToIsoCrossing) {
    const glm::vec3 p = MarchingCubes::InterpolateVertex(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f),
                                                         1.0f, -3.0f, 0.0f);
    EXPECT_VEC3_NEAR(glm::vec3(0.25f, 0.0f, 0.0f), p, 1e-6f);
}

TEST_F(MarchingCubesTest, DegenerateEdgeFallsBackToMidpoint) {
    const glm::vec3 p = MarchingCubes::InterpolateVertex(glm::vec3(0.0f), glm::vec3(0.0f, 2.0f, 0.0f),
                                                         0.5f, 0.5f, 0.5f);
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 1.0f, 0.0f), p);
    EXPECT_FALSE(std::isnan(p.y));
}

TEST_F(MarchingCubesTest, MissingTriangulationIsSkippedAndReportedOnce) {
    static std::array<std::array<int8_t, 16>, 256> brokenTriangles = MarchingCubesTables::kTriTable;
    brokenTriangles[1].fill(-1);

    TriangulationTable table;
    table.triangles = &brokenTriangles;
    MarchingCubes broken(material, table);

    EXPECT_EQ(0, broken.PolygonizeCube(CornersForConfiguration(1), 0.0f, vertices));
    EXPECT_EQ(0, broken.PolygonizeCube(CornersForConfiguration(1), 0.0f, vertices));
    EXPECT_EQ(1u, broken.GetMissingConfigurationCount());

    // Other configurations are unaffected
    EXPECT_GT(broken.PolygonizeCube(CornersForConfiguration(2), 0.0f, vertices), 0);
}

TEST_F(MarchingCubesTest, NormalFallsBackToUpOnFlatGradient) {
    const DensitySampler constant = [](const glm::vec3&) { return 1.0f; };
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 1.0f, 0.0f), MarchingCubes::CalculateNormal(constant, glm::vec3(3.0f), 0.01f));
}

// =============================================================================
// Chunk Meshing Tests
// =============================================================================

TEST_F(MarchingCubesTest, FlatTerrainMeshesAPlaneAtGroundLevel) {
    const DensitySampler flat = [](const glm::vec3& p) { return 30.0f - p.y; };

    VoxelChunk chunk(glm::ivec3(0, 1, 0), 16, 1.0f);
    FillChunk(chunk, flat);
    ASSERT_TRUE(chunk.IsDirty());

    mesher.GenerateMesh(chunk, 0.0f, flat);
    const ChunkMesh& mesh = chunk.GetMesh();

    EXPECT_FALSE(chunk.IsDirty());
    EXPECT_EQ(512u, mesh.GetTriangleCount());
    ASSERT_EQ(mesh.positions.size(), mesh.normals.size());
    ASSERT_EQ(mesh.positions.size(), mesh.colors.size());

    const glm::vec3 dirt = GetMaterialColor(TerrainMaterial::Dirt);
    for (size_t i = 0; i < mesh.positions.size(); ++i) {
        EXPECT_EQ(30.0f, mesh.positions[i].y);
        EXPECT_GE(mesh.positions[i].x, 0.0f);
        EXPECT_LE(mesh.positions[i].x, 16.0f);
        EXPECT_VEC3_NEAR(glm::vec3(0.0f, 1.0f, 0.0f), mesh.normals[i], 1e-3f);
        EXPECT_VEC3_EQ(dirt, mesh.colors[i]);
    }
    for (uint32_t index : mesh.indices) {
        EXPECT_LT(index, mesh.positions.size());
    }
}

TEST_F(MarchingCubesTest, ChunkWithoutSurfaceHasEmptyMesh) {
    const DensitySampler flat = [](const glm::vec3& p) { return 30.0f - p.y; };

    VoxelChunk buried(glm::ivec3(0, -1, 0), 8, 1.0f);
    FillChunk(buried, flat);
    mesher.GenerateMesh(buried, 0.0f, flat);

    EXPECT_TRUE(buried.GetMesh().IsEmpty());
    EXPECT_FALSE(buried.IsDirty());
}

TEST_F(MarchingCubesTest, SphereNormalsPointOutward) {
    const glm::vec3 center(8.0f, 8.0f, 8.0f);
    const DensitySampler sphere = [center](const glm::vec3& p) { return 5.3f - glm::length(p - center); };

    VoxelChunk chunk(glm::ivec3(0), 16, 1.0f);
    FillChunk(chunk, sphere);
    mesher.GenerateMesh(chunk, 0.0f, sphere);
    const ChunkMesh& mesh = chunk.GetMesh();

    ASSERT_FALSE(mesh.IsEmpty());
    for (size_t i = 0; i < mesh.positions.size(); ++i) {
        const glm::vec3 radial = mesh.positions[i] - center;
        EXPECT_NEAR(5.3f, glm::length(radial), 0.25f);
        EXPECT_NEAR(1.0f, glm::length(mesh.normals[i]), 1e-4f);
        EXPECT_GT(glm::dot(mesh.normals[i], radial), 0.0f);
    }
    for (size_t t = 0; t < mesh.GetTriangleCount(); ++t) {
        EXPECT_GT(glm::length(TriangleCross(mesh, t)), 0.0f);
    }
}

TEST_F(MarchingCubesTest, VoxelSizeScalesWorldPositions) {
    const DensitySampler flat = [](const glm::vec3& p) { return 30.0f - p.y; };

    VoxelChunk chunk(glm::ivec3(1, 1, 0), 8, 2.0f);
    EXPECT_VEC3_EQ(glm::vec3(16.0f, 16.0f, 0.0f), chunk.GetWorldOrigin());

    FillChunk(chunk, flat);
    mesher.GenerateMesh(chunk, 0.0f, flat);

    ASSERT_FALSE(chunk.GetMesh().IsEmpty());
    for (const auto& p : chunk.GetMesh().positions) {
        EXPECT_NEAR(30.0f, p.y, 1e-4f);
        EXPECT_GE(p.x, 16.0f);
        EXPECT_LE(p.x, 32.0f);
    }
}

// =============================================================================
// Material Rule Tests
// =============================================================================

TEST(TerrainMaterialRuleTest, HeightBands) {
    MaterialConfig config;
    config.colorJitter = 0.0f;
    TerrainMaterialRule rule(config);
    const glm::vec3 up(0.0f, 1.0f, 0.0f);

    EXPECT_EQ(TerrainMaterial::Snow, rule.Classify(81.0f, up));
    EXPECT_EQ(TerrainMaterial::Rock, rule.Classify(61.0f, up));
    EXPECT_EQ(TerrainMaterial::Grass, rule.Classify(31.0f, up));
    EXPECT_EQ(TerrainMaterial::Dirt, rule.Classify(21.0f, up));
    EXPECT_EQ(TerrainMaterial::Sand, rule.Classify(20.0f, up));
    EXPECT_EQ(TerrainMaterial::Sand, rule.Classify(-50.0f, up));
}

TEST(TerrainMaterialRuleTest, SteepGrassBecomesRock) {
    TerrainMaterialRule rule;
    EXPECT_EQ(TerrainMaterial::Rock, rule.Classify(40.0f, glm::vec3(1.0f, 0.0f, 0.0f)));
    EXPECT_EQ(TerrainMaterial::Grass, rule.Classify(40.0f, glm::normalize(glm::vec3(0.2f, 1.0f, 0.0f))));
}

TEST(TerrainMaterialRuleTest, JitterIsBoundedAndSeeded) {
    MaterialConfig config;
    config.colorJitter = 0.1f;
    config.jitterSeed = 99;
    TerrainMaterialRule a(config);
    TerrainMaterialRule b(config);

    const glm::vec3 up(0.0f, 1.0f, 0.0f);
    const glm::vec3 base = GetMaterialColor(TerrainMaterial::Grass);
    for (int i = 0; i < 100; ++i) {
        const glm::vec3 color = a.ShadeVertex(40.0f, up);
        EXPECT_VEC3_EQ(color, b.ShadeVertex(40.0f, up));
        EXPECT_VEC3_NEAR(base, color, 0.05f + 1e-5f);
    }
}
