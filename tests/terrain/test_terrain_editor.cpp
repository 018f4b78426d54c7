/**
 * @file test_terrain_editor.cpp
 * @brief Unit tests for sphere brush edits on resident chunks
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "terrain/ChunkManager.hpp"
#include "terrain/TerrainEditor.hpp"

#include "utils/TestHelpers.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace Strata;
using namespace Strata::Test;
using ::testing::_;

class TerrainEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = MakeSmallStreamingConfig();
        manager = std::make_unique<ChunkManager>(config, [](const glm::vec3& p) { return 4.0f - p.y; });
        editor = std::make_unique<TerrainEditor>(*manager);
        ASSERT_TRUE(manager->LoadChunk(glm::ivec3(0, 0, 0)));
    }

    VoxelChunk& Origin() { return *manager->GetChunk(glm::ivec3(0, 0, 0)); }

    TerrainConfig config;
    std::unique_ptr<ChunkManager> manager;
    std::unique_ptr<TerrainEditor> editor;
};

TEST_F(TerrainEditorTest, NonPositiveRadiusDoesNothing) {
    const std::vector<float> before = Origin().GetSamples();

    EXPECT_TRUE(editor->ModifyTerrain(glm::vec3(4.0f), 0.0f, 5.0f, EditOperation::Add).IsEmpty());
    EXPECT_TRUE(editor->ModifyTerrain(glm::vec3(4.0f), -2.0f, 5.0f, EditOperation::Set).IsEmpty());

    EXPECT_EQ(before, Origin().GetSamples());
    EXPECT_FALSE(Origin().IsEdited());
}

TEST_F(TerrainEditorTest, AddAppliesLinearFalloff) {
    const TerrainEditResult result = editor->ModifyTerrain(glm::vec3(4.0f), 3.0f, 2.0f, EditOperation::Add);

    ASSERT_EQ(1u, result.affectedChunks.size());
    EXPECT_EQ(glm::ivec3(0, 0, 0), result.affectedChunks[0]);
    EXPECT_GT(result.changedSamples, 0u);

    EXPECT_NEAR(2.0f, Origin().GetDensity(4, 4, 4), 1e-6f);
    EXPECT_NEAR(2.0f * (1.0f - 1.0f / 3.0f), Origin().GetDensity(5, 4, 4), 1e-6f);
    EXPECT_NEAR(-1.0f + 2.0f * (1.0f - 1.0f / 3.0f), Origin().GetDensity(4, 5, 4), 1e-6f);

    // On the sphere surface the falloff is zero, beyond it nothing changes
    EXPECT_FLOAT_EQ(0.0f, Origin().GetDensity(7, 4, 4));
    EXPECT_FLOAT_EQ(0.0f, Origin().GetDensity(8, 4, 4));
}

TEST_F(TerrainEditorTest, AddThenSubtractRestoresDensity) {
    const std::vector<float> before = Origin().GetSamples();

    editor->ModifyTerrain(glm::vec3(3.5f, 4.2f, 4.8f), 3.0f, 2.5f, EditOperation::Add);
    editor->ModifyTerrain(glm::vec3(3.5f, 4.2f, 4.8f), 3.0f, 2.5f, EditOperation::Subtract);

    const std::vector<float>& after = Origin().GetSamples();
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_NEAR(before[i], after[i], 1e-5f);
    }
}

TEST_F(TerrainEditorTest, SetAssignsStrengthWithoutFalloff) {
    const TerrainEditResult result = editor->ModifyTerrain(glm::vec3(4.0f), 2.0f, 7.0f, EditOperation::Set);

    // Lattice points within distance 2 of a lattice point
    EXPECT_EQ(33u, result.changedSamples);
    EXPECT_FLOAT_EQ(7.0f, Origin().GetDensity(4, 4, 4));
    EXPECT_FLOAT_EQ(7.0f, Origin().GetDensity(6, 4, 4));
    EXPECT_FLOAT_EQ(7.0f, Origin().GetDensity(5, 5, 4));
    EXPECT_FLOAT_EQ(0.0f, Origin().GetDensity(7, 4, 4));
}

TEST_F(TerrainEditorTest, NonResidentChunksAreSkipped) {
    const TerrainEditResult result = editor->ModifyTerrain(glm::vec3(8.0f, 4.0f, 4.0f), 3.0f, 2.0f, EditOperation::Add);

    ASSERT_EQ(1u, result.affectedChunks.size());
    EXPECT_EQ(glm::ivec3(0, 0, 0), result.affectedChunks[0]);
    EXPECT_FALSE(manager->IsLoaded(glm::ivec3(1, 0, 0)));
}

TEST_F(TerrainEditorTest, SharedBoundarySamplesStayInSync) {
    ASSERT_TRUE(manager->LoadChunk(glm::ivec3(1, 0, 0)));

    const TerrainEditResult result = editor->ModifyTerrain(glm::vec3(8.0f, 4.0f, 4.0f), 3.0f, 2.0f, EditOperation::Subtract);
    EXPECT_EQ(2u, result.affectedChunks.size());

    const VoxelChunk& left = Origin();
    const VoxelChunk& right = *manager->GetChunk(glm::ivec3(1, 0, 0));
    for (int z = 0; z <= 8; ++z) {
        for (int y = 0; y <= 8; ++y) {
            EXPECT_EQ(left.GetDensity(8, y, z), right.GetDensity(0, y, z));
        }
    }
}

TEST_F(TerrainEditorTest, AffectedChunksAreRemeshedImmediately) {
    ASSERT_TRUE(manager->LoadChunk(glm::ivec3(1, 0, 0)));
    const size_t trianglesBefore = Origin().GetMesh().GetTriangleCount();

    ::testing::MockFunction<void(const VoxelChunk&)> meshUpdated;
    manager->OnChunkMeshUpdated = meshUpdated.AsStdFunction();
    EXPECT_CALL(meshUpdated, Call(_)).Times(2);

    const TerrainEditResult result = editor->ModifyTerrain(glm::vec3(7.0f, 4.0f, 4.0f), 3.0f, 6.0f, EditOperation::Subtract);
    ASSERT_EQ(2u, result.affectedChunks.size());

    for (const auto& coord : result.affectedChunks) {
        const VoxelChunk* chunk = manager->GetChunk(coord);
        ASSERT_NE(nullptr, chunk);
        EXPECT_FALSE(chunk->IsDirty());
        EXPECT_TRUE(chunk->IsEdited());
        EXPECT_EQ(ChunkState::Loaded, manager->GetState(coord));
        for (const auto& n : chunk->GetMesh().normals) {
            EXPECT_NEAR(1.0f, glm::length(n), 1e-4f);
        }
    }
    EXPECT_NE(trianglesBefore, Origin().GetMesh().GetTriangleCount());
}
