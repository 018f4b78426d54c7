/**
 * @file terrain_stream_demo.cpp
 * @brief Headless walk-through of terrain streaming, editing and queries
 *
 * Usage: terrain_stream_demo [config.json] [ticks]
 */

#include "config/TerrainConfig.hpp"
#include "core/Logger.hpp"
#include "terrain/VoxelTerrain.hpp"

#include <cstdlib>
#include <exception>
#include <string>

using namespace Strata;

namespace {

constexpr float kTickSeconds = 1.0f / 60.0f;
constexpr float kViewerSpeed = 12.0f;    // World units per second
constexpr float kEyeHeight = 2.0f;

void LogStats(const ChunkManager& chunks) {
    const ChunkStreamingStats stats = chunks.GetStats();
    STRATA_LOG_INFO("tick {}: {} chunks resident, {} triangles, {} loads / {} unloads pending",
                    stats.ticks, stats.loadedChunks, stats.totalTriangles,
                    stats.pendingLoads, stats.pendingUnloads);
}

} // namespace

int main(int argc, char** argv) {
    Logger::Initialize("logs/terrain_stream_demo.log");

    TerrainConfig config;
    if (argc > 1) {
        auto loaded = LoadTerrainConfig(argv[1]);
        if (!loaded) {
            STRATA_LOG_CRITICAL("Could not load {}: {}", argv[1], ConfigErrorToString(loaded.error()));
            Logger::Shutdown();
            return EXIT_FAILURE;
        }
        config = *loaded;
    } else {
        // Keep the default walk light enough for a quick run
        config.streaming.chunkSize = 16;
        config.streaming.renderDistance = 4;
        config.streaming.verticalMin = -1;
        config.streaming.verticalMax = 2;
    }

    const int ticks = argc > 2 ? std::atoi(argv[2]) : 600;

    try {
        VoxelTerrain terrain(config);

        size_t meshUpdates = 0;
        terrain.GetChunkManager().OnChunkMeshUpdated = [&meshUpdates](const VoxelChunk&) {
            ++meshUpdates;
        };

        glm::vec3 viewer(0.0f, terrain.HeightAt(0.0f, 0.0f) + kEyeHeight, 0.0f);
        for (int i = 0; i < ticks; ++i) {
            viewer.x += kViewerSpeed * kTickSeconds;
            viewer.y = terrain.HeightAt(viewer.x, viewer.z) + kEyeHeight;
            terrain.Tick(viewer, kTickSeconds);

            if (i % 120 == 0) {
                LogStats(terrain.GetChunkManager());
            }
        }
        LogStats(terrain.GetChunkManager());

        // Dig a crater under the viewer, then build a mound beside it
        const glm::vec3 ground(viewer.x, terrain.HeightAt(viewer.x, viewer.z), viewer.z);
        TerrainEditResult crater = terrain.ModifyTerrain(ground, 6.0f, 8.0f, EditOperation::Subtract);
        TerrainEditResult mound = terrain.ModifyTerrain(ground + glm::vec3(10.0f, 0.0f, 0.0f), 4.0f, 6.0f,
                                                        EditOperation::Add);
        STRATA_LOG_INFO("Crater touched {} chunks ({} samples), mound touched {} chunks ({} samples), {} remeshes",
                        crater.affectedChunks.size(), crater.changedSamples,
                        mound.affectedChunks.size(), mound.changedSamples, meshUpdates);

        const glm::vec3 rayOrigin = viewer + glm::vec3(0.0f, 50.0f, 0.0f);
        if (auto hit = terrain.Raycast(rayOrigin, glm::vec3(0.0f, -1.0f, 0.0f))) {
            STRATA_LOG_INFO("Ray hit ({:.2f}, {:.2f}, {:.2f}) at distance {:.2f}, normal ({:.2f}, {:.2f}, {:.2f})",
                            hit->point.x, hit->point.y, hit->point.z, hit->distance,
                            hit->normal.x, hit->normal.y, hit->normal.z);
        } else {
            STRATA_LOG_WARN("Ray from ({:.2f}, {:.2f}, {:.2f}) missed the terrain",
                            rayOrigin.x, rayOrigin.y, rayOrigin.z);
        }
    } catch (const std::exception& e) {
        STRATA_LOG_CRITICAL("Terrain demo failed: {}", e.what());
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    Logger::Shutdown();
    return EXIT_SUCCESS;
}
