#pragma once

#include "config/TerrainConfig.hpp"
#include "terrain/MarchingCubes.hpp"
#include "terrain/VoxelChunk.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Strata {

/**
 * @brief Streaming counters
 */
struct ChunkStreamingStats {
    size_t loadedChunks = 0;
    size_t pendingLoads = 0;
    size_t pendingUnloads = 0;
    size_t totalTriangles = 0;
    uint64_t chunksGenerated = 0;
    uint64_t chunksUnloaded = 0;
    uint64_t generationFailures = 0;
    uint64_t ticks = 0;
    float elapsedTime = 0.0f;
};

/**
 * @brief LOD tier for a viewer distance to a chunk center
 */
[[nodiscard]] LodLevel ComputeLod(float distance, const StreamingConfig& config);

/**
 * @brief Owns resident chunks and streams them around a viewer
 *
 * Each Tick() enqueues loads inside the render distance, drains a bounded number of
 * load entries, enqueues unloads beyond render distance plus hysteresis, drains a
 * bounded number of unload entries, and updates LOD tiers. Loads and unloads are
 * cooperative; nothing runs between ticks. Not thread-safe.
 */
class ChunkManager {
public:
    ChunkManager(const TerrainConfig& config, DensitySampler densitySource);

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    /**
     * @brief Advance streaming around the viewer
     */
    void Tick(const glm::vec3& viewerPosition, float deltaTime);

    // =========================================================================
    // Synchronous Chunk Control
    // =========================================================================

    /**
     * @brief Generate and mesh a chunk now
     * @return false if the chunk was already resident
     */
    bool LoadChunk(const glm::ivec3& coord);

    /**
     * @brief Drop a chunk and cancel any queued work for it
     * @return false if the chunk was not resident
     */
    bool UnloadChunk(const glm::ivec3& coord);

    /**
     * @brief Flag a resident chunk dirty and queue it for regeneration
     */
    void MarkDirty(const glm::ivec3& coord);

    /**
     * @brief Rebuild a resident chunk's mesh from its stored density
     * @return false if the chunk is not resident
     */
    bool RemeshChunk(const glm::ivec3& coord);

    /**
     * @brief Drop every chunk and all queued work
     */
    void Clear();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] VoxelChunk* GetChunk(const glm::ivec3& coord);
    [[nodiscard]] const VoxelChunk* GetChunk(const glm::ivec3& coord) const;
    [[nodiscard]] bool IsLoaded(const glm::ivec3& coord) const;
    [[nodiscard]] ChunkState GetState(const glm::ivec3& coord) const;

    [[nodiscard]] size_t GetLoadedCount() const { return m_chunks.size(); }
    [[nodiscard]] size_t PendingLoads() const { return m_pendingLoads.size(); }
    [[nodiscard]] size_t PendingUnloads() const { return m_pendingUnloads.size(); }

    /**
     * @brief True when no load or unload work is pending
     */
    [[nodiscard]] bool IsStable() const { return m_pendingLoads.empty() && m_pendingUnloads.empty(); }

    void ForEachChunk(const std::function<void(const VoxelChunk&)>& callback) const;

    [[nodiscard]] ChunkStreamingStats GetStats() const;

    [[nodiscard]] glm::ivec3 WorldToChunk(const glm::vec3& worldPos) const;
    [[nodiscard]] glm::ivec3 GetViewerChunk() const { return m_viewerChunk; }
    [[nodiscard]] const TerrainConfig& GetConfig() const { return m_config; }
    [[nodiscard]] MarchingCubes& GetMesher() { return m_mesher; }

    /**
     * @brief Pack a chunk coordinate into a map key (21 bits per axis)
     */
    [[nodiscard]] static uint64_t GetChunkKey(const glm::ivec3& coord);

    // =========================================================================
    // Callbacks
    // =========================================================================

    std::function<void(const VoxelChunk&)> OnChunkLoaded;
    std::function<void(const VoxelChunk&)> OnChunkMeshUpdated;
    std::function<void(const glm::ivec3&)> OnChunkUnloaded;

private:
    [[nodiscard]] float ChunkDistance(const glm::ivec3& coord) const;
    [[nodiscard]] bool IsWithinLoadRange(const glm::ivec3& coord) const;
    [[nodiscard]] bool IsBeyondUnloadRange(const glm::ivec3& coord) const;

    void EnqueueLoads();
    void DrainLoadQueue();
    void EnqueueUnloads();
    void DrainUnloadQueue();
    void UpdateLod();

    void EnqueueLoad(const glm::ivec3& coord);
    void InstallChunk(VoxelChunk&& chunk);
    VoxelChunk BuildChunk(const glm::ivec3& coord);
    void GenerateDensity(VoxelChunk& chunk) const;
    void RebuildMesh(VoxelChunk& chunk);
    void FailGeneration(VoxelChunk& chunk, const char* reason);
    void FailRemesh(VoxelChunk& chunk, const char* reason);
    [[nodiscard]] DensitySampler MakeNormalSampler(const VoxelChunk& chunk) const;

    TerrainConfig m_config;
    DensitySampler m_densitySource;
    MarchingCubes m_mesher;

    std::unordered_map<uint64_t, VoxelChunk> m_chunks;

    // Queues may hold stale entries; the pending sets are authoritative
    std::deque<glm::ivec3> m_loadQueue;
    std::deque<glm::ivec3> m_unloadQueue;
    std::unordered_set<uint64_t> m_pendingLoads;
    std::unordered_set<uint64_t> m_pendingUnloads;

    // Load offsets within the render sphere, nearest first
    std::vector<glm::ivec3> m_loadOffsets;

    glm::vec3 m_viewerPosition{0.0f};
    glm::ivec3 m_viewerChunk{0};

    float m_elapsedTime = 0.0f;
    uint64_t m_ticks = 0;
    uint64_t m_chunksGenerated = 0;
    uint64_t m_chunksUnloaded = 0;
    uint64_t m_generationFailures = 0;
};

} // namespace Strata
