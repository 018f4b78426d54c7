#include "terrain/ChunkManager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <exception>

namespace Strata {

LodLevel ComputeLod(float distance, const StreamingConfig& config) {
    if (distance >= config.lodFarDistance) {
        return LodLevel::Hidden;
    }
    if (distance >= config.lodNearDistance && config.maxLODLevels > 1) {
        return LodLevel::Reduced;
    }
    return LodLevel::Full;
}

// ============================================================================
// ChunkManager Implementation
// ============================================================================

ChunkManager::ChunkManager(const TerrainConfig& config, DensitySampler densitySource)
    : m_config(config)
    , m_densitySource(std::move(densitySource))
    , m_mesher(config.material) {
    const StreamingConfig& s = m_config.streaming;
    const int r = s.renderDistance;

    for (int dy = s.verticalMin; dy <= s.verticalMax; ++dy) {
        for (int dz = -r; dz <= r; ++dz) {
            for (int dx = -r; dx <= r; ++dx) {
                if (dx * dx + dy * dy + dz * dz <= r * r) {
                    m_loadOffsets.emplace_back(dx, dy, dz);
                }
            }
        }
    }

    std::stable_sort(m_loadOffsets.begin(), m_loadOffsets.end(),
        [](const glm::ivec3& a, const glm::ivec3& b) {
            return glm::dot(glm::vec3(a), glm::vec3(a)) < glm::dot(glm::vec3(b), glm::vec3(b));
        });

    spdlog::debug("ChunkManager: {} chunks in streaming set (radius {}, band [{}, {}])",
                  m_loadOffsets.size(), r, s.verticalMin, s.verticalMax);
}

void ChunkManager::Tick(const glm::vec3& viewerPosition, float deltaTime) {
    m_elapsedTime += deltaTime;
    ++m_ticks;

    m_viewerPosition = viewerPosition;
    const glm::ivec3 viewerChunk = WorldToChunk(viewerPosition);
    if (viewerChunk != m_viewerChunk) {
        spdlog::trace("ChunkManager: viewer entered chunk ({}, {}, {})",
                      viewerChunk.x, viewerChunk.y, viewerChunk.z);
        m_viewerChunk = viewerChunk;
    }

    EnqueueLoads();
    DrainLoadQueue();
    EnqueueUnloads();
    DrainUnloadQueue();
    UpdateLod();
}

// ============================================================================
// Synchronous Chunk Control
// ============================================================================

bool ChunkManager::LoadChunk(const glm::ivec3& coord) {
    const uint64_t key = GetChunkKey(coord);
    if (m_chunks.count(key) > 0) {
        return false;
    }

    m_pendingLoads.erase(key);
    InstallChunk(BuildChunk(coord));
    return true;
}

bool ChunkManager::UnloadChunk(const glm::ivec3& coord) {
    const uint64_t key = GetChunkKey(coord);
    m_pendingLoads.erase(key);
    m_pendingUnloads.erase(key);

    auto it = m_chunks.find(key);
    if (it == m_chunks.end()) {
        return false;
    }

    it->second.ReleaseMesh();
    m_chunks.erase(it);
    ++m_chunksUnloaded;

    spdlog::debug("ChunkManager: unloaded chunk ({}, {}, {})", coord.x, coord.y, coord.z);
    if (OnChunkUnloaded) {
        OnChunkUnloaded(coord);
    }
    return true;
}

void ChunkManager::MarkDirty(const glm::ivec3& coord) {
    VoxelChunk* chunk = GetChunk(coord);
    if (!chunk) {
        return;
    }

    chunk->SetDirty(true);

    // Regeneration waits until a queued unload is cancelled
    if (m_pendingUnloads.count(GetChunkKey(coord)) == 0) {
        EnqueueLoad(coord);
    }
}

bool ChunkManager::RemeshChunk(const glm::ivec3& coord) {
    VoxelChunk* chunk = GetChunk(coord);
    if (!chunk) {
        return false;
    }

    // A queued regeneration would only repeat this work
    m_pendingLoads.erase(GetChunkKey(coord));
    RebuildMesh(*chunk);
    return true;
}

void ChunkManager::Clear() {
    const size_t count = m_chunks.size();

    std::vector<glm::ivec3> coords;
    coords.reserve(count);
    for (const auto& [key, chunk] : m_chunks) {
        coords.push_back(chunk.GetCoord());
    }

    m_chunks.clear();
    m_loadQueue.clear();
    m_unloadQueue.clear();
    m_pendingLoads.clear();
    m_pendingUnloads.clear();

    if (OnChunkUnloaded) {
        for (const auto& coord : coords) {
            OnChunkUnloaded(coord);
        }
    }

    m_chunksUnloaded += count;
    spdlog::info("ChunkManager: cleared {} chunks", count);
}

// ============================================================================
// Queries
// ============================================================================

VoxelChunk* ChunkManager::GetChunk(const glm::ivec3& coord) {
    auto it = m_chunks.find(GetChunkKey(coord));
    return it != m_chunks.end() ? &it->second : nullptr;
}

const VoxelChunk* ChunkManager::GetChunk(const glm::ivec3& coord) const {
    auto it = m_chunks.find(GetChunkKey(coord));
    return it != m_chunks.end() ? &it->second : nullptr;
}

bool ChunkManager::IsLoaded(const glm::ivec3& coord) const {
    return m_chunks.count(GetChunkKey(coord)) > 0;
}

ChunkState ChunkManager::GetState(const glm::ivec3& coord) const {
    const uint64_t key = GetChunkKey(coord);
    auto it = m_chunks.find(key);

    if (it == m_chunks.end()) {
        return m_pendingLoads.count(key) > 0 ? ChunkState::QueuedLoad : ChunkState::Absent;
    }
    if (m_pendingUnloads.count(key) > 0) {
        return ChunkState::QueuedUnload;
    }
    if (m_pendingLoads.count(key) > 0) {
        return ChunkState::QueuedLoad;
    }
    return it->second.IsDirty() ? ChunkState::Dirty : ChunkState::Loaded;
}

void ChunkManager::ForEachChunk(const std::function<void(const VoxelChunk&)>& callback) const {
    for (const auto& [key, chunk] : m_chunks) {
        callback(chunk);
    }
}

ChunkStreamingStats ChunkManager::GetStats() const {
    ChunkStreamingStats stats;
    stats.loadedChunks = m_chunks.size();
    stats.pendingLoads = m_pendingLoads.size();
    stats.pendingUnloads = m_pendingUnloads.size();
    for (const auto& [key, chunk] : m_chunks) {
        stats.totalTriangles += chunk.GetMesh().GetTriangleCount();
    }
    stats.chunksGenerated = m_chunksGenerated;
    stats.chunksUnloaded = m_chunksUnloaded;
    stats.generationFailures = m_generationFailures;
    stats.ticks = m_ticks;
    stats.elapsedTime = m_elapsedTime;
    return stats;
}

glm::ivec3 ChunkManager::WorldToChunk(const glm::vec3& worldPos) const {
    const glm::vec3 chunkPos = worldPos / m_config.ChunkWorldSize();
    return glm::ivec3(
        static_cast<int>(std::floor(chunkPos.x)),
        static_cast<int>(std::floor(chunkPos.y)),
        static_cast<int>(std::floor(chunkPos.z))
    );
}

uint64_t ChunkManager::GetChunkKey(const glm::ivec3& coord) {
    uint64_t x = static_cast<uint64_t>(coord.x + (1 << 20)) & 0x1FFFFF;
    uint64_t y = static_cast<uint64_t>(coord.y + (1 << 20)) & 0x1FFFFF;
    uint64_t z = static_cast<uint64_t>(coord.z + (1 << 20)) & 0x1FFFFF;
    return x | (y << 21) | (z << 42);
}

// ============================================================================
// Streaming
// ============================================================================

float ChunkManager::ChunkDistance(const glm::ivec3& coord) const {
    return glm::length(glm::vec3(coord - m_viewerChunk));
}

bool ChunkManager::IsWithinLoadRange(const glm::ivec3& coord) const {
    const StreamingConfig& s = m_config.streaming;
    const int dy = coord.y - m_viewerChunk.y;
    if (dy < s.verticalMin || dy > s.verticalMax) {
        return false;
    }
    return ChunkDistance(coord) <= static_cast<float>(s.renderDistance);
}

bool ChunkManager::IsBeyondUnloadRange(const glm::ivec3& coord) const {
    const StreamingConfig& s = m_config.streaming;
    return ChunkDistance(coord) > static_cast<float>(s.renderDistance + s.hysteresis);
}

void ChunkManager::EnqueueLoad(const glm::ivec3& coord) {
    if (m_pendingLoads.insert(GetChunkKey(coord)).second) {
        m_loadQueue.push_back(coord);
    }
}

void ChunkManager::EnqueueLoads() {
    for (const auto& offset : m_loadOffsets) {
        const glm::ivec3 coord = m_viewerChunk + offset;
        const uint64_t key = GetChunkKey(coord);

        auto it = m_chunks.find(key);
        if (it != m_chunks.end()) {
            if (m_pendingUnloads.erase(key) > 0) {
                spdlog::trace("ChunkManager: kept chunk ({}, {}, {}) queued for unload",
                              coord.x, coord.y, coord.z);
                if (it->second.IsDirty()) {
                    EnqueueLoad(coord);
                }
            }
            continue;
        }
        EnqueueLoad(coord);
    }
}

void ChunkManager::DrainLoadQueue() {
    int processed = 0;

    while (processed < m_config.streaming.loadsPerTick && !m_loadQueue.empty()) {
        const glm::ivec3 coord = m_loadQueue.front();
        m_loadQueue.pop_front();

        const uint64_t key = GetChunkKey(coord);
        if (m_pendingLoads.erase(key) == 0) {
            continue;
        }

        auto it = m_chunks.find(key);
        if (it != m_chunks.end()) {
            if (it->second.IsDirty()) {
                RebuildMesh(it->second);
                ++processed;
            }
            continue;
        }

        if (!IsWithinLoadRange(coord)) {
            continue;
        }

        InstallChunk(BuildChunk(coord));
        ++processed;
    }
}

void ChunkManager::EnqueueUnloads() {
    for (const auto& [key, chunk] : m_chunks) {
        if (!IsBeyondUnloadRange(chunk.GetCoord())) {
            continue;
        }
        if (m_pendingUnloads.insert(key).second) {
            m_unloadQueue.push_back(chunk.GetCoord());
        }
        m_pendingLoads.erase(key);
    }

    // Drop pending loads the viewer has moved away from, along with stale entries
    std::erase_if(m_loadQueue, [this](const glm::ivec3& coord) {
        const uint64_t key = GetChunkKey(coord);
        if (m_pendingLoads.count(key) == 0) {
            return true;
        }
        if (m_chunks.count(key) == 0 && !IsWithinLoadRange(coord)) {
            m_pendingLoads.erase(key);
            return true;
        }
        return false;
    });
}

void ChunkManager::DrainUnloadQueue() {
    int processed = 0;

    while (processed < m_config.streaming.unloadsPerTick && !m_unloadQueue.empty()) {
        const glm::ivec3 coord = m_unloadQueue.front();
        m_unloadQueue.pop_front();

        if (m_pendingUnloads.erase(GetChunkKey(coord)) == 0) {
            continue;
        }
        // The viewer may have come back inside the hysteresis band
        if (!IsBeyondUnloadRange(coord)) {
            const VoxelChunk* chunk = GetChunk(coord);
            if (chunk && chunk->IsDirty()) {
                EnqueueLoad(coord);
            }
            continue;
        }
        if (UnloadChunk(coord)) {
            ++processed;
        }
    }
}

void ChunkManager::UpdateLod() {
    for (auto& [key, chunk] : m_chunks) {
        const float distance = glm::length(chunk.GetCenter() - m_viewerPosition);
        chunk.SetLod(ComputeLod(distance, m_config.streaming));
    }
}

// ============================================================================
// Generation
// ============================================================================

void ChunkManager::InstallChunk(VoxelChunk&& chunk) {
    const float distance = glm::length(chunk.GetCenter() - m_viewerPosition);
    chunk.SetLod(ComputeLod(distance, m_config.streaming));

    const uint64_t key = GetChunkKey(chunk.GetCoord());
    auto it = m_chunks.insert_or_assign(key, std::move(chunk)).first;

    const glm::ivec3& coord = it->second.GetCoord();
    spdlog::debug("ChunkManager: loaded chunk ({}, {}, {}) with {} triangles",
                  coord.x, coord.y, coord.z, it->second.GetMesh().GetTriangleCount());

    if (OnChunkLoaded) {
        OnChunkLoaded(it->second);
    }
}

VoxelChunk ChunkManager::BuildChunk(const glm::ivec3& coord) {
    const StreamingConfig& s = m_config.streaming;
    VoxelChunk chunk(coord, s.chunkSize, s.voxelSize);

    try {
        GenerateDensity(chunk);
        m_mesher.GenerateMesh(chunk, s.isoLevel, MakeNormalSampler(chunk));
    } catch (const std::exception& e) {
        FailGeneration(chunk, e.what());
    } catch (...) {
        FailGeneration(chunk, "unknown exception");
    }

    ++m_chunksGenerated;
    return chunk;
}

void ChunkManager::FailGeneration(VoxelChunk& chunk, const char* reason) {
    ++m_generationFailures;
    const glm::ivec3& coord = chunk.GetCoord();
    spdlog::error("ChunkManager: failed to generate chunk ({}, {}, {}): {}",
                  coord.x, coord.y, coord.z, reason);

    // Install as empty space so streaming does not retry it every tick
    chunk.Fill(m_config.streaming.isoLevel - 1.0f);
    chunk.ReleaseMesh();
    chunk.SetDirty(false);
}

void ChunkManager::GenerateDensity(VoxelChunk& chunk) const {
    const int samples = chunk.GetSamplesPerAxis();
    std::vector<float>& density = chunk.GetSamples();

    for (int z = 0; z < samples; ++z) {
        for (int y = 0; y < samples; ++y) {
            for (int x = 0; x < samples; ++x) {
                density[chunk.GetIndex(x, y, z)] = m_densitySource(chunk.GetSamplePosition(x, y, z));
            }
        }
    }
}

void ChunkManager::RebuildMesh(VoxelChunk& chunk) {
    try {
        m_mesher.GenerateMesh(chunk, m_config.streaming.isoLevel, MakeNormalSampler(chunk));
    } catch (const std::exception& e) {
        FailRemesh(chunk, e.what());
    } catch (...) {
        FailRemesh(chunk, "unknown exception");
    }

    if (OnChunkMeshUpdated) {
        OnChunkMeshUpdated(chunk);
    }
}

void ChunkManager::FailRemesh(VoxelChunk& chunk, const char* reason) {
    ++m_generationFailures;
    const glm::ivec3& coord = chunk.GetCoord();
    spdlog::error("ChunkManager: failed to remesh chunk ({}, {}, {}): {}",
                  coord.x, coord.y, coord.z, reason);
    chunk.ReleaseMesh();
    chunk.SetDirty(false);
}

DensitySampler ChunkManager::MakeNormalSampler(const VoxelChunk& chunk) const {
    // Edited density no longer matches the procedural field
    if (chunk.IsEdited()) {
        return [&chunk](const glm::vec3& p) { return chunk.SampleDensity(p); };
    }
    return m_densitySource;
}

} // namespace Strata
