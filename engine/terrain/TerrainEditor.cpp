#include "terrain/TerrainEditor.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Strata {

const char* EditOperationToString(EditOperation op) {
    switch (op) {
        case EditOperation::Add:      return "add";
        case EditOperation::Subtract: return "subtract";
        case EditOperation::Set:      return "set";
    }
    return "unknown";
}

TerrainEditor::TerrainEditor(ChunkManager& chunks)
    : m_chunks(chunks) {
}

TerrainEditResult TerrainEditor::ModifyTerrain(const glm::vec3& point, float radius, float strength,
                                               EditOperation op) {
    TerrainEditResult result;
    if (!(radius > 0.0f)) {
        return result;
    }

    // Chunks on the low side share their max face samples with the range start
    const glm::ivec3 minChunk = m_chunks.WorldToChunk(point - glm::vec3(radius)) - glm::ivec3(1);
    const glm::ivec3 maxChunk = m_chunks.WorldToChunk(point + glm::vec3(radius));

    for (int cz = minChunk.z; cz <= maxChunk.z; cz++) {
        for (int cy = minChunk.y; cy <= maxChunk.y; cy++) {
            for (int cx = minChunk.x; cx <= maxChunk.x; cx++) {
                const glm::ivec3 chunkPos(cx, cy, cz);
                VoxelChunk* chunk = m_chunks.GetChunk(chunkPos);
                if (!chunk || !chunk->IntersectsSphere(point, radius)) {
                    continue;
                }

                const size_t changed = ApplyToChunk(*chunk, point, radius, strength, op);
                if (changed == 0) {
                    continue;
                }

                chunk->SetDirty(true);
                chunk->SetEdited(true);
                result.affectedChunks.push_back(chunkPos);
                result.changedSamples += changed;
            }
        }
    }

    for (const auto& chunkPos : result.affectedChunks) {
        m_chunks.RemeshChunk(chunkPos);
    }

    spdlog::debug("TerrainEditor: {} at ({:.2f}, {:.2f}, {:.2f}) r={:.2f} changed {} samples in {} chunks",
                  EditOperationToString(op), point.x, point.y, point.z, radius,
                  result.changedSamples, result.affectedChunks.size());

    return result;
}

size_t TerrainEditor::ApplyToChunk(VoxelChunk& chunk, const glm::vec3& point, float radius,
                                   float strength, EditOperation op) const {
    const int samples = chunk.GetSamplesPerAxis();
    size_t changed = 0;

    for (int z = 0; z < samples; z++) {
        for (int y = 0; y < samples; y++) {
            for (int x = 0; x < samples; x++) {
                const float dist = glm::length(chunk.GetSamplePosition(x, y, z) - point);
                if (dist > radius) continue;

                const float falloff = 1.0f - dist / radius;
                const float before = chunk.GetDensity(x, y, z);
                float after = before;

                switch (op) {
                    case EditOperation::Add:
                        after = before + strength * falloff;
                        break;
                    case EditOperation::Subtract:
                        after = before - strength * falloff;
                        break;
                    case EditOperation::Set:
                        after = strength;
                        break;
                }

                if (after != before) {
                    chunk.SetDensity(x, y, z, after);
                    ++changed;
                }
            }
        }
    }

    return changed;
}

} // namespace Strata
