#include "terrain/VoxelChunk.hpp"
#include <algorithm>
#include <cmath>

namespace Strata {

const char* ChunkStateToString(ChunkState state) {
    switch (state) {
        case ChunkState::Absent:       return "absent";
        case ChunkState::QueuedLoad:   return "queued-load";
        case ChunkState::Loaded:       return "loaded";
        case ChunkState::Dirty:        return "dirty";
        case ChunkState::QueuedUnload: return "queued-unload";
    }
    return "unknown";
}

const char* LodLevelToString(LodLevel lod) {
    switch (lod) {
        case LodLevel::Full:    return "full";
        case LodLevel::Reduced: return "reduced";
        case LodLevel::Hidden:  return "hidden";
    }
    return "unknown";
}

void ChunkMesh::Clear() {
    positions.clear();
    normals.clear();
    colors.clear();
    indices.clear();
}

// ============================================================================
// VoxelChunk Implementation
// ============================================================================

VoxelChunk::VoxelChunk(const glm::ivec3& coord, int size, float voxelSize)
    : m_coord(coord)
    , m_size(size)
    , m_voxelSize(voxelSize)
    , m_density(static_cast<size_t>(size + 1) * (size + 1) * (size + 1), 0.0f) {
}

void VoxelChunk::Fill(float density) {
    std::fill(m_density.begin(), m_density.end(), density);
}

float VoxelChunk::SampleDensity(const glm::vec3& worldPos) const {
    glm::vec3 local = (worldPos - GetWorldOrigin()) / m_voxelSize;
    local = glm::clamp(local, glm::vec3(0.0f), glm::vec3(static_cast<float>(m_size)));

    glm::ivec3 base = glm::min(glm::ivec3(glm::floor(local)), glm::ivec3(m_size - 1));
    base = glm::max(base, glm::ivec3(0));
    const glm::vec3 frac = local - glm::vec3(base);

    const float d000 = GetDensity(base.x, base.y, base.z);
    const float d100 = GetDensity(base.x + 1, base.y, base.z);
    const float d010 = GetDensity(base.x, base.y + 1, base.z);
    const float d110 = GetDensity(base.x + 1, base.y + 1, base.z);
    const float d001 = GetDensity(base.x, base.y, base.z + 1);
    const float d101 = GetDensity(base.x + 1, base.y, base.z + 1);
    const float d011 = GetDensity(base.x, base.y + 1, base.z + 1);
    const float d111 = GetDensity(base.x + 1, base.y + 1, base.z + 1);

    const float d00 = glm::mix(d000, d100, frac.x);
    const float d10 = glm::mix(d010, d110, frac.x);
    const float d01 = glm::mix(d001, d101, frac.x);
    const float d11 = glm::mix(d011, d111, frac.x);

    const float d0 = glm::mix(d00, d10, frac.y);
    const float d1 = glm::mix(d01, d11, frac.y);

    return glm::mix(d0, d1, frac.z);
}

glm::vec3 VoxelChunk::GetSamplePosition(int x, int y, int z) const {
    return GetWorldOrigin() + glm::vec3(x, y, z) * m_voxelSize;
}

glm::vec3 VoxelChunk::GetWorldOrigin() const {
    return glm::vec3(m_coord) * (static_cast<float>(m_size) * m_voxelSize);
}

glm::vec3 VoxelChunk::GetBoundsMax() const {
    return GetWorldOrigin() + glm::vec3(static_cast<float>(m_size) * m_voxelSize);
}

glm::vec3 VoxelChunk::GetCenter() const {
    return (GetWorldOrigin() + GetBoundsMax()) * 0.5f;
}

bool VoxelChunk::IntersectsSphere(const glm::vec3& center, float radius) const {
    const glm::vec3 closest = glm::clamp(center, GetWorldOrigin(), GetBoundsMax());
    const glm::vec3 diff = closest - center;
    return glm::dot(diff, diff) <= radius * radius;
}

void VoxelChunk::ReleaseMesh() {
    m_mesh.Clear();
    m_mesh.positions.shrink_to_fit();
    m_mesh.normals.shrink_to_fit();
    m_mesh.colors.shrink_to_fit();
    m_mesh.indices.shrink_to_fit();
}

} // namespace Strata
