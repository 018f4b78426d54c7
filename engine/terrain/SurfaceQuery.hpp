#pragma once

#include "config/TerrainConfig.hpp"
#include "terrain/DensityField.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace Strata {

/**
 * @brief Ray hit against the terrain surface
 */
struct TerrainRaycastHit {
    glm::vec3 point{0.0f};
    float distance = 0.0f;
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
};

/**
 * @brief Read-only height and ray queries against the procedural density field
 *
 * Both queries run a fixed number of steps so their cost does not depend on the
 * terrain being queried.
 */
class SurfaceQuery {
public:
    SurfaceQuery(const DensityField& field, const TerrainConfig& config);

    /**
     * @brief Surface height at a column
     *
     * Binary search over the configured vertical range. Columns with no crossing
     * return a value near one end of the range.
     */
    [[nodiscard]] float HeightAt(float x, float z) const;

    /**
     * @brief March a ray at fixed steps until it enters solid terrain
     * Samples t = i * raycastStep for t <= maxDistance, at most maxRaycastSteps samples.
     * @return std::nullopt on a zero direction, a negative or non-finite range, or when the range is exhausted
     */
    [[nodiscard]] std::optional<TerrainRaycastHit> Raycast(const glm::vec3& origin,
                                                           const glm::vec3& direction,
                                                           float maxDistance) const;

    /**
     * @brief Outward unit normal of the field at a point
     */
    [[nodiscard]] glm::vec3 NormalAt(const glm::vec3& point) const;

private:
    const DensityField& m_field;
    QueryConfig m_query;
    float m_isoLevel;
    float m_normalStep;
};

} // namespace Strata
