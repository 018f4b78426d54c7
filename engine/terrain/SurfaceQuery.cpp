#include "terrain/SurfaceQuery.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Strata {

SurfaceQuery::SurfaceQuery(const DensityField& field, const TerrainConfig& config)
    : m_field(field)
    , m_query(config.query)
    , m_isoLevel(config.streaming.isoLevel)
    , m_normalStep(config.material.normalStep) {
}

float SurfaceQuery::HeightAt(float x, float z) const {
    float lo = m_query.heightSearchMin;
    float hi = m_query.heightSearchMax;

    for (int i = 0; i < m_query.heightSearchIterations; i++) {
        const float mid = (lo + hi) * 0.5f;
        if (m_field.Density(x, mid, z) < m_isoLevel) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    return (lo + hi) * 0.5f;
}

std::optional<TerrainRaycastHit> SurfaceQuery::Raycast(const glm::vec3& origin, const glm::vec3& direction,
                                                       float maxDistance) const {
    const float length = glm::length(direction);
    if (!(length > 0.0f) || !(m_query.raycastStep > 0.0f) || !std::isfinite(maxDistance) || maxDistance < 0.0f) {
        return std::nullopt;
    }
    const glm::vec3 dir = direction / length;

    // Samples at t = 0, step, ... up to and including maxDistance, capped per ray
    const double rangeSteps = std::floor(static_cast<double>(maxDistance) / m_query.raycastStep);
    const int64_t steps = static_cast<int64_t>(std::min(rangeSteps, static_cast<double>(m_query.maxRaycastSteps - 1)));

    for (int64_t i = 0; i <= steps; i++) {
        const float t = static_cast<float>(i) * m_query.raycastStep;
        const glm::vec3 pos = origin + dir * t;
        if (m_field.Density(pos) >= m_isoLevel) {
            TerrainRaycastHit hit;
            hit.point = pos;
            hit.distance = t;
            hit.normal = NormalAt(pos);
            return hit;
        }
    }

    return std::nullopt;
}

glm::vec3 SurfaceQuery::NormalAt(const glm::vec3& point) const {
    const glm::vec3 gradient = m_field.Gradient(point, m_normalStep);
    const float length = glm::length(gradient);
    if (!(length > 1e-6f)) {
        return glm::vec3(0.0f, 1.0f, 0.0f);
    }
    return -gradient / length;
}

} // namespace Strata
