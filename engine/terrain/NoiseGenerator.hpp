#pragma once

#include <array>
#include <cstdint>

namespace Strata {

/**
 * @brief Seeded gradient noise
 *
 * Each instance owns its permutation table, so generators with different seeds can
 * coexist and two generators with the same seed produce identical values.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint32_t seed = 0);

    /**
     * @brief 3D improved Perlin noise
     * @return Signed value in roughly [-1, 1], zero on integer lattice points
     */
    [[nodiscard]] float Perlin(float x, float y, float z) const noexcept;

    /**
     * @brief Fractal Brownian motion built from Perlin octaves, normalized by total amplitude
     */
    [[nodiscard]] float Fractal(float x, float y, float z, int octaves = 4,
                                float persistence = 0.5f, float lacunarity = 2.0f) const noexcept;

    [[nodiscard]] uint32_t GetSeed() const noexcept { return m_seed; }

private:
    static float Grad(int hash, float x, float y, float z) noexcept;
    static float Fade(float t) noexcept;
    static float Lerp(float a, float b, float t) noexcept;

    uint32_t m_seed;
    std::array<int, 512> m_permutation{};
};

} // namespace Strata
