#include "terrain/NoiseGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace Strata {

NoiseGenerator::NoiseGenerator(uint32_t seed) : m_seed(seed) {
    std::array<int, 256> p;
    std::iota(p.begin(), p.end(), 0);

    std::mt19937 rng(seed);
    std::shuffle(p.begin(), p.end(), rng);

    // Double the permutation table for seamless wrapping
    for (int i = 0; i < 256; ++i) {
        m_permutation[i] = p[i];
        m_permutation[i + 256] = p[i];
    }
}

// ============================================================================
// 3D Perlin Noise
// ============================================================================

float NoiseGenerator::Perlin(float x, float y, float z) const noexcept {
    const float fx = std::floor(x);
    const float fy = std::floor(y);
    const float fz = std::floor(z);

    // Find unit cube
    const int xi = static_cast<int>(fx) & 255;
    const int yi = static_cast<int>(fy) & 255;
    const int zi = static_cast<int>(fz) & 255;

    // Relative position within cube
    const float xf = x - fx;
    const float yf = y - fy;
    const float zf = z - fz;

    const float u = Fade(xf);
    const float v = Fade(yf);
    const float w = Fade(zf);

    // Hash coordinates of cube corners
    const int A  = m_permutation[xi] + yi;
    const int AA = m_permutation[A] + zi;
    const int AB = m_permutation[A + 1] + zi;
    const int B  = m_permutation[xi + 1] + yi;
    const int BA = m_permutation[B] + zi;
    const int BB = m_permutation[B + 1] + zi;

    const float g000 = Grad(m_permutation[AA], xf, yf, zf);
    const float g100 = Grad(m_permutation[BA], xf - 1.0f, yf, zf);
    const float g010 = Grad(m_permutation[AB], xf, yf - 1.0f, zf);
    const float g110 = Grad(m_permutation[BB], xf - 1.0f, yf - 1.0f, zf);
    const float g001 = Grad(m_permutation[AA + 1], xf, yf, zf - 1.0f);
    const float g101 = Grad(m_permutation[BA + 1], xf - 1.0f, yf, zf - 1.0f);
    const float g011 = Grad(m_permutation[AB + 1], xf, yf - 1.0f, zf - 1.0f);
    const float g111 = Grad(m_permutation[BB + 1], xf - 1.0f, yf - 1.0f, zf - 1.0f);

    const float x00 = Lerp(g000, g100, u);
    const float x10 = Lerp(g010, g110, u);
    const float x01 = Lerp(g001, g101, u);
    const float x11 = Lerp(g011, g111, u);

    const float y0 = Lerp(x00, x10, v);
    const float y1 = Lerp(x01, x11, v);

    return Lerp(y0, y1, w);
}

// ============================================================================
// Fractal Brownian Motion
// ============================================================================

float NoiseGenerator::Fractal(float x, float y, float z, int octaves,
                              float persistence, float lacunarity) const noexcept {
    float total = 0.0f;
    float frequency = 1.0f;
    float amplitude = 1.0f;
    float maxValue = 0.0f;

    for (int i = 0; i < octaves; ++i) {
        total += Perlin(x * frequency, y * frequency, z * frequency) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= lacunarity;
    }

    return maxValue > 0.0f ? total / maxValue : 0.0f;
}

// ============================================================================
// Helpers
// ============================================================================

float NoiseGenerator::Grad(int hash, float x, float y, float z) noexcept {
    // 12 cube-edge gradients selected by the low 4 bits
    const int h = hash & 15;
    const float u = h < 8 ? x : y;
    const float v = h < 4 ? y : (h == 12 || h == 14 ? x : z);
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

float NoiseGenerator::Fade(float t) noexcept {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

float NoiseGenerator::Lerp(float a, float b, float t) noexcept {
    return a + t * (b - a);
}

} // namespace Strata
