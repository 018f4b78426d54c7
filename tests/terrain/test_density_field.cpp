/**
 * @file test_density_field.cpp
 * @brief Unit tests for seeded noise and the procedural density field
 */

#include <gtest/gtest.h>

#include "terrain/DensityField.hpp"
#include "terrain/NoiseGenerator.hpp"

#include "utils/TestHelpers.hpp"

#include <cmath>
#include <vector>

using namespace Strata;
using namespace Strata::Test;

namespace {

std::vector<glm::vec3> SamplePoints() {
    std::vector<glm::vec3> points;
    for (int i = 0; i < 64; ++i) {
        const float f = static_cast<float>(i);
        points.emplace_back(f * 7.31f - 200.0f, f * 3.17f - 60.0f, f * -5.53f + 90.0f);
    }
    return points;
}

} // namespace

// =============================================================================
// NoiseGenerator Tests
// =============================================================================

class NoiseGeneratorTest : public ::testing::Test {
protected:
    NoiseGenerator noise{42};
};

TEST_F(NoiseGeneratorTest, SameSeedProducesSameValues) {
    NoiseGenerator other(42);
    for (const auto& p : SamplePoints()) {
        EXPECT_EQ(noise.Perlin(p.x * 0.1f, p.y * 0.1f, p.z * 0.1f),
                  other.Perlin(p.x * 0.1f, p.y * 0.1f, p.z * 0.1f));
    }
}

TEST_F(NoiseGeneratorTest, DifferentSeedsDiffer) {
    NoiseGenerator other(43);
    int differing = 0;
    for (const auto& p : SamplePoints()) {
        if (noise.Perlin(p.x * 0.1f, p.y * 0.1f, p.z * 0.1f) != other.Perlin(p.x * 0.1f, p.y * 0.1f, p.z * 0.1f)) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 0);
}

TEST_F(NoiseGeneratorTest, ZeroOnLatticePoints) {
    EXPECT_FLOAT_EQ(0.0f, noise.Perlin(0.0f, 0.0f, 0.0f));
    EXPECT_FLOAT_EQ(0.0f, noise.Perlin(3.0f, -7.0f, 12.0f));
    EXPECT_FLOAT_EQ(0.0f, noise.Perlin(-100.0f, 5.0f, 256.0f));
}

TEST_F(NoiseGeneratorTest, OutputIsSignedAndBounded) {
    bool sawNegative = false;
    bool sawPositive = false;
    for (const auto& p : SamplePoints()) {
        const float v = noise.Perlin(p.x * 0.137f, p.y * 0.137f, p.z * 0.137f);
        EXPECT_LE(std::abs(v), 1.1f);
        sawNegative |= v < 0.0f;
        sawPositive |= v > 0.0f;
    }
    EXPECT_TRUE(sawNegative);
    EXPECT_TRUE(sawPositive);
}

TEST_F(NoiseGeneratorTest, FractalStaysWithinSingleOctaveBounds) {
    for (const auto& p : SamplePoints()) {
        const float v = noise.Fractal(p.x * 0.05f, p.y * 0.05f, p.z * 0.05f, 5);
        EXPECT_LE(std::abs(v), 1.1f);
    }
    EXPECT_FLOAT_EQ(0.0f, noise.Fractal(1.0f, 2.0f, 3.0f, 0));
}

// =============================================================================
// DensityField Tests
// =============================================================================

class DensityFieldTest : public ::testing::Test {
protected:
    DensityField field{DensityConfig{}};
};

TEST_F(DensityFieldTest, DeterministicForSameConfig) {
    DensityField other{DensityConfig{}};
    for (const auto& p : SamplePoints()) {
        EXPECT_EQ(field.Density(p), other.Density(p));
        EXPECT_EQ(field.Density(p), field.Density(p.x, p.y, p.z));
    }
}

TEST_F(DensityFieldTest, SeedChangesTheField) {
    DensityConfig config;
    config.seed = 7;
    DensityField other(config);

    int differing = 0;
    for (const auto& p : SamplePoints()) {
        if (field.Density(p) != other.Density(p)) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 0);
}

TEST_F(DensityFieldTest, OpenAirHighAbove) {
    for (float x = -300.0f; x <= 300.0f; x += 37.0f) {
        EXPECT_LT(field.Density(x, 500.0f, x * 0.5f), 0.0f);
    }
}

TEST_F(DensityFieldTest, FlatWhenAllAmplitudesAreZero) {
    DensityField flat(MakeFlatConfig(30.0f).density);

    for (const auto& p : SamplePoints()) {
        EXPECT_FLOAT_EQ(30.0f - p.y, flat.Density(p));
    }
    EXPECT_FLOAT_EQ(0.0f, flat.Density(12.0f, 30.0f, -4.0f));
    EXPECT_GT(flat.Density(0.0f, 29.0f, 0.0f), 0.0f);
    EXPECT_LT(flat.Density(0.0f, 31.0f, 0.0f), 0.0f);
}

TEST_F(DensityFieldTest, CavesOnlyRemoveMaterialBelowCeiling) {
    DensityConfig withCaves;
    DensityConfig withoutCaves;
    withoutCaves.caveAmplitude = 0.0f;

    DensityField carved(withCaves);
    DensityField solid(withoutCaves);

    for (float y = -80.0f; y < 120.0f; y += 4.0f) {
        for (float x = -120.0f; x <= 120.0f; x += 24.0f) {
            const float z = x * 0.7f + 11.0f;
            if (y < withCaves.caveCeiling) {
                EXPECT_LE(carved.Density(x, y, z), solid.Density(x, y, z));
            } else {
                EXPECT_EQ(carved.Density(x, y, z), solid.Density(x, y, z));
            }
        }
    }
}

TEST_F(DensityFieldTest, GradientOfFlatFieldPointsDown) {
    DensityField flat(MakeFlatConfig(30.0f).density);
    const glm::vec3 gradient = flat.Gradient(glm::vec3(5.0f, 30.0f, 5.0f), 0.01f);

    EXPECT_VEC3_NEAR(glm::vec3(0.0f, -1.0f, 0.0f), gradient, 1e-3f);
}
