/**
 * @file bench_terrain.cpp
 * @brief Performance benchmarks for density evaluation, meshing and surface queries
 */

#include <benchmark/benchmark.h>

#include "core/Logger.hpp"
#include "terrain/ChunkManager.hpp"
#include "terrain/DensityField.hpp"
#include "terrain/MarchingCubes.hpp"
#include "terrain/SurfaceQuery.hpp"

using namespace Strata;

// =============================================================================
// Density Benchmarks
// =============================================================================

static void BM_DensityField_Evaluate(benchmark::State& state) {
    DensityField field;
    float x = 0.0f;

    for (auto _ : state) {
        float d = field.Density(x, 25.0f, x * 0.5f);
        benchmark::DoNotOptimize(d);
        x += 0.37f;
    }
}
BENCHMARK(BM_DensityField_Evaluate);

// =============================================================================
// Meshing Benchmarks
// =============================================================================

static void BM_ChunkManager_LoadChunk(benchmark::State& state) {
    Logger::SetLevel(spdlog::level::off);

    TerrainConfig config;
    config.streaming.chunkSize = static_cast<int>(state.range(0));
    DensityField field(config.density);
    ChunkManager chunks(config, [&field](const glm::vec3& p) { return field.Density(p); });

    // The chunk straddling ground level produces a surface
    const glm::ivec3 coord(0, 30 / config.streaming.chunkSize, 0);
    for (auto _ : state) {
        chunks.LoadChunk(coord);
        state.PauseTiming();
        chunks.UnloadChunk(coord);
        state.ResumeTiming();
    }
}
BENCHMARK(BM_ChunkManager_LoadChunk)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond);

static void BM_MarchingCubes_Remesh(benchmark::State& state) {
    Logger::SetLevel(spdlog::level::off);

    TerrainConfig config;
    DensityField field(config.density);
    ChunkManager chunks(config, [&field](const glm::vec3& p) { return field.Density(p); });
    chunks.LoadChunk(glm::ivec3(0, 0, 0));

    for (auto _ : state) {
        chunks.RemeshChunk(glm::ivec3(0, 0, 0));
    }
    state.counters["triangles"] = static_cast<double>(
        chunks.GetChunk(glm::ivec3(0, 0, 0))->GetMesh().GetTriangleCount());
}
BENCHMARK(BM_MarchingCubes_Remesh)->Unit(benchmark::kMillisecond);

// =============================================================================
// Query Benchmarks
// =============================================================================

static void BM_SurfaceQuery_HeightAt(benchmark::State& state) {
    TerrainConfig config;
    DensityField field(config.density);
    SurfaceQuery query(field, config);
    float x = 0.0f;

    for (auto _ : state) {
        float h = query.HeightAt(x, -x);
        benchmark::DoNotOptimize(h);
        x += 1.3f;
    }
}
BENCHMARK(BM_SurfaceQuery_HeightAt);

static void BM_SurfaceQuery_Raycast(benchmark::State& state) {
    TerrainConfig config;
    DensityField field(config.density);
    SurfaceQuery query(field, config);
    const glm::vec3 dir = glm::normalize(glm::vec3(1.0f, -0.5f, 0.3f));
    float x = 0.0f;

    for (auto _ : state) {
        auto hit = query.Raycast(glm::vec3(x, 80.0f, 0.0f), dir, 200.0f);
        benchmark::DoNotOptimize(hit);
        x += 2.1f;
    }
}
BENCHMARK(BM_SurfaceQuery_Raycast);

// Main function for benchmark
BENCHMARK_MAIN();
