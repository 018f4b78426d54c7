#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Strata {

/**
 * @brief Configuration error codes
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error);

/**
 * @brief Noise composition of the density field
 *
 * Amplitudes of zero disable the corresponding term. With every amplitude at zero
 * the field is exactly groundLevel - y.
 */
struct DensityConfig {
    uint32_t seed = 1337;
    float groundLevel = 30.0f;
    float densityScale = 0.01f;       // Frequency of the macro terrain noise

    float terrainAmplitude = 20.0f;
    float ridgeAmplitude = 15.0f;

    float caveFrequencyPrimary = 0.03f;
    float caveFrequencySecondary = 0.02f;
    float caveThreshold = -0.3f;
    float caveCeiling = 50.0f;
    float caveAmplitude = 10.0f;      // Carved density is min(density, cave * amplitude)

    float islandMinHeight = 60.0f;
    float islandCutoff = 0.6f;
    float islandAmplitude = 50.0f;

    float detailFrequency = 0.1f;
    float detailAmplitude = 3.0f;
};

/**
 * @brief Height and slope bands used to color mesh vertices
 */
struct MaterialConfig {
    float snowHeight = 80.0f;
    float rockHeight = 60.0f;
    float grassHeight = 30.0f;
    float dirtHeight = 20.0f;
    float slopeThreshold = 0.7f;      // |normal.y| below this counts as steep
    float colorJitter = 0.1f;
    uint32_t jitterSeed = 0;
    float normalStep = 0.01f;
};

/**
 * @brief Chunk layout, streaming budgets and LOD distances
 */
struct StreamingConfig {
    int chunkSize = 32;               // Voxels per chunk edge
    float voxelSize = 1.0f;           // World units per voxel
    float isoLevel = 0.0f;
    int renderDistance = 8;           // In chunks
    int hysteresis = 2;               // Extra chunks before unloading
    int verticalMin = -2;             // Vertical band relative to the viewer chunk
    int verticalMax = 4;
    int loadsPerTick = 2;
    int unloadsPerTick = 2;
    int maxLODLevels = 4;
    float lodNearDistance = 100.0f;
    float lodFarDistance = 200.0f;
};

/**
 * @brief Parameters of height and ray queries
 */
struct QueryConfig {
    float heightSearchMin = -100.0f;
    float heightSearchMax = 200.0f;
    int heightSearchIterations = 20;
    float raycastStep = 1.0f;
    float defaultRaycastDistance = 100.0f;
    int maxRaycastSteps = 4096;       // Upper bound on samples per ray
};

/**
 * @brief Complete terrain configuration
 */
struct TerrainConfig {
    DensityConfig density;
    MaterialConfig material;
    StreamingConfig streaming;
    QueryConfig query;

    /**
     * @brief World-space edge length of a chunk
     */
    [[nodiscard]] float ChunkWorldSize() const {
        return static_cast<float>(streaming.chunkSize) * streaming.voxelSize;
    }
};

// JSON mapping. Missing keys keep their defaults.
void to_json(nlohmann::json& j, const DensityConfig& c);
void from_json(const nlohmann::json& j, DensityConfig& c);
void to_json(nlohmann::json& j, const MaterialConfig& c);
void from_json(const nlohmann::json& j, MaterialConfig& c);
void to_json(nlohmann::json& j, const StreamingConfig& c);
void from_json(const nlohmann::json& j, StreamingConfig& c);
void to_json(nlohmann::json& j, const QueryConfig& c);
void from_json(const nlohmann::json& j, QueryConfig& c);
void to_json(nlohmann::json& j, const TerrainConfig& c);
void from_json(const nlohmann::json& j, TerrainConfig& c);

/**
 * @brief Check value ranges
 * @return Empty on success, otherwise a description of the first invalid field
 */
[[nodiscard]] std::string ValidateTerrainConfig(const TerrainConfig& config);

/**
 * @brief Parse and validate a configuration from JSON text
 */
[[nodiscard]] std::expected<TerrainConfig, ConfigError> ParseTerrainConfig(std::string_view text);

/**
 * @brief Load and validate a configuration file
 */
[[nodiscard]] std::expected<TerrainConfig, ConfigError> LoadTerrainConfig(const std::filesystem::path& filepath);

/**
 * @brief Write a configuration file, creating parent directories
 */
std::expected<void, ConfigError> SaveTerrainConfig(const TerrainConfig& config, const std::filesystem::path& filepath);

} // namespace Strata
