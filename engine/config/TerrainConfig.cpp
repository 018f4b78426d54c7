#include "config/TerrainConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iterator>

namespace Strata {

const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::InvalidValue: return "invalid value";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

// ============================================================================
// JSON Mapping
// ============================================================================

void to_json(nlohmann::json& j, const DensityConfig& c) {
    j = nlohmann::json{
        {"seed", c.seed},
        {"ground_level", c.groundLevel},
        {"density_scale", c.densityScale},
        {"terrain_amplitude", c.terrainAmplitude},
        {"ridge_amplitude", c.ridgeAmplitude},
        {"cave_frequency_primary", c.caveFrequencyPrimary},
        {"cave_frequency_secondary", c.caveFrequencySecondary},
        {"cave_threshold", c.caveThreshold},
        {"cave_ceiling", c.caveCeiling},
        {"cave_amplitude", c.caveAmplitude},
        {"island_min_height", c.islandMinHeight},
        {"island_cutoff", c.islandCutoff},
        {"island_amplitude", c.islandAmplitude},
        {"detail_frequency", c.detailFrequency},
        {"detail_amplitude", c.detailAmplitude}
    };
}

void from_json(const nlohmann::json& j, DensityConfig& c) {
    c.seed = j.value("seed", c.seed);
    c.groundLevel = j.value("ground_level", c.groundLevel);
    c.densityScale = j.value("density_scale", c.densityScale);
    c.terrainAmplitude = j.value("terrain_amplitude", c.terrainAmplitude);
    c.ridgeAmplitude = j.value("ridge_amplitude", c.ridgeAmplitude);
    c.caveFrequencyPrimary = j.value("cave_frequency_primary", c.caveFrequencyPrimary);
    c.caveFrequencySecondary = j.value("cave_frequency_secondary", c.caveFrequencySecondary);
    c.caveThreshold = j.value("cave_threshold", c.caveThreshold);
    c.caveCeiling = j.value("cave_ceiling", c.caveCeiling);
    c.caveAmplitude = j.value("cave_amplitude", c.caveAmplitude);
    c.islandMinHeight = j.value("island_min_height", c.islandMinHeight);
    c.islandCutoff = j.value("island_cutoff", c.islandCutoff);
    c.islandAmplitude = j.value("island_amplitude", c.islandAmplitude);
    c.detailFrequency = j.value("detail_frequency", c.detailFrequency);
    c.detailAmplitude = j.value("detail_amplitude", c.detailAmplitude);
}

void to_json(nlohmann::json& j, const MaterialConfig& c) {
    j = nlohmann::json{
        {"snow_height", c.snowHeight},
        {"rock_height", c.rockHeight},
        {"grass_height", c.grassHeight},
        {"dirt_height", c.dirtHeight},
        {"slope_threshold", c.slopeThreshold},
        {"color_jitter", c.colorJitter},
        {"jitter_seed", c.jitterSeed},
        {"normal_step", c.normalStep}
    };
}

void from_json(const nlohmann::json& j, MaterialConfig& c) {
    c.snowHeight = j.value("snow_height", c.snowHeight);
    c.rockHeight = j.value("rock_height", c.rockHeight);
    c.grassHeight = j.value("grass_height", c.grassHeight);
    c.dirtHeight = j.value("dirt_height", c.dirtHeight);
    c.slopeThreshold = j.value("slope_threshold", c.slopeThreshold);
    c.colorJitter = j.value("color_jitter", c.colorJitter);
    c.jitterSeed = j.value("jitter_seed", c.jitterSeed);
    c.normalStep = j.value("normal_step", c.normalStep);
}

void to_json(nlohmann::json& j, const StreamingConfig& c) {
    j = nlohmann::json{
        {"chunk_size", c.chunkSize},
        {"voxel_size", c.voxelSize},
        {"iso_level", c.isoLevel},
        {"render_distance", c.renderDistance},
        {"hysteresis", c.hysteresis},
        {"vertical_min", c.verticalMin},
        {"vertical_max", c.verticalMax},
        {"loads_per_tick", c.loadsPerTick},
        {"unloads_per_tick", c.unloadsPerTick},
        {"max_lod_levels", c.maxLODLevels},
        {"lod_near_distance", c.lodNearDistance},
        {"lod_far_distance", c.lodFarDistance}
    };
}

void from_json(const nlohmann::json& j, StreamingConfig& c) {
    c.chunkSize = j.value("chunk_size", c.chunkSize);
    c.voxelSize = j.value("voxel_size", c.voxelSize);
    c.isoLevel = j.value("iso_level", c.isoLevel);
    c.renderDistance = j.value("render_distance", c.renderDistance);
    c.hysteresis = j.value("hysteresis", c.hysteresis);
    c.verticalMin = j.value("vertical_min", c.verticalMin);
    c.verticalMax = j.value("vertical_max", c.verticalMax);
    c.loadsPerTick = j.value("loads_per_tick", c.loadsPerTick);
    c.unloadsPerTick = j.value("unloads_per_tick", c.unloadsPerTick);
    c.maxLODLevels = j.value("max_lod_levels", c.maxLODLevels);
    c.lodNearDistance = j.value("lod_near_distance", c.lodNearDistance);
    c.lodFarDistance = j.value("lod_far_distance", c.lodFarDistance);
}

void to_json(nlohmann::json& j, const QueryConfig& c) {
    j = nlohmann::json{
        {"height_search_min", c.heightSearchMin},
        {"height_search_max", c.heightSearchMax},
        {"height_search_iterations", c.heightSearchIterations},
        {"raycast_step", c.raycastStep},
        {"default_raycast_distance", c.defaultRaycastDistance},
        {"max_raycast_steps", c.maxRaycastSteps}
    };
}

void from_json(const nlohmann::json& j, QueryConfig& c) {
    c.heightSearchMin = j.value("height_search_min", c.heightSearchMin);
    c.heightSearchMax = j.value("height_search_max", c.heightSearchMax);
    c.heightSearchIterations = j.value("height_search_iterations", c.heightSearchIterations);
    c.raycastStep = j.value("raycast_step", c.raycastStep);
    c.defaultRaycastDistance = j.value("default_raycast_distance", c.defaultRaycastDistance);
    c.maxRaycastSteps = j.value("max_raycast_steps", c.maxRaycastSteps);
}

void to_json(nlohmann::json& j, const TerrainConfig& c) {
    j = nlohmann::json{
        {"density", c.density},
        {"material", c.material},
        {"streaming", c.streaming},
        {"query", c.query}
    };
}

void from_json(const nlohmann::json& j, TerrainConfig& c) {
    if (j.contains("density")) j.at("density").get_to(c.density);
    if (j.contains("material")) j.at("material").get_to(c.material);
    if (j.contains("streaming")) j.at("streaming").get_to(c.streaming);
    if (j.contains("query")) j.at("query").get_to(c.query);
}

// ============================================================================
// Validation
// ============================================================================

std::string ValidateTerrainConfig(const TerrainConfig& config) {
    const StreamingConfig& s = config.streaming;
    const QueryConfig& q = config.query;

    if (s.chunkSize < 1) return "streaming.chunk_size must be at least 1";
    if (!(s.voxelSize > 0.0f)) return "streaming.voxel_size must be positive";
    if (s.renderDistance < 0) return "streaming.render_distance must not be negative";
    if (s.hysteresis < 0) return "streaming.hysteresis must not be negative";
    if (s.verticalMin > s.verticalMax) return "streaming.vertical_min exceeds vertical_max";
    if (s.loadsPerTick < 1) return "streaming.loads_per_tick must be at least 1";
    if (s.unloadsPerTick < 1) return "streaming.unloads_per_tick must be at least 1";
    if (s.maxLODLevels < 1) return "streaming.max_lod_levels must be at least 1";
    if (s.lodNearDistance < 0.0f || s.lodNearDistance > s.lodFarDistance) {
        return "streaming.lod_near_distance must be within [0, lod_far_distance]";
    }

    if (!(q.heightSearchMin < q.heightSearchMax)) return "query.height_search_min must be below height_search_max";
    if (q.heightSearchIterations < 1) return "query.height_search_iterations must be at least 1";
    if (!(q.raycastStep > 0.0f)) return "query.raycast_step must be positive";
    if (q.maxRaycastSteps < 1) return "query.max_raycast_steps must be at least 1";

    if (!(config.material.normalStep > 0.0f)) return "material.normal_step must be positive";
    if (config.material.colorJitter < 0.0f) return "material.color_jitter must not be negative";

    return {};
}

// ============================================================================
// File I/O
// ============================================================================

std::expected<TerrainConfig, ConfigError> ParseTerrainConfig(std::string_view text) {
    TerrainConfig config;
    try {
        nlohmann::json data = nlohmann::json::parse(text);
        data.get_to(config);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse terrain config: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    if (std::string problem = ValidateTerrainConfig(config); !problem.empty()) {
        spdlog::error("Invalid terrain config: {}", problem);
        return std::unexpected(ConfigError::InvalidValue);
    }
    return config;
}

std::expected<TerrainConfig, ConfigError> LoadTerrainConfig(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open terrain config: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto result = ParseTerrainConfig(text);
    if (result) {
        spdlog::info("Loaded terrain config from: {}", filepath.string());
    }
    return result;
}

std::expected<void, ConfigError> SaveTerrainConfig(const TerrainConfig& config, const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            spdlog::error("Failed to open terrain config for writing: {}", filepath.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << nlohmann::json(config) << std::endl;
        spdlog::info("Saved terrain config to: {}", filepath.string());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Failed to save terrain config: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

} // namespace Strata
