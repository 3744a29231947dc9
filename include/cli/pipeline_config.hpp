// File: include/cli/pipeline_config.hpp
//
// YAML Configuration Support for the floodvi pipeline
// Input locations, output locations, extraction thresholds and weights

#ifndef FLOODVI_PIPELINE_CONFIG_HPP
#define FLOODVI_PIPELINE_CONFIG_HPP

#include "raster/zonal_stats_extractor.hpp"
#include "scoring/vulnerability_aggregator.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// Configuration structure for a vulnerability run
struct PipelineConfig {
    // === Input Sources ===
    struct Inputs {
        std::string dem_path = "data/dem.tif";
        std::string boundaries_path = "data/wards.shp";
        std::string boundaries_layer;                   // Empty: first layer
        std::string socioeconomic_path = "data/socioeconomic.csv";
        std::string zone_id_field = "zone_id";          // "ward_id" is also accepted
        std::string zone_name_field = "zone_name";      // "ward_name" is also accepted
    } inputs;

    // === Output Locations ===
    struct Outputs {
        std::string output_dir = "output";
        std::string geometry_file = "overall_vulnerability.geojson";
        std::string geometry_driver = "GeoJSON";        // Any OGR vector driver
        std::string database_path;                      // Empty: no run archive
    } outputs;

    // === Zonal Extraction ===
    struct Extraction {
        std::vector<double> thresholds = {5.0, 10.0};   // Elevation, surface units
    } extraction;

    // === Factor Weights ===
    // Physical keys: elevation_mean, elevation_min, elevation_max and
    // pct_below_<t>m for each configured threshold.
    std::map<std::string, double> physical_weights = {
        {"elevation_mean", 0.30},
        {"elevation_min", 0.30},
        {"pct_below_5m", 0.25},
        {"pct_below_10m", 0.15},
    };

    std::map<std::string, double> socioeconomic_weights = {
        {"population_density", 0.25},
        {"poverty_index", 0.25},
        {"vulnerable_population_pct", 0.20},
        {"slum_household_pct", 0.20},
        {"concrete_building_pct", 0.10},
    };

    // === Overall Blend ===
    struct Overall {
        double physical_weight = 0.6;
        double socioeconomic_weight = 0.4;
        double neutral_value = 50.0;    // Substituted for a missing category
    } overall;

    // === Logging ===
    struct Logging {
        bool verbose = false;
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Physical factor declarations with the configured weights.
    /// Elevation statistics are descending, threshold percentages ascending;
    /// all are required.
    std::vector<FactorSpec> PhysicalFactors() const;

    /// Socioeconomic factor declarations with the configured weights
    std::vector<FactorSpec> SocioeconomicFactors() const;

    ZonalStatsExtractor::Config ExtractorConfig() const;
    VulnerabilityAggregator::Config AggregatorConfig() const;

    /// Candidate attribute names for the zone id, configured name first
    std::vector<std::string> ZoneIdFields() const;

    /// Candidate attribute names for the zone name, configured name first
    std::vector<std::string> ZoneNameFields() const;

    /// Create default configuration
    static PipelineConfig Default();
};

} // namespace floodvi

#endif // FLOODVI_PIPELINE_CONFIG_HPP
