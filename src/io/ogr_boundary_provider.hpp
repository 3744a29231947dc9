// File: src/io/ogr_boundary_provider.hpp
#pragma once

#include "pipeline/providers.hpp"
#include <string>
#include <vector>

namespace floodvi {

/// Zone boundaries from any OGR-readable vector source (Shapefile,
/// GeoJSON, GeoPackage).
///
/// The first id field present among id_fields names each zone; when the
/// layer has none of them, or a feature leaves it empty, the zone gets
/// the synthesized id for its feature position (W01, W02, ...). Remaining attributes are kept as strings for spatial output.
class OgrBoundaryProvider : public BoundaryProvider {
public:
    struct Config {
        std::string path;
        std::string layer;  // Empty: first layer
        std::vector<std::string> id_fields{"zone_id", "ward_id"};
        std::vector<std::string> name_fields{"zone_name", "ward_name"};
    };

    explicit OgrBoundaryProvider(const Config& config);

    /// @throws MissingInputError if the source or layer cannot be opened
    /// @throws std::invalid_argument on duplicate zone ids
    ZoneCollection Load() override;

    std::string Describe() const override { return config_.path; }

private:
    Config config_;
};

} // namespace floodvi
