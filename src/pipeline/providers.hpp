// File: src/pipeline/providers.hpp
#pragma once

#include "core/zone.hpp"
#include "raster/elevation_surface.hpp"
#include "storage/csv_table.hpp"
#include <string>
#include <vector>

namespace floodvi {

// ============================================================================
// Input Providers
// ============================================================================
//
// The pipeline reads its three inputs through these interfaces so that file
// formats stay outside the scoring core. Every Load() reports an absent or
// unreadable source with MissingInputError.

/// Source of the elevation surface
class SurfaceProvider {
public:
    virtual ~SurfaceProvider() = default;

    /// @throws MissingInputError if the surface cannot be read
    virtual ElevationSurface Load() = 0;

    /// Path or other identifier, for messages
    virtual std::string Describe() const = 0;
};

/// Source of the zone boundaries
class BoundaryProvider {
public:
    virtual ~BoundaryProvider() = default;

    /// Zones in source order. Features without an id value receive
    /// synthesized ids W01, W02, ... in iteration order.
    /// @throws MissingInputError if the boundaries cannot be read
    /// @throws std::invalid_argument on duplicate zone ids
    virtual ZoneCollection Load() = 0;

    virtual std::string Describe() const = 0;
};

/// Source of the per-zone socioeconomic attributes
class SocioeconomicProvider {
public:
    virtual ~SocioeconomicProvider() = default;

    /// Read the table under the given factor contract
    /// @throws MissingInputError if the table is unreadable or lacks a required column
    virtual SourceFactorTable Load(const std::vector<FactorSpec>& specs) = 0;

    virtual std::string Describe() const = 0;
};

/// Socioeconomic attributes from a CSV file keyed by zone id
class CsvSocioeconomicProvider : public SocioeconomicProvider {
public:
    struct Config {
        std::string path;
        std::vector<std::string> id_columns{"zone_id", "ward_id"};
        std::vector<std::string> name_columns{"zone_name", "ward_name"};
    };

    explicit CsvSocioeconomicProvider(const Config& config);

    SourceFactorTable Load(const std::vector<FactorSpec>& specs) override;
    std::string Describe() const override { return config_.path; }

private:
    Config config_;
};

} // namespace floodvi
