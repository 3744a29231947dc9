// File: src/raster/zonal_stats_extractor.hpp
#pragma once

#include "core/errors.hpp"
#include "core/zone.hpp"
#include "raster/coordinate_transformer.hpp"
#include "raster/elevation_surface.hpp"
#include "scoring/factor_table.hpp"
#include <map>
#include <string>
#include <vector>

namespace floodvi {

/// Percentage of a zone's valid samples strictly below one threshold
struct ThresholdFraction {
    double threshold{0.0};
    std::string name;      // e.g. "pct_below_5m"
    double percent{0.0};   // [0, 100]
};

/// Summary statistics of the surface inside one zone.
///
/// A degraded zone produced no valid sample; every statistic is 0.0.
struct ZoneStatistics {
    std::string zone_id;
    double mean{0.0};
    double min{0.0};
    double max{0.0};
    std::vector<ThresholdFraction> below;
    size_t valid_samples{0};

    bool degraded{false};
    std::string degraded_reason;

    /// Percentage for a threshold factor name, 0.0 if not configured
    double PercentBelow(const std::string& name) const;
};

/// ZonalStatsExtractor: raster-to-zone statistics over polygon boundaries
///
/// The surface's coordinate reference is authoritative: zones are moved
/// into it, the grid is never resampled. A pixel belongs to a zone when its
/// centre lies inside the zone geometry; nodata samples are excluded.
///
/// Zones are independent of each other. A failure inside one zone (invalid
/// geometry, failed reprojection, no overlap) degrades only that zone.
class ZonalStatsExtractor {
public:
    struct Config {
        /// Elevation thresholds in surface units
        std::vector<double> thresholds{5.0, 10.0};
    };

    ZonalStatsExtractor();

    /// @throws std::invalid_argument on a non-finite threshold
    explicit ZonalStatsExtractor(const Config& config);

    /// Extract statistics for every zone.
    /// @param surface Elevation grid; must declare a coordinate reference
    /// @param zones Zone polygons
    /// @param transformer Applied to every zone geometry when given. Without
    ///        one, zones whose declared CRS differs from the surface's are
    ///        degraded.
    /// @return zone id -> statistics, one entry per zone
    /// @throws std::invalid_argument if the surface has no coordinate reference
    std::map<std::string, ZoneStatistics> Extract(
        const ElevationSurface& surface,
        const ZoneCollection& zones,
        const CoordinateTransformer* transformer = nullptr) const;

    /// Statistics for a single geometry already in the surface's CRS
    ZoneStatistics ExtractZone(
        const ElevationSurface& surface,
        const std::string& zone_id,
        const Geometry& geometry) const;

    /// Sorted, de-duplicated thresholds
    const std::vector<double>& thresholds() const { return thresholds_; }

    /// Raw physical factor names produced by this extractor:
    /// elevation_mean, elevation_min, elevation_max, then one per threshold
    std::vector<std::string> FactorNames() const;

    /// Raw physical factor table with rows in zone_order.
    /// Degraded zones carry their 0.0 sentinels as values.
    FactorTable ToFactorTable(
        const std::map<std::string, ZoneStatistics>& stats,
        const std::vector<std::string>& zone_order) const;

    /// Degraded-zone records in zone_order
    static std::vector<DegradedZoneWarning> CollectWarnings(
        const std::map<std::string, ZoneStatistics>& stats,
        const std::vector<std::string>& zone_order);

private:
    ZoneStatistics Degraded(const std::string& zone_id, const std::string& reason) const;

    std::vector<double> thresholds_;
    std::vector<std::string> threshold_names_;
};

} // namespace floodvi
