// File: src/raster/zonal_stats_extractor.cpp
#include "raster/zonal_stats_extractor.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace floodvi {

double ZoneStatistics::PercentBelow(const std::string& name) const {
    for (const auto& fraction : below) {
        if (fraction.name == name) {
            return fraction.percent;
        }
    }
    return 0.0;
}

// ============================================================================
// Construction
// ============================================================================

ZonalStatsExtractor::ZonalStatsExtractor()
    : ZonalStatsExtractor(Config()) {}

ZonalStatsExtractor::ZonalStatsExtractor(const Config& config)
    : thresholds_(config.thresholds) {
    for (double t : thresholds_) {
        if (!std::isfinite(t)) {
            throw std::invalid_argument("Elevation threshold must be finite");
        }
    }
    std::sort(thresholds_.begin(), thresholds_.end());
    thresholds_.erase(std::unique(thresholds_.begin(), thresholds_.end()), thresholds_.end());

    threshold_names_.reserve(thresholds_.size());
    for (double t : thresholds_) {
        threshold_names_.push_back(ThresholdFactorName(t));
    }
}

std::vector<std::string> ZonalStatsExtractor::FactorNames() const {
    std::vector<std::string> names = {
        factors::ELEVATION_MEAN,
        factors::ELEVATION_MIN,
        factors::ELEVATION_MAX,
    };
    names.insert(names.end(), threshold_names_.begin(), threshold_names_.end());
    return names;
}

// ============================================================================
// Extraction
// ============================================================================

std::map<std::string, ZoneStatistics> ZonalStatsExtractor::Extract(
    const ElevationSurface& surface,
    const ZoneCollection& zones,
    const CoordinateTransformer* transformer) const {

    if (surface.crs().empty()) {
        throw std::invalid_argument("Elevation surface does not declare a coordinate reference");
    }

    const bool crs_mismatch = transformer == nullptr &&
                              !zones.crs().empty() &&
                              zones.crs() != surface.crs();

    std::map<std::string, ZoneStatistics> results;
    for (const auto& zone : zones) {
        if (crs_mismatch) {
            results.emplace(zone.id, Degraded(zone.id, "CRS mismatch between zones and surface"));
            continue;
        }

        try {
            if (transformer != nullptr) {
                Geometry projected = transformer->Transform(zone.geometry);
                results.emplace(zone.id, ExtractZone(surface, zone.id, projected));
            } else {
                results.emplace(zone.id, ExtractZone(surface, zone.id, zone.geometry));
            }
        } catch (const std::exception& e) {
            results.emplace(zone.id, Degraded(zone.id, e.what()));
        }
    }

    return results;
}

ZoneStatistics ZonalStatsExtractor::ExtractZone(
    const ElevationSurface& surface,
    const std::string& zone_id,
    const Geometry& geometry) const {

    std::string invalid = geometry.ValidationError();
    if (!invalid.empty()) {
        return Degraded(zone_id, "invalid geometry: " + invalid);
    }

    BoundingBox bounds = geometry.Bounds();
    if (!bounds.Intersects(surface.Extent())) {
        return Degraded(zone_id, "zone lies outside the surface extent");
    }

    auto window = surface.WindowFor(bounds);

    size_t count = 0;
    double sum = 0.0;
    double min_value = std::numeric_limits<double>::infinity();
    double max_value = -std::numeric_limits<double>::infinity();
    std::vector<size_t> below_counts(thresholds_.size(), 0);

    for (size_t row = window.row_begin; row < window.row_end; ++row) {
        for (size_t col = window.col_begin; col < window.col_end; ++col) {
            float sample = surface.At(col, row);
            if (!surface.IsValidSample(sample)) {
                continue;
            }
            Point centre = surface.PixelCenter(col, row);
            if (!geometry.Contains(centre.x, centre.y)) {
                continue;
            }

            double value = static_cast<double>(sample);
            ++count;
            sum += value;
            min_value = std::min(min_value, value);
            max_value = std::max(max_value, value);
            for (size_t i = 0; i < thresholds_.size(); ++i) {
                if (value < thresholds_[i]) {
                    ++below_counts[i];
                }
            }
        }
    }

    if (count == 0) {
        return Degraded(zone_id, "no valid samples inside zone");
    }

    ZoneStatistics stats;
    stats.zone_id = zone_id;
    stats.valid_samples = count;
    stats.mean = sum / static_cast<double>(count);
    stats.min = min_value;
    stats.max = max_value;
    stats.below.reserve(thresholds_.size());
    for (size_t i = 0; i < thresholds_.size(); ++i) {
        double percent = static_cast<double>(below_counts[i]) / static_cast<double>(count) * 100.0;
        stats.below.push_back({thresholds_[i], threshold_names_[i], percent});
    }
    return stats;
}

ZoneStatistics ZonalStatsExtractor::Degraded(const std::string& zone_id,
                                             const std::string& reason) const {
    ZoneStatistics stats;
    stats.zone_id = zone_id;
    stats.degraded = true;
    stats.degraded_reason = reason;
    stats.below.reserve(thresholds_.size());
    for (size_t i = 0; i < thresholds_.size(); ++i) {
        stats.below.push_back({thresholds_[i], threshold_names_[i], 0.0});
    }
    return stats;
}

// ============================================================================
// Table conversion
// ============================================================================

FactorTable ZonalStatsExtractor::ToFactorTable(
    const std::map<std::string, ZoneStatistics>& stats,
    const std::vector<std::string>& zone_order) const {

    FactorTable table(FactorNames());
    for (const auto& id : zone_order) {
        auto it = stats.find(CanonicalZoneId(id));
        if (it == stats.end()) {
            continue;
        }
        const ZoneStatistics& zs = it->second;
        table.AddZone(zs.zone_id);
        table.Set(zs.zone_id, factors::ELEVATION_MEAN, zs.mean);
        table.Set(zs.zone_id, factors::ELEVATION_MIN, zs.min);
        table.Set(zs.zone_id, factors::ELEVATION_MAX, zs.max);
        for (const auto& fraction : zs.below) {
            table.Set(zs.zone_id, fraction.name, fraction.percent);
        }
    }
    return table;
}

std::vector<DegradedZoneWarning> ZonalStatsExtractor::CollectWarnings(
    const std::map<std::string, ZoneStatistics>& stats,
    const std::vector<std::string>& zone_order) {

    std::vector<DegradedZoneWarning> warnings;
    for (const auto& id : zone_order) {
        auto it = stats.find(CanonicalZoneId(id));
        if (it != stats.end() && it->second.degraded) {
            warnings.push_back({it->second.zone_id, it->second.degraded_reason});
        }
    }
    return warnings;
}

} // namespace floodvi
