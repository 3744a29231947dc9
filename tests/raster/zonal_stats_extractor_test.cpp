// File: tests/raster/zonal_stats_extractor_test.cpp
#include "raster/zonal_stats_extractor.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace floodvi {
namespace {

const char* kCrs = "EPSG:32643";

Ring Square(double x0, double y0, double size) {
    return {{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}, {x0, y0}};
}

Zone MakeZone(const std::string& id, const Ring& ring) {
    Zone zone;
    zone.id = id;
    zone.geometry = Geometry::FromRing(ring);
    return zone;
}

// 10 x 10 grid of 1 m pixels covering [0, 10] x [0, 10]; sample = row
ElevationSurface RowRamp() {
    std::vector<float> samples;
    for (size_t row = 0; row < 10; ++row) {
        for (size_t col = 0; col < 10; ++col) {
            samples.push_back(static_cast<float>(row));
        }
    }
    return ElevationSurface(10, 10, samples, GeoTransform::FromOrigin(0, 10, 1, 1),
                            -9999.0, kCrs);
}

/// Shifts every vertex by a fixed offset
class ShiftTransformer : public CoordinateTransformer {
public:
    ShiftTransformer(double dx, double dy) : dx_(dx), dy_(dy) {}

    Geometry Transform(const Geometry& geometry) const override {
        Geometry moved = geometry;
        for (auto& polygon : moved.polygons()) {
            for (auto& p : polygon.exterior) {
                p.x += dx_;
                p.y += dy_;
            }
        }
        return moved;
    }

    std::string Describe() const override { return "shift"; }

private:
    double dx_;
    double dy_;
};

class FailingTransformer : public CoordinateTransformer {
public:
    Geometry Transform(const Geometry&) const override {
        throw std::runtime_error("vertex outside projection domain");
    }
    std::string Describe() const override { return "failing"; }
};

// ============================================================================
// Construction
// ============================================================================

TEST(ZonalStatsExtractorTest, ThresholdsAreSortedAndDeduplicated) {
    ZonalStatsExtractor::Config config;
    config.thresholds = {10.0, 5.0, 10.0, 2.5};
    ZonalStatsExtractor extractor(config);

    std::vector<double> expected = {2.5, 5.0, 10.0};
    EXPECT_EQ(expected, extractor.thresholds());

    std::vector<std::string> names = {"elevation_mean", "elevation_min", "elevation_max",
                                      "pct_below_2.5m", "pct_below_5m", "pct_below_10m"};
    EXPECT_EQ(names, extractor.FactorNames());
}

TEST(ZonalStatsExtractorTest, RejectsNonFiniteThreshold) {
    ZonalStatsExtractor::Config config;
    config.thresholds = {std::numeric_limits<double>::quiet_NaN()};
    EXPECT_THROW(ZonalStatsExtractor extractor(config), std::invalid_argument);
}

// ============================================================================
// Statistics
// ============================================================================

TEST(ZonalStatsExtractorTest, UniformSurfaceAtThreshold) {
    auto surface = ElevationSurface::Filled(10, 10, 10.0f, GeoTransform::FromOrigin(0, 10, 1, 1),
                                            std::nullopt, kCrs);
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(surface, "W01", Geometry::FromRing(Square(2, 2, 4)));

    EXPECT_FALSE(stats.degraded);
    EXPECT_EQ(16u, stats.valid_samples);
    EXPECT_DOUBLE_EQ(10.0, stats.mean);
    EXPECT_DOUBLE_EQ(10.0, stats.min);
    EXPECT_DOUBLE_EQ(10.0, stats.max);
    // Strictly below: a sample equal to the threshold does not count
    EXPECT_DOUBLE_EQ(0.0, stats.PercentBelow("pct_below_5m"));
    EXPECT_DOUBLE_EQ(0.0, stats.PercentBelow("pct_below_10m"));
}

TEST(ZonalStatsExtractorTest, PixelCentreInclusion) {
    ZonalStatsExtractor extractor;
    // Covers columns 0-9 of rows 0-3 (y from 6 to 10)
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W01", Geometry::FromRing(Square(0, 6, 10)));

    EXPECT_EQ(40u, stats.valid_samples);
    EXPECT_DOUBLE_EQ(0.0, stats.min);
    EXPECT_DOUBLE_EQ(3.0, stats.max);
    EXPECT_DOUBLE_EQ(1.5, stats.mean);
    EXPECT_DOUBLE_EQ(100.0, stats.PercentBelow("pct_below_5m"));
}

TEST(ZonalStatsExtractorTest, ThresholdPercentages) {
    ZonalStatsExtractor extractor;
    // Whole grid: rows 0..9, ten samples each
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W01", Geometry::FromRing(Square(0, 0, 10)));

    EXPECT_EQ(100u, stats.valid_samples);
    EXPECT_DOUBLE_EQ(4.5, stats.mean);
    EXPECT_DOUBLE_EQ(50.0, stats.PercentBelow("pct_below_5m"));
    EXPECT_DOUBLE_EQ(100.0, stats.PercentBelow("pct_below_10m"));
    EXPECT_DOUBLE_EQ(0.0, stats.PercentBelow("pct_below_99m"));
}

TEST(ZonalStatsExtractorTest, NodataAndNanAreExcluded) {
    std::vector<float> samples = {1.0f, -9999.0f, std::nanf(""), 7.0f};
    ElevationSurface surface(2, 2, samples, GeoTransform::FromOrigin(0, 2, 1, 1), -9999.0, kCrs);
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(surface, "W01", Geometry::FromRing(Square(0, 0, 2)));

    EXPECT_EQ(2u, stats.valid_samples);
    EXPECT_DOUBLE_EQ(4.0, stats.mean);
    EXPECT_DOUBLE_EQ(1.0, stats.min);
    EXPECT_DOUBLE_EQ(7.0, stats.max);
    EXPECT_DOUBLE_EQ(50.0, stats.PercentBelow("pct_below_5m"));
}

TEST(ZonalStatsExtractorTest, HoleExcludesPixels) {
    Polygon polygon;
    polygon.exterior = Square(0, 0, 10);
    polygon.holes.push_back(Square(0, 0, 5));
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W01", Geometry(polygon));

    // Hole [0,5]x[0,5] removes 25 centres from rows 5-9
    EXPECT_EQ(75u, stats.valid_samples);
}

// ============================================================================
// Degraded zones
// ============================================================================

TEST(ZonalStatsExtractorTest, ZoneOutsideExtentIsDegraded) {
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W09", Geometry::FromRing(Square(50, 50, 5)));

    EXPECT_TRUE(stats.degraded);
    EXPECT_EQ("zone lies outside the surface extent", stats.degraded_reason);
    EXPECT_EQ(0u, stats.valid_samples);
    EXPECT_DOUBLE_EQ(0.0, stats.mean);
    EXPECT_DOUBLE_EQ(0.0, stats.min);
    EXPECT_DOUBLE_EQ(0.0, stats.max);
    ASSERT_EQ(2u, stats.below.size());
    EXPECT_DOUBLE_EQ(0.0, stats.below[0].percent);
}

TEST(ZonalStatsExtractorTest, AllNodataZoneIsDegraded) {
    auto surface = ElevationSurface::Filled(4, 4, -9999.0f, GeoTransform::FromOrigin(0, 4, 1, 1),
                                            -9999.0, kCrs);
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(surface, "W01", Geometry::FromRing(Square(0, 0, 4)));
    EXPECT_TRUE(stats.degraded);
    EXPECT_EQ("no valid samples inside zone", stats.degraded_reason);
}

TEST(ZonalStatsExtractorTest, ZoneSmallerThanPixelWithoutCentreIsDegraded) {
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W01", Geometry::FromRing(Square(0.1, 0.1, 0.2)));
    EXPECT_TRUE(stats.degraded);
    EXPECT_EQ("no valid samples inside zone", stats.degraded_reason);
}

TEST(ZonalStatsExtractorTest, InvalidGeometryIsDegraded) {
    ZonalStatsExtractor extractor;
    ZoneStatistics stats = extractor.ExtractZone(RowRamp(), "W01", Geometry());
    EXPECT_TRUE(stats.degraded);
    EXPECT_EQ(0u, stats.degraded_reason.find("invalid geometry: "));
}

// ============================================================================
// Collections
// ============================================================================

TEST(ZonalStatsExtractorTest, ExtractCoversEveryZoneIndependently) {
    ZoneCollection zones(kCrs);
    zones.Add(MakeZone("W01", Square(0, 0, 10)));
    zones.Add(MakeZone("W02", Square(100, 100, 1)));
    zones.Add(MakeZone("W03", Square(0, 6, 10)));

    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones);

    ASSERT_EQ(3u, stats.size());
    EXPECT_FALSE(stats.at("W01").degraded);
    EXPECT_TRUE(stats.at("W02").degraded);
    EXPECT_FALSE(stats.at("W03").degraded);

    auto warnings = ZonalStatsExtractor::CollectWarnings(stats, zones.Ids());
    ASSERT_EQ(1u, warnings.size());
    EXPECT_EQ("W02", warnings[0].zone_id);
}

TEST(ZonalStatsExtractorTest, CrsMismatchWithoutTransformerDegradesAll) {
    ZoneCollection zones("EPSG:4326");
    zones.Add(MakeZone("W01", Square(0, 0, 10)));
    zones.Add(MakeZone("W02", Square(0, 0, 5)));

    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones);
    for (const auto& entry : stats) {
        EXPECT_TRUE(entry.second.degraded);
        EXPECT_EQ("CRS mismatch between zones and surface", entry.second.degraded_reason);
    }
}

TEST(ZonalStatsExtractorTest, UndeclaredZoneCrsIsAssumedToMatch) {
    ZoneCollection zones;
    zones.Add(MakeZone("W01", Square(0, 0, 10)));
    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones);
    EXPECT_FALSE(stats.at("W01").degraded);
}

TEST(ZonalStatsExtractorTest, TransformerMovesZonesIntoSurfaceCrs) {
    ZoneCollection zones("EPSG:4326");
    zones.Add(MakeZone("W01", Square(-100, -100, 10)));

    ShiftTransformer shift(100, 100);
    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones, &shift);
    EXPECT_FALSE(stats.at("W01").degraded);
    EXPECT_EQ(100u, stats.at("W01").valid_samples);
}

TEST(ZonalStatsExtractorTest, TransformFailureDegradesZone) {
    ZoneCollection zones("EPSG:4326");
    zones.Add(MakeZone("W01", Square(0, 0, 10)));

    FailingTransformer failing;
    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones, &failing);
    EXPECT_TRUE(stats.at("W01").degraded);
    EXPECT_EQ("vertex outside projection domain", stats.at("W01").degraded_reason);
}

TEST(ZonalStatsExtractorTest, SurfaceWithoutCrsIsRejected) {
    auto surface = ElevationSurface::Filled(2, 2, 1.0f, GeoTransform::FromOrigin(0, 2, 1, 1),
                                            std::nullopt, "");
    ZoneCollection zones;
    zones.Add(MakeZone("W01", Square(0, 0, 2)));
    ZonalStatsExtractor extractor;
    EXPECT_THROW(extractor.Extract(surface, zones), std::invalid_argument);
}

TEST(ZonalStatsExtractorTest, ToFactorTableFollowsZoneOrder) {
    ZoneCollection zones(kCrs);
    zones.Add(MakeZone("W02", Square(0, 0, 10)));
    zones.Add(MakeZone("W01", Square(100, 100, 1)));

    ZonalStatsExtractor extractor;
    auto stats = extractor.Extract(RowRamp(), zones);
    FactorTable table = extractor.ToFactorTable(stats, zones.Ids());

    std::vector<std::string> expected = {"W02", "W01"};
    EXPECT_EQ(expected, table.ZoneIds());
    EXPECT_EQ(5u, table.FactorCount());
    EXPECT_DOUBLE_EQ(4.5, *table.Get("W02", "elevation_mean"));
    EXPECT_DOUBLE_EQ(50.0, *table.Get("W02", "pct_below_5m"));
    // Degraded zones carry the 0.0 sentinel, not a missing cell
    ASSERT_TRUE(table.Get("W01", "elevation_min").has_value());
    EXPECT_DOUBLE_EQ(0.0, *table.Get("W01", "elevation_min"));
}

} // namespace
} // namespace floodvi
