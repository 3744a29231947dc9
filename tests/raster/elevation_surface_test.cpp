// File: tests/raster/elevation_surface_test.cpp
#include "raster/elevation_surface.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

namespace floodvi {
namespace {

// ============================================================================
// GeoTransform
// ============================================================================

TEST(GeoTransformTest, FromOriginIsNorthUp) {
    GeoTransform gt = GeoTransform::FromOrigin(100.0, 200.0, 2.0, 2.0);
    EXPECT_DOUBLE_EQ(2.0, gt.PixelWidth());
    EXPECT_DOUBLE_EQ(-2.0, gt.PixelHeight());

    Point corner = gt.Apply(0, 0);
    EXPECT_DOUBLE_EQ(100.0, corner.x);
    EXPECT_DOUBLE_EQ(200.0, corner.y);

    Point p = gt.Apply(3, 4);
    EXPECT_DOUBLE_EQ(106.0, p.x);
    EXPECT_DOUBLE_EQ(192.0, p.y);
}

TEST(GeoTransformTest, InvertUndoesApply) {
    GeoTransform gt = GeoTransform::FromOrigin(-50.0, 75.0, 0.5, 0.25);
    Point world = gt.Apply(7.5, 3.25);
    Point pixel = gt.Invert(world.x, world.y);
    EXPECT_NEAR(7.5, pixel.x, 1e-9);
    EXPECT_NEAR(3.25, pixel.y, 1e-9);
}

TEST(GeoTransformTest, SingularTransformCannotInvert) {
    GeoTransform gt;
    gt.coefficients = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    EXPECT_THROW(gt.Invert(1.0, 1.0), std::invalid_argument);
}

// ============================================================================
// ElevationSurface
// ============================================================================

TEST(ElevationSurfaceTest, RejectsWrongSampleCount) {
    EXPECT_THROW(ElevationSurface(3, 3, std::vector<float>(8, 1.0f),
                                  GeoTransform::FromOrigin(0, 3, 1, 1), std::nullopt, "EPSG:32643"),
                 std::invalid_argument);
}

TEST(ElevationSurfaceTest, RejectsDegenerateTransform) {
    GeoTransform gt;
    gt.coefficients = {0.0, 1.0, 0.0, 0.0, 0.0, 0.0};
    EXPECT_THROW(ElevationSurface::Filled(2, 2, 1.0f, gt, std::nullopt, "EPSG:32643"),
                 std::invalid_argument);
}

TEST(ElevationSurfaceTest, SampleValidity) {
    auto surface = ElevationSurface::Filled(2, 2, 1.0f, GeoTransform::FromOrigin(0, 2, 1, 1),
                                            -9999.0, "EPSG:32643");
    EXPECT_TRUE(surface.IsValidSample(0.0f));
    EXPECT_FALSE(surface.IsValidSample(-9999.0f));
    EXPECT_FALSE(surface.IsValidSample(std::nanf("")));
}

TEST(ElevationSurfaceTest, FloatNodataSentinelMatches) {
    // -3.4e38 is not exactly representable as float
    auto surface = ElevationSurface::Filled(1, 1, 0.0f, GeoTransform::FromOrigin(0, 1, 1, 1),
                                            -3.4e38, "EPSG:4326");
    EXPECT_FALSE(surface.IsValidSample(static_cast<float>(-3.4e38)));
}

TEST(ElevationSurfaceTest, RowMajorAccess) {
    std::vector<float> samples = {1, 2, 3, 4, 5, 6};
    ElevationSurface surface(3, 2, samples, GeoTransform::FromOrigin(0, 2, 1, 1),
                             std::nullopt, "EPSG:32643");
    EXPECT_FLOAT_EQ(1.0f, surface.At(0, 0));
    EXPECT_FLOAT_EQ(3.0f, surface.At(2, 0));
    EXPECT_FLOAT_EQ(4.0f, surface.At(0, 1));
    EXPECT_FLOAT_EQ(6.0f, surface.At(2, 1));
}

TEST(ElevationSurfaceTest, PixelCenterAndExtent) {
    auto surface = ElevationSurface::Filled(4, 2, 0.0f, GeoTransform::FromOrigin(10, 20, 5, 5),
                                            std::nullopt, "EPSG:32643");
    Point centre = surface.PixelCenter(0, 0);
    EXPECT_DOUBLE_EQ(12.5, centre.x);
    EXPECT_DOUBLE_EQ(17.5, centre.y);

    BoundingBox extent = surface.Extent();
    EXPECT_DOUBLE_EQ(10.0, extent.min_x);
    EXPECT_DOUBLE_EQ(30.0, extent.max_x);
    EXPECT_DOUBLE_EQ(10.0, extent.min_y);
    EXPECT_DOUBLE_EQ(20.0, extent.max_y);
}

TEST(ElevationSurfaceTest, WindowIsClippedToGrid) {
    auto surface = ElevationSurface::Filled(10, 10, 0.0f, GeoTransform::FromOrigin(0, 10, 1, 1),
                                            std::nullopt, "EPSG:32643");
    BoundingBox box;
    box.Expand({2.0, 3.0});
    box.Expand({5.0, 6.0});
    auto window = surface.WindowFor(box);
    EXPECT_EQ(2u, window.col_begin);
    EXPECT_EQ(5u, window.col_end);
    EXPECT_EQ(4u, window.row_begin);
    EXPECT_EQ(7u, window.row_end);

    BoundingBox beyond;
    beyond.Expand({-5.0, -5.0});
    beyond.Expand({50.0, 50.0});
    auto clipped = surface.WindowFor(beyond);
    EXPECT_EQ(0u, clipped.col_begin);
    EXPECT_EQ(10u, clipped.col_end);
    EXPECT_EQ(0u, clipped.row_begin);
    EXPECT_EQ(10u, clipped.row_end);

    EXPECT_TRUE(surface.WindowFor(BoundingBox()).IsEmpty());
}

} // namespace
} // namespace floodvi
