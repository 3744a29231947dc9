// File: src/raster/elevation_surface.hpp
#pragma once

#include "core/geometry.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// Affine pixel-to-world transform in GDAL's six-coefficient order:
///   x = c[0] + col * c[1] + row * c[2]
///   y = c[3] + col * c[4] + row * c[5]
/// (col, row) address pixel corners; pixel centres sit at +0.5.
struct GeoTransform {
    std::array<double, 6> coefficients{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};

    /// North-up transform from the top-left corner and pixel size
    static GeoTransform FromOrigin(double west, double north, double pixel_width, double pixel_height);

    Point Apply(double col, double row) const;

    /// Inverse mapping world -> fractional (col, row)
    /// @throws std::invalid_argument if the transform is singular
    Point Invert(double x, double y) const;

    double PixelWidth() const { return coefficients[1]; }
    double PixelHeight() const { return coefficients[5]; }
};

/// Immutable grid of elevation samples with georeferencing.
///
/// Samples are stored row-major, row 0 at the top. A sample is valid when
/// it is not NaN and differs from the nodata sentinel.
class ElevationSurface {
public:
    /// @throws std::invalid_argument if samples.size() != width * height
    ElevationSurface(size_t width, size_t height, std::vector<float> samples,
                     GeoTransform transform, std::optional<double> nodata,
                     std::string crs);

    /// Uniform surface, mostly for fixtures
    static ElevationSurface Filled(size_t width, size_t height, float value,
                                   GeoTransform transform, std::optional<double> nodata,
                                   std::string crs);

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    const GeoTransform& transform() const { return transform_; }
    const std::optional<double>& nodata() const { return nodata_; }
    const std::string& crs() const { return crs_; }

    float At(size_t col, size_t row) const { return samples_[row * width_ + col]; }

    bool IsValidSample(float value) const;

    /// World coordinate of the centre of pixel (col, row)
    Point PixelCenter(size_t col, size_t row) const;

    /// World-space extent of the whole grid
    BoundingBox Extent() const;

    /// Inclusive-exclusive pixel window covering a world-space box,
    /// clipped to the grid. Empty when the box misses the grid.
    struct Window {
        size_t col_begin{0};
        size_t col_end{0};
        size_t row_begin{0};
        size_t row_end{0};

        bool IsEmpty() const { return col_begin >= col_end || row_begin >= row_end; }
    };
    Window WindowFor(const BoundingBox& box) const;

private:
    size_t width_;
    size_t height_;
    std::vector<float> samples_;
    GeoTransform transform_;
    std::optional<double> nodata_;
    std::string crs_;
};

} // namespace floodvi
