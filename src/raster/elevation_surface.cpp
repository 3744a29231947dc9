// File: src/raster/elevation_surface.cpp
#include "raster/elevation_surface.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace floodvi {

// ============================================================================
// GeoTransform
// ============================================================================

GeoTransform GeoTransform::FromOrigin(double west, double north,
                                      double pixel_width, double pixel_height) {
    GeoTransform gt;
    gt.coefficients = {west, pixel_width, 0.0, north, 0.0, -std::abs(pixel_height)};
    return gt;
}

Point GeoTransform::Apply(double col, double row) const {
    const auto& c = coefficients;
    return Point{c[0] + col * c[1] + row * c[2],
                 c[3] + col * c[4] + row * c[5]};
}

Point GeoTransform::Invert(double x, double y) const {
    const auto& c = coefficients;
    double det = c[1] * c[5] - c[2] * c[4];
    if (det == 0.0 || !std::isfinite(det)) {
        throw std::invalid_argument("GeoTransform is not invertible");
    }
    double dx = x - c[0];
    double dy = y - c[3];
    return Point{(c[5] * dx - c[2] * dy) / det,
                 (-c[4] * dx + c[1] * dy) / det};
}

// ============================================================================
// ElevationSurface
// ============================================================================

ElevationSurface::ElevationSurface(size_t width, size_t height, std::vector<float> samples,
                                   GeoTransform transform, std::optional<double> nodata,
                                   std::string crs)
    : width_(width),
      height_(height),
      samples_(std::move(samples)),
      transform_(transform),
      nodata_(nodata),
      crs_(std::move(crs)) {
    if (samples_.size() != width_ * height_) {
        throw std::invalid_argument("Surface sample count does not match " +
                                    std::to_string(width_) + "x" + std::to_string(height_));
    }
    double det = transform_.coefficients[1] * transform_.coefficients[5] -
                 transform_.coefficients[2] * transform_.coefficients[4];
    if (det == 0.0 || !std::isfinite(det)) {
        throw std::invalid_argument("Surface geotransform is degenerate");
    }
}

ElevationSurface ElevationSurface::Filled(size_t width, size_t height, float value,
                                          GeoTransform transform, std::optional<double> nodata,
                                          std::string crs) {
    return ElevationSurface(width, height, std::vector<float>(width * height, value),
                            transform, nodata, std::move(crs));
}

bool ElevationSurface::IsValidSample(float value) const {
    if (std::isnan(value)) {
        return false;
    }
    if (nodata_.has_value() && static_cast<double>(value) == *nodata_) {
        return false;
    }
    // Sentinels stored as float lose precision against a double nodata value
    if (nodata_.has_value() && value == static_cast<float>(*nodata_)) {
        return false;
    }
    return true;
}

Point ElevationSurface::PixelCenter(size_t col, size_t row) const {
    return transform_.Apply(static_cast<double>(col) + 0.5, static_cast<double>(row) + 0.5);
}

BoundingBox ElevationSurface::Extent() const {
    BoundingBox box;
    const double w = static_cast<double>(width_);
    const double h = static_cast<double>(height_);
    box.Expand(transform_.Apply(0.0, 0.0));
    box.Expand(transform_.Apply(w, 0.0));
    box.Expand(transform_.Apply(0.0, h));
    box.Expand(transform_.Apply(w, h));
    return box;
}

ElevationSurface::Window ElevationSurface::WindowFor(const BoundingBox& box) const {
    Window window;
    if (box.IsEmpty() || width_ == 0 || height_ == 0) {
        return window;
    }

    double min_col = std::numeric_limits<double>::infinity();
    double max_col = -std::numeric_limits<double>::infinity();
    double min_row = std::numeric_limits<double>::infinity();
    double max_row = -std::numeric_limits<double>::infinity();
    const Point corners[] = {{box.min_x, box.min_y}, {box.min_x, box.max_y},
                             {box.max_x, box.min_y}, {box.max_x, box.max_y}};
    for (const auto& corner : corners) {
        Point pixel = transform_.Invert(corner.x, corner.y);
        min_col = std::min(min_col, pixel.x);
        max_col = std::max(max_col, pixel.x);
        min_row = std::min(min_row, pixel.y);
        max_row = std::max(max_row, pixel.y);
    }

    const double w = static_cast<double>(width_);
    const double h = static_cast<double>(height_);
    min_col = std::clamp(std::floor(min_col), 0.0, w);
    max_col = std::clamp(std::ceil(max_col), 0.0, w);
    min_row = std::clamp(std::floor(min_row), 0.0, h);
    max_row = std::clamp(std::ceil(max_row), 0.0, h);

    window.col_begin = static_cast<size_t>(min_col);
    window.col_end = static_cast<size_t>(max_col);
    window.row_begin = static_cast<size_t>(min_row);
    window.row_end = static_cast<size_t>(max_row);
    return window;
}

} // namespace floodvi
