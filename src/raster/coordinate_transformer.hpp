// File: src/raster/coordinate_transformer.hpp
#pragma once

#include "core/geometry.hpp"
#include <functional>
#include <memory>
#include <string>

namespace floodvi {

/// Reprojects zone geometry from one coordinate reference into another.
///
/// Implementations wrap a projection library; the extractor only needs
/// geometry in, geometry out.
class CoordinateTransformer {
public:
    virtual ~CoordinateTransformer() = default;

    /// Transform every vertex of a geometry
    /// @throws std::runtime_error if any vertex cannot be transformed
    virtual Geometry Transform(const Geometry& geometry) const = 0;

    /// Human-readable "source -> target" description
    virtual std::string Describe() const = 0;
};

/// Creates a transformer from source CRS to target CRS, or nullptr when
/// no transform is possible.
using CoordinateTransformerFactory = std::function<std::unique_ptr<CoordinateTransformer>(
    const std::string& source_crs, const std::string& target_crs)>;

} // namespace floodvi
