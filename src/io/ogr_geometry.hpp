// File: src/io/ogr_geometry.hpp
#pragma once

#include "core/geometry.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <memory>

namespace floodvi {

/// Closes a GDAL dataset handle
struct GdalDatasetCloser {
    void operator()(void* dataset) const {
        if (dataset) GDALClose(static_cast<GDALDatasetH>(dataset));
    }
};
using GdalDatasetPtr = std::unique_ptr<void, GdalDatasetCloser>;

/// Destroys an OGR feature handle
struct OgrFeatureDestroyer {
    void operator()(void* feature) const {
        if (feature) OGR_F_Destroy(static_cast<OGRFeatureH>(feature));
    }
};
using OgrFeaturePtr = std::unique_ptr<void, OgrFeatureDestroyer>;

/// Convert an OGR polygon or multipolygon. Curved geometry is linearized.
/// A null handle gives an empty geometry.
/// @throws std::runtime_error for non-areal geometry types
Geometry FromOgrGeometry(OGRGeometryH geometry);

/// Build an OGR multipolygon; the caller owns the result
OGRGeometryH ToOgrGeometry(const Geometry& geometry);

} // namespace floodvi
