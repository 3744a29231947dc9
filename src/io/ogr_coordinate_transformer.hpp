// File: src/io/ogr_coordinate_transformer.hpp
#pragma once

#include "raster/coordinate_transformer.hpp"
#include <ogr_srs_api.h>
#include <string>

namespace floodvi {

/// CoordinateTransformer over OGR/PROJ.
///
/// Either coordinate reference may be WKT, a PROJ string or an authority
/// code such as "EPSG:32643". Axis order is always easting, northing.
class OgrCoordinateTransformer : public CoordinateTransformer {
public:
    /// @throws std::runtime_error if either reference cannot be parsed or
    ///         no transformation between them exists
    OgrCoordinateTransformer(const std::string& source_crs, const std::string& target_crs);
    ~OgrCoordinateTransformer() override;

    OgrCoordinateTransformer(const OgrCoordinateTransformer&) = delete;
    OgrCoordinateTransformer& operator=(const OgrCoordinateTransformer&) = delete;

    Geometry Transform(const Geometry& geometry) const override;
    std::string Describe() const override;

private:
    void TransformRing(Ring& ring) const;

    OGRSpatialReferenceH source_{nullptr};
    OGRSpatialReferenceH target_{nullptr};
    OGRCoordinateTransformationH transform_{nullptr};
};

/// Factory creating OgrCoordinateTransformer instances; yields nullptr
/// (with a warning on std::cerr) when no transformation can be built.
CoordinateTransformerFactory MakeOgrTransformerFactory();

} // namespace floodvi
