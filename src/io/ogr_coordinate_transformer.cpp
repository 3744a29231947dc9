// File: src/io/ogr_coordinate_transformer.cpp
#include "io/ogr_coordinate_transformer.hpp"
#include <cpl_conv.h>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace floodvi {

namespace {

OGRSpatialReferenceH ParseReference(const std::string& crs) {
    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    if (OSRSetFromUserInput(srs, crs.c_str()) != OGRERR_NONE) {
        OSRDestroySpatialReference(srs);
        throw std::runtime_error("Unrecognized coordinate reference: " + crs.substr(0, 80));
    }
    OSRSetAxisMappingStrategy(srs, OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

std::string ShortName(OGRSpatialReferenceH srs) {
    const char* name = OSRGetName(srs);
    return name ? name : "unnamed";
}

} // namespace

OgrCoordinateTransformer::OgrCoordinateTransformer(const std::string& source_crs,
                                                   const std::string& target_crs) {
    source_ = ParseReference(source_crs);
    try {
        target_ = ParseReference(target_crs);
    } catch (const std::exception&) {
        OSRDestroySpatialReference(source_);
        throw;
    }

    transform_ = OCTNewCoordinateTransformation(source_, target_);
    if (transform_ == nullptr) {
        OSRDestroySpatialReference(source_);
        OSRDestroySpatialReference(target_);
        throw std::runtime_error("No coordinate transformation from " + source_crs.substr(0, 80) +
                                 " to " + target_crs.substr(0, 80));
    }
}

OgrCoordinateTransformer::~OgrCoordinateTransformer() {
    if (transform_) OCTDestroyCoordinateTransformation(transform_);
    if (source_) OSRDestroySpatialReference(source_);
    if (target_) OSRDestroySpatialReference(target_);
}

void OgrCoordinateTransformer::TransformRing(Ring& ring) const {
    if (ring.empty()) {
        return;
    }
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(ring.size());
    ys.reserve(ring.size());
    for (const auto& p : ring) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    if (!OCTTransform(transform_, static_cast<int>(ring.size()), xs.data(), ys.data(), nullptr)) {
        throw std::runtime_error("Coordinate transformation failed (" + Describe() + ")");
    }

    for (size_t i = 0; i < ring.size(); ++i) {
        ring[i] = {xs[i], ys[i]};
    }
}

Geometry OgrCoordinateTransformer::Transform(const Geometry& geometry) const {
    Geometry result = geometry;
    for (auto& polygon : result.polygons()) {
        TransformRing(polygon.exterior);
        for (auto& hole : polygon.holes) {
            TransformRing(hole);
        }
    }
    return result;
}

std::string OgrCoordinateTransformer::Describe() const {
    return ShortName(source_) + " -> " + ShortName(target_);
}

CoordinateTransformerFactory MakeOgrTransformerFactory() {
    return [](const std::string& source_crs,
              const std::string& target_crs) -> std::unique_ptr<CoordinateTransformer> {
        try {
            return std::make_unique<OgrCoordinateTransformer>(source_crs, target_crs);
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: " << e.what() << std::endl;
            return nullptr;
        }
    };
}

} // namespace floodvi
