// File: src/io/ogr_geometry.cpp
#include "io/ogr_geometry.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace floodvi {

namespace {

Ring ReadRing(OGRGeometryH ring) {
    Ring points;
    int count = OGR_G_GetPointCount(ring);
    points.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        points.push_back({OGR_G_GetX(ring, i), OGR_G_GetY(ring, i)});
    }
    return points;
}

Polygon ReadPolygon(OGRGeometryH polygon) {
    Polygon result;
    int rings = OGR_G_GetGeometryCount(polygon);
    if (rings == 0) {
        return result;
    }
    result.exterior = ReadRing(OGR_G_GetGeometryRef(polygon, 0));
    for (int i = 1; i < rings; ++i) {
        result.holes.push_back(ReadRing(OGR_G_GetGeometryRef(polygon, i)));
    }
    return result;
}

OGRGeometryH WriteRing(const Ring& ring) {
    OGRGeometryH out = OGR_G_CreateGeometry(wkbLinearRing);
    for (const auto& p : ring) {
        OGR_G_AddPoint_2D(out, p.x, p.y);
    }
    if (!ring.empty() && ring.front() != ring.back()) {
        OGR_G_AddPoint_2D(out, ring.front().x, ring.front().y);
    }
    return out;
}

} // namespace

Geometry FromOgrGeometry(OGRGeometryH geometry) {
    if (geometry == nullptr) {
        return Geometry();
    }

    OGRwkbGeometryType type = wkbFlatten(OGR_G_GetGeometryType(geometry));

    if (type == wkbCurvePolygon || type == wkbMultiSurface) {
        OGRGeometryH linear = OGR_G_GetLinearGeometry(geometry, 0.0, nullptr);
        if (linear == nullptr) {
            throw std::runtime_error("Failed to linearize curved zone geometry");
        }
        Geometry result;
        try {
            result = FromOgrGeometry(linear);
        } catch (const std::exception&) {
            OGR_G_DestroyGeometry(linear);
            throw;
        }
        OGR_G_DestroyGeometry(linear);
        return result;
    }

    if (type == wkbPolygon) {
        return Geometry(ReadPolygon(geometry));
    }

    if (type == wkbMultiPolygon) {
        std::vector<Polygon> parts;
        int count = OGR_G_GetGeometryCount(geometry);
        for (int i = 0; i < count; ++i) {
            parts.push_back(ReadPolygon(OGR_G_GetGeometryRef(geometry, i)));
        }
        return Geometry(std::move(parts));
    }

    throw std::runtime_error(std::string("Zone geometry must be polygonal, got ") +
                             OGR_G_GetGeometryName(geometry));
}

OGRGeometryH ToOgrGeometry(const Geometry& geometry) {
    OGRGeometryH multi = OGR_G_CreateGeometry(wkbMultiPolygon);
    for (const auto& part : geometry.polygons()) {
        OGRGeometryH polygon = OGR_G_CreateGeometry(wkbPolygon);
        OGR_G_AddGeometryDirectly(polygon, WriteRing(part.exterior));
        for (const auto& hole : part.holes) {
            OGR_G_AddGeometryDirectly(polygon, WriteRing(hole));
        }
        OGR_G_AddGeometryDirectly(multi, polygon);
    }
    return multi;
}

} // namespace floodvi
