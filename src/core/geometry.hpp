// File: src/core/geometry.hpp
#pragma once

#include <limits>
#include <string>
#include <vector>

namespace floodvi {

/// Planar coordinate in a zone's or surface's coordinate reference
struct Point {
    double x{0.0};
    double y{0.0};

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/// Linear ring; closing point optional (first == last is accepted either way)
using Ring = std::vector<Point>;

/// Axis-aligned bounding box
struct BoundingBox {
    double min_x{std::numeric_limits<double>::infinity()};
    double min_y{std::numeric_limits<double>::infinity()};
    double max_x{-std::numeric_limits<double>::infinity()};
    double max_y{-std::numeric_limits<double>::infinity()};

    bool IsEmpty() const { return min_x > max_x || min_y > max_y; }

    void Expand(const Point& p);

    bool Intersects(const BoundingBox& other) const;
};

/// Polygon with an exterior ring and optional holes
struct Polygon {
    Ring exterior;
    std::vector<Ring> holes;
};

/// Zone geometry: a polygon or multipolygon.
///
/// Containment uses the even-odd rule across every ring of a part, so holes
/// are excluded. Parts of a multipolygon are assumed not to overlap.
class Geometry {
public:
    Geometry() = default;
    explicit Geometry(Polygon polygon);
    explicit Geometry(std::vector<Polygon> polygons);

    /// Convenience: single-ring polygon from a point list
    static Geometry FromRing(const Ring& exterior);

    const std::vector<Polygon>& polygons() const { return polygons_; }
    std::vector<Polygon>& polygons() { return polygons_; }

    bool IsEmpty() const;

    /// True when every part has an exterior ring with at least three distinct
    /// vertices and all coordinates are finite
    bool IsValid() const;

    /// Reason IsValid() fails, empty when valid
    std::string ValidationError() const;

    BoundingBox Bounds() const;

    /// Point-in-geometry test (even-odd rule); points exactly on an edge may
    /// fall either side
    bool Contains(double x, double y) const;

    /// Planar area (holes subtracted)
    double Area() const;

private:
    std::vector<Polygon> polygons_;
};

} // namespace floodvi
