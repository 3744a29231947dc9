// File: src/core/geometry.cpp
#include "core/geometry.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace floodvi {

namespace {

// Even-odd crossing test of a horizontal ray from (x, y) against one ring
bool RingCrosses(const Ring& ring, double x, double y) {
    bool inside = false;
    const size_t n = ring.size();
    if (n < 3) {
        return false;
    }
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point& a = ring[i];
        const Point& b = ring[j];
        if ((a.y > y) != (b.y > y)) {
            double x_cross = (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x;
            if (x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double RingSignedArea(const Ring& ring) {
    const size_t n = ring.size();
    if (n < 3) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        sum += (ring[j].x * ring[i].y) - (ring[i].x * ring[j].y);
    }
    return sum * 0.5;
}

size_t DistinctVertexCount(const Ring& ring) {
    std::vector<std::pair<double, double>> vertices;
    vertices.reserve(ring.size());
    for (const auto& p : ring) {
        vertices.emplace_back(p.x, p.y);
    }
    std::sort(vertices.begin(), vertices.end());
    return static_cast<size_t>(std::unique(vertices.begin(), vertices.end()) - vertices.begin());
}

bool RingIsFinite(const Ring& ring) {
    return std::all_of(ring.begin(), ring.end(), [](const Point& p) {
        return std::isfinite(p.x) && std::isfinite(p.y);
    });
}

} // namespace

// ============================================================================
// BoundingBox
// ============================================================================

void BoundingBox::Expand(const Point& p) {
    min_x = std::min(min_x, p.x);
    min_y = std::min(min_y, p.y);
    max_x = std::max(max_x, p.x);
    max_y = std::max(max_y, p.y);
}

bool BoundingBox::Intersects(const BoundingBox& other) const {
    if (IsEmpty() || other.IsEmpty()) {
        return false;
    }
    return min_x <= other.max_x && other.min_x <= max_x &&
           min_y <= other.max_y && other.min_y <= max_y;
}

// ============================================================================
// Geometry
// ============================================================================

Geometry::Geometry(Polygon polygon) {
    polygons_.push_back(std::move(polygon));
}

Geometry::Geometry(std::vector<Polygon> polygons)
    : polygons_(std::move(polygons)) {}

Geometry Geometry::FromRing(const Ring& exterior) {
    Polygon polygon;
    polygon.exterior = exterior;
    return Geometry(std::move(polygon));
}

bool Geometry::IsEmpty() const {
    return std::all_of(polygons_.begin(), polygons_.end(),
                       [](const Polygon& p) { return p.exterior.empty(); });
}

bool Geometry::IsValid() const {
    return ValidationError().empty();
}

std::string Geometry::ValidationError() const {
    if (IsEmpty()) {
        return "empty geometry";
    }
    for (const auto& polygon : polygons_) {
        if (!RingIsFinite(polygon.exterior)) {
            return "non-finite coordinate";
        }
        if (DistinctVertexCount(polygon.exterior) < 3) {
            return "exterior ring has fewer than three distinct vertices";
        }
        for (const auto& hole : polygon.holes) {
            if (!RingIsFinite(hole)) {
                return "non-finite coordinate";
            }
        }
    }
    return std::string();
}

BoundingBox Geometry::Bounds() const {
    BoundingBox box;
    for (const auto& polygon : polygons_) {
        for (const auto& p : polygon.exterior) {
            box.Expand(p);
        }
    }
    return box;
}

bool Geometry::Contains(double x, double y) const {
    for (const auto& polygon : polygons_) {
        bool inside = RingCrosses(polygon.exterior, x, y);
        for (const auto& hole : polygon.holes) {
            if (RingCrosses(hole, x, y)) {
                inside = !inside;
            }
        }
        if (inside) {
            return true;
        }
    }
    return false;
}

double Geometry::Area() const {
    double area = 0.0;
    for (const auto& polygon : polygons_) {
        double part = std::abs(RingSignedArea(polygon.exterior));
        for (const auto& hole : polygon.holes) {
            part -= std::abs(RingSignedArea(hole));
        }
        area += std::max(0.0, part);
    }
    return area;
}

} // namespace floodvi
