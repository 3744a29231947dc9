// File: src/core/zone.hpp
#pragma once

#include "core/geometry.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace floodvi {

/// Administrative unit (ward) over which statistics are aggregated
struct Zone {
    std::string id;
    std::optional<std::string> name;
    Geometry geometry;

    /// Source attributes other than id and name, carried to spatial output
    std::map<std::string, std::string> attributes;
};

/// Collection of zones sharing one coordinate reference.
///
/// Identifiers are stored in canonical form (see CanonicalZoneId) and are
/// unique across the collection. Iteration follows insertion order.
class ZoneCollection {
public:
    ZoneCollection() = default;
    explicit ZoneCollection(std::string crs) : crs_(std::move(crs)) {}

    /// Add a zone; its id is canonicalized
    /// @throws std::invalid_argument on empty or duplicate id
    void Add(Zone zone);

    /// Look up a zone by (raw or canonical) id
    const Zone* Find(const std::string& id) const;

    bool Contains(const std::string& id) const { return Find(id) != nullptr; }

    size_t size() const { return zones_.size(); }
    bool empty() const { return zones_.empty(); }

    const Zone& operator[](size_t i) const { return zones_[i]; }

    std::vector<Zone>::const_iterator begin() const { return zones_.begin(); }
    std::vector<Zone>::const_iterator end() const { return zones_.end(); }

    /// Zone ids in insertion order
    std::vector<std::string> Ids() const;

    /// Coordinate reference (WKT or authority string); empty if undeclared
    const std::string& crs() const { return crs_; }
    void SetCrs(const std::string& crs) { crs_ = crs; }

private:
    std::string crs_;
    std::vector<Zone> zones_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace floodvi
