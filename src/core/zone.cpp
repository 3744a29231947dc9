// File: src/core/zone.cpp
#include "core/zone.hpp"
#include "core/types.hpp"
#include <stdexcept>
#include <utility>

namespace floodvi {

void ZoneCollection::Add(Zone zone) {
    zone.id = CanonicalZoneId(zone.id);
    if (zone.id.empty()) {
        throw std::invalid_argument("Zone id must not be empty");
    }
    if (index_.count(zone.id) > 0) {
        throw std::invalid_argument("Duplicate zone id: " + zone.id);
    }
    index_.emplace(zone.id, zones_.size());
    zones_.push_back(std::move(zone));
}

const Zone* ZoneCollection::Find(const std::string& id) const {
    auto it = index_.find(CanonicalZoneId(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &zones_[it->second];
}

std::vector<std::string> ZoneCollection::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(zones_.size());
    for (const auto& zone : zones_) {
        ids.push_back(zone.id);
    }
    return ids;
}

} // namespace floodvi
