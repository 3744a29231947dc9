// File: src/scoring/factor_table.cpp
#include "scoring/factor_table.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace floodvi {

FactorTable::FactorTable(std::vector<std::string> factor_names)
    : factor_names_(std::move(factor_names)) {
    for (size_t i = 0; i < factor_names_.size(); ++i) {
        if (!factor_index_.emplace(factor_names_[i], i).second) {
            throw std::invalid_argument("Duplicate factor name: " + factor_names_[i]);
        }
    }
}

void FactorTable::AddZone(const std::string& zone_id) {
    std::string id = CanonicalZoneId(zone_id);
    if (id.empty()) {
        throw std::invalid_argument("Zone id must not be empty");
    }
    if (!zone_index_.emplace(id, zone_ids_.size()).second) {
        throw std::invalid_argument("Duplicate zone id in factor table: " + id);
    }
    zone_ids_.push_back(id);
    rows_.emplace_back(factor_names_.size());
}

void FactorTable::Set(const std::string& zone_id, const std::string& factor, double value) {
    Cell& cell = rows_[ZoneIndex(zone_id)][FactorIndex(factor)];
    if (std::isfinite(value)) {
        cell = value;
    } else {
        cell.reset();
    }
}

void FactorTable::SetMissing(const std::string& zone_id, const std::string& factor) {
    rows_[ZoneIndex(zone_id)][FactorIndex(factor)].reset();
}

FactorTable::Cell FactorTable::Get(const std::string& zone_id, const std::string& factor) const {
    return rows_[ZoneIndex(zone_id)][FactorIndex(factor)];
}

bool FactorTable::HasZone(const std::string& zone_id) const {
    return zone_index_.count(CanonicalZoneId(zone_id)) > 0;
}

bool FactorTable::HasFactor(const std::string& factor) const {
    return factor_index_.count(factor) > 0;
}

bool FactorTable::IsPresent(const std::string& factor) const {
    auto it = factor_index_.find(factor);
    if (it == factor_index_.end()) {
        return false;
    }
    size_t col = it->second;
    return std::any_of(rows_.begin(), rows_.end(),
                       [col](const std::vector<Cell>& row) { return row[col].has_value(); });
}

std::vector<FactorTable::Cell> FactorTable::Column(const std::string& factor) const {
    size_t col = FactorIndex(factor);
    std::vector<Cell> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(row[col]);
    }
    return values;
}

bool FactorTable::ContentEquals(const FactorTable& other, double tolerance) const {
    if (zone_ids_.size() != other.zone_ids_.size() ||
        factor_names_.size() != other.factor_names_.size()) {
        return false;
    }
    for (const auto& factor : factor_names_) {
        if (!other.HasFactor(factor)) {
            return false;
        }
    }
    for (const auto& zone : zone_ids_) {
        if (!other.HasZone(zone)) {
            return false;
        }
        for (const auto& factor : factor_names_) {
            Cell a = Get(zone, factor);
            Cell b = other.Get(zone, factor);
            if (a.has_value() != b.has_value()) {
                return false;
            }
            if (a.has_value() && std::abs(*a - *b) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

size_t FactorTable::ZoneIndex(const std::string& zone_id) const {
    auto it = zone_index_.find(CanonicalZoneId(zone_id));
    if (it == zone_index_.end()) {
        throw std::out_of_range("Unknown zone id: " + zone_id);
    }
    return it->second;
}

size_t FactorTable::FactorIndex(const std::string& factor) const {
    auto it = factor_index_.find(factor);
    if (it == factor_index_.end()) {
        throw std::out_of_range("Unknown factor: " + factor);
    }
    return it->second;
}

} // namespace floodvi
