// File: src/scoring/factor_table.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace floodvi {

/// Declaration of one factor: how it is read, weighted and whether the
/// source must supply it.
struct FactorSpec {
    std::string name;
    FactorDirection direction{FactorDirection::ASCENDING};
    double weight{0.0};

    /// Optional factors may be absent from the source without error
    bool optional{true};
};

/// Table of factor values: one row per zone, one column per declared factor.
///
/// Every (zone, factor) cell exists; a cell without a value is explicitly
/// missing. Rows keep insertion order. Zone ids are canonicalized.
class FactorTable {
public:
    using Cell = std::optional<double>;

    FactorTable() = default;
    explicit FactorTable(std::vector<std::string> factor_names);

    /// Add a zone row with every cell missing
    /// @throws std::invalid_argument on empty or duplicate id
    void AddZone(const std::string& zone_id);

    /// Set a cell value; non-finite values are stored as missing
    /// @throws std::out_of_range on unknown zone or factor
    void Set(const std::string& zone_id, const std::string& factor, double value);

    /// Mark a cell as missing
    void SetMissing(const std::string& zone_id, const std::string& factor);

    /// @throws std::out_of_range on unknown zone or factor
    Cell Get(const std::string& zone_id, const std::string& factor) const;

    bool HasZone(const std::string& zone_id) const;
    bool HasFactor(const std::string& factor) const;

    /// True when at least one zone has a value for the factor
    bool IsPresent(const std::string& factor) const;

    /// Values of one factor aligned with ZoneIds()
    std::vector<Cell> Column(const std::string& factor) const;

    const std::vector<std::string>& ZoneIds() const { return zone_ids_; }
    const std::vector<std::string>& FactorNames() const { return factor_names_; }

    size_t ZoneCount() const { return zone_ids_.size(); }
    size_t FactorCount() const { return factor_names_.size(); }

    /// Set equality of (zone, factor, value) cells, ignoring row order
    bool ContentEquals(const FactorTable& other, double tolerance = 0.0) const;

private:
    size_t ZoneIndex(const std::string& zone_id) const;
    size_t FactorIndex(const std::string& factor) const;

    std::vector<std::string> factor_names_;
    std::unordered_map<std::string, size_t> factor_index_;
    std::vector<std::string> zone_ids_;
    std::unordered_map<std::string, size_t> zone_index_;
    std::vector<std::vector<Cell>> rows_;
};

} // namespace floodvi
