// File: src/core/errors.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace floodvi {

/// A required raster, boundary or table source is absent or unreadable.
///
/// Aborts the category computation that needed the source; the other
/// category still runs.
class MissingInputError : public std::runtime_error {
public:
    MissingInputError(const std::string& source, const std::string& message,
                      std::optional<Category> category = std::nullopt)
        : std::runtime_error(message + " (source: " + source + ")"),
          source_(source),
          category_(category) {}

    /// Identifier of the missing source (path or provider description)
    const std::string& source() const { return source_; }

    /// Category whose computation was prevented, if known
    std::optional<Category> category() const { return category_; }

private:
    std::string source_;
    std::optional<Category> category_;
};

/// The zone-identifier join between an index table and a geometry
/// collection did not produce a one-to-one match.
class JoinMismatchError : public std::runtime_error {
public:
    JoinMismatchError(std::vector<std::string> unmatched_index_ids,
                      std::vector<std::string> unmatched_geometry_ids,
                      std::vector<std::string> duplicate_ids);

    /// Index-table ids with no geometry
    const std::vector<std::string>& unmatched_index_ids() const { return unmatched_index_ids_; }

    /// Geometry ids with no index row
    const std::vector<std::string>& unmatched_geometry_ids() const { return unmatched_geometry_ids_; }

    /// Ids occurring more than once on either side
    const std::vector<std::string>& duplicate_ids() const { return duplicate_ids_; }

private:
    static std::string BuildMessage(const std::vector<std::string>& unmatched_index_ids,
                                    const std::vector<std::string>& unmatched_geometry_ids,
                                    const std::vector<std::string>& duplicate_ids);

    std::vector<std::string> unmatched_index_ids_;
    std::vector<std::string> unmatched_geometry_ids_;
    std::vector<std::string> duplicate_ids_;
};

/// A zone that produced no valid raster samples; its statistics are the 0.0 sentinel.
struct DegradedZoneWarning {
    std::string zone_id;
    std::string reason;
};

/// A whole category was unavailable and the neutral value was substituted.
struct PartialCategoryFallback {
    Category category{Category::PHYSICAL};
    std::string reason;
    std::vector<std::string> affected_zones;
    double substituted_value{50.0};
};

} // namespace floodvi
