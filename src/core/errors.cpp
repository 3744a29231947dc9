// File: src/core/errors.cpp
#include "core/errors.hpp"
#include <sstream>
#include <utility>

namespace floodvi {

namespace {

void AppendIds(std::ostringstream& ss, const char* label, const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return;
    }
    ss << "; " << label << ": ";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << ids[i];
    }
}

} // namespace

JoinMismatchError::JoinMismatchError(std::vector<std::string> unmatched_index_ids,
                                     std::vector<std::string> unmatched_geometry_ids,
                                     std::vector<std::string> duplicate_ids)
    : std::runtime_error(BuildMessage(unmatched_index_ids, unmatched_geometry_ids, duplicate_ids)),
      unmatched_index_ids_(std::move(unmatched_index_ids)),
      unmatched_geometry_ids_(std::move(unmatched_geometry_ids)),
      duplicate_ids_(std::move(duplicate_ids)) {}

std::string JoinMismatchError::BuildMessage(const std::vector<std::string>& unmatched_index_ids,
                                            const std::vector<std::string>& unmatched_geometry_ids,
                                            const std::vector<std::string>& duplicate_ids) {
    std::ostringstream ss;
    ss << "Zone join is not one-to-one";
    AppendIds(ss, "index ids without geometry", unmatched_index_ids);
    AppendIds(ss, "geometry ids without index", unmatched_geometry_ids);
    AppendIds(ss, "duplicate ids", duplicate_ids);
    return ss.str();
}

} // namespace floodvi
