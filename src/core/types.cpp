// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace floodvi {

// ============================================================================
// Enum conversions
// ============================================================================

const char* ToString(FactorDirection direction) {
    switch (direction) {
        case FactorDirection::ASCENDING: return "ascending";
        case FactorDirection::DESCENDING: return "descending";
        default: return "unknown";
    }
}

FactorDirection ParseFactorDirection(const std::string& str) {
    if (str == "ascending" || str == "ASCENDING") return FactorDirection::ASCENDING;
    if (str == "descending" || str == "DESCENDING") return FactorDirection::DESCENDING;
    throw std::invalid_argument("Invalid FactorDirection string: " + str);
}

const char* ToString(Category category) {
    switch (category) {
        case Category::PHYSICAL: return "physical";
        case Category::SOCIOECONOMIC: return "socioeconomic";
        default: return "unknown";
    }
}

Category ParseCategory(const std::string& str) {
    if (str == "physical" || str == "PHYSICAL") return Category::PHYSICAL;
    if (str == "socioeconomic" || str == "SOCIOECONOMIC") return Category::SOCIOECONOMIC;
    throw std::invalid_argument("Invalid Category string: " + str);
}

// ============================================================================
// Zone identifiers
// ============================================================================

std::string CanonicalZoneId(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return std::string();
    }
    std::string id(begin, end);

    // Integer, optionally signed, optionally with a zero-only fraction
    const size_t digits_start = (id[0] == '-' || id[0] == '+') ? 1 : 0;
    const size_t dot = id.find('.');
    const size_t digits_end = dot == std::string::npos ? id.size() : dot;
    if (digits_end == digits_start) {
        return id;
    }
    for (size_t i = digits_start; i < digits_end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(id[i]))) return id;
    }
    if (dot != std::string::npos) {
        if (dot + 1 == id.size()) {
            return id;
        }
        for (size_t i = dot + 1; i < id.size(); ++i) {
            if (id[i] != '0') return id;
        }
    }
    // "+7" and "7" name the same zone
    const size_t first = id[0] == '+' ? 1 : 0;
    return id.substr(first, digits_end - first);
}

std::string SynthesizeZoneId(size_t index) {
    std::ostringstream ss;
    ss << 'W' << std::setw(2) << std::setfill('0') << (index + 1);
    return ss.str();
}

std::string ThresholdFactorName(double threshold) {
    if (!std::isfinite(threshold)) {
        throw std::invalid_argument("Elevation threshold must be finite");
    }
    std::ostringstream ss;
    ss << std::setprecision(10) << threshold;
    return "pct_below_" + ss.str() + "m";
}

} // namespace floodvi
