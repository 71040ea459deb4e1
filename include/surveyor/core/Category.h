#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace surveyor {

// Closed set of evidence categories. Detectors may only record these; the
// Aggregator keys its buckets by this enum, never by free-form labels.
enum class Category : uint8_t {
    TypeLiteral                  = 0,
    HighConfidenceUnnamedTearoff = 1,
    HighConfidenceNamedTearoff   = 2,
    LowConfidenceUnnamedTearoff  = 3,
    LowConfidenceNamedTearoff    = 4,
    DetectorCoverageGap          = 5,
};

inline constexpr size_t kCategoryCount = 6;

enum class Confidence : uint8_t { High, Low };
enum class Namedness : uint8_t { Unnamed, Named };

constexpr std::string_view categoryLabel(Category c) {
    switch (c) {
        case Category::TypeLiteral:                  return "type literal";
        case Category::HighConfidenceUnnamedTearoff: return "high confidence unnamed tearoff";
        case Category::HighConfidenceNamedTearoff:   return "high confidence named tearoff";
        case Category::LowConfidenceUnnamedTearoff:  return "low confidence unnamed tearoff";
        case Category::LowConfidenceNamedTearoff:    return "low confidence named tearoff";
        case Category::DetectorCoverageGap:          return "detector coverage gap";
    }
    return "unknown";
}

constexpr Category tearoffCategory(Confidence c, Namedness n) {
    if (c == Confidence::High)
        return n == Namedness::Named ? Category::HighConfidenceNamedTearoff
                                     : Category::HighConfidenceUnnamedTearoff;
    return n == Namedness::Named ? Category::LowConfidenceNamedTearoff
                                 : Category::LowConfidenceUnnamedTearoff;
}

constexpr size_t categoryIndex(Category c) {
    return static_cast<size_t>(c);
}

} // namespace surveyor
