#pragma once

#include "surveyor/core/Category.h"

#include <cstdint>
#include <string>
#include <vector>

namespace surveyor {

class Node;

struct SourceLocation {
    std::string file;        // compilation unit path
    uint32_t    offset = 0;  // byte offset, authoritative
    unsigned    line   = 0;
    unsigned    column = 0;
};

// A single detected occurrence. Immutable once built; moved into the
// Aggregator which owns it from then on.
class EvidenceRecord {
public:
    EvidenceRecord(Category category, SourceLocation location,
                   std::string rendered)
        : category_(category), location_(std::move(location)),
          rendered_(std::move(rendered)) {}

    // Renders `<source text> at <offset> in <unit path>`.
    static EvidenceRecord fromNode(Category category, const Node &node);

    Category category() const { return category_; }
    const SourceLocation &location() const { return location_; }
    const std::string &rendered() const { return rendered_; }

private:
    Category       category_;
    SourceLocation location_;
    std::string    rendered_;
};

struct CategoryResult {
    Category                 category = Category::TypeLiteral;
    std::string              label;
    size_t                   count = 0;
    std::vector<std::string> examples; // detection order, bounded
};

} // namespace surveyor
