#include "surveyor/core/PatternDetector.h"
#include "surveyor/core/Aggregator.h"

namespace surveyor {

void PatternDetector::record(Category category, const Node &node) {
    if (sink_)
        sink_->record(EvidenceRecord::fromNode(category, node));
}

void PatternDetector::note(std::string message) {
    if (notes_)
        notes_->push_back(std::move(message));
}

} // namespace surveyor
