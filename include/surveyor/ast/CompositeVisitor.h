#pragma once

#include "surveyor/ast/NodeVisitor.h"

#include <llvm/ADT/DenseSet.h>

#include <array>
#include <vector>

namespace surveyor {

class PatternDetector;

// Fans one traversal out to several detectors. Each node is handed only to
// the detectors subscribed to its kind, in registration order.
//
// SkipChildren is tracked per detector: a detector that prunes a subtree
// stops seeing it, the others still do. The walker itself only prunes once
// every detector has.
class CompositeVisitor : public NodeVisitor {
public:
    void add(PatternDetector &detector);

    llvm::Expected<WalkAction> visitNode(const Node &node) override;

    bool empty() const;

private:
    // Subtree one detector asked to skip, and the nodes seen inside it.
    struct Pruned {
        const Node *root = nullptr;
        llvm::DenseSet<const Node *> inside;
    };

    bool isPruned(size_t detector, const Node &node);

    std::vector<NodeVisitor *> detectors_;
    std::vector<Pruned> pruned_;
    std::array<std::vector<size_t>, kNodeKindCount> subscribers_;
};

} // namespace surveyor
