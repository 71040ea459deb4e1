#include "surveyor/ast/CompositeVisitor.h"
#include "surveyor/core/PatternDetector.h"

#include <algorithm>

namespace surveyor {

void CompositeVisitor::add(PatternDetector &detector) {
    size_t index = 0;
    while (index < detectors_.size() && detectors_[index] != &detector)
        ++index;
    if (index == detectors_.size()) {
        detectors_.push_back(&detector);
        pruned_.emplace_back();
    }

    for (NodeKind kind : detector.subscribedKinds()) {
        auto &subs = subscribers_[static_cast<size_t>(kind)];
        if (std::find(subs.begin(), subs.end(), index) == subs.end())
            subs.push_back(index);
    }
}

bool CompositeVisitor::empty() const {
    return std::all_of(subscribers_.begin(), subscribers_.end(),
                       [](const auto &subs) { return subs.empty(); });
}

// Pre-order: once a node outside the pruned subtree shows up, the walk has
// left it for good.
bool CompositeVisitor::isPruned(size_t detector, const Node &node) {
    Pruned &p = pruned_[detector];
    if (!p.root)
        return false;
    const Node *parent = node.parent();
    if (parent && (parent == p.root || p.inside.contains(parent))) {
        p.inside.insert(&node);
        return true;
    }
    p.root = nullptr;
    p.inside.clear();
    return false;
}

llvm::Expected<WalkAction> CompositeVisitor::visitNode(const Node &node) {
    std::vector<bool> skipped(detectors_.size());
    for (size_t i = 0; i < detectors_.size(); ++i)
        skipped[i] = isPruned(i, node);

    for (size_t i : subscribers_[static_cast<size_t>(node.kind())]) {
        if (skipped[i])
            continue;
        auto action = detectors_[i]->visitNode(node);
        if (!action)
            return action.takeError();
        if (*action == WalkAction::SkipChildren) {
            pruned_[i].root = &node;
            pruned_[i].inside.clear();
        }
    }

    const bool allPruned =
        !detectors_.empty() &&
        std::all_of(pruned_.begin(), pruned_.end(),
                    [](const Pruned &p) { return p.root != nullptr; });
    return allPruned ? WalkAction::SkipChildren : WalkAction::Continue;
}

} // namespace surveyor
