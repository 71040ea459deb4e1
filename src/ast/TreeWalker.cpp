#include "surveyor/ast/TreeWalker.h"

#include <vector>

namespace surveyor {

llvm::Error TreeWalker::walk(const SyntaxTree &tree, NodeVisitor &visitor) {
    return walk(tree.root(), visitor);
}

// Explicit stack instead of recursion: lowered expression chains can be
// deep enough to exhaust the native stack.
llvm::Error TreeWalker::walk(const Node &root, NodeVisitor &visitor) {
    std::vector<const Node *> pending;
    pending.push_back(&root);

    while (!pending.empty()) {
        const Node *node = pending.back();
        pending.pop_back();

        auto action = visitor.visitNode(*node);
        if (!action)
            return action.takeError();
        if (*action == WalkAction::SkipChildren)
            continue;

        const auto &children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            pending.push_back(*it);
    }

    return llvm::Error::success();
}

} // namespace surveyor
