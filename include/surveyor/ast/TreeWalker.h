#pragma once

#include "surveyor/ast/NodeVisitor.h"
#include "surveyor/ast/SyntaxTree.h"

#include <llvm/Support/Error.h>

namespace surveyor {

// Depth-first, pre-order traversal. Children are visited left to right
// after the node's own callback, unless the callback asks to skip them.
class TreeWalker {
public:
    static llvm::Error walk(const SyntaxTree &tree, NodeVisitor &visitor);
    static llvm::Error walk(const Node &root, NodeVisitor &visitor);
};

} // namespace surveyor
