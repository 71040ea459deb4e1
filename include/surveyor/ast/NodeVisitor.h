#pragma once

#include "surveyor/ast/SyntaxTree.h"

#include <llvm/Support/Error.h>

namespace surveyor {

enum class WalkAction { Continue, SkipChildren };

// Per-kind callbacks, all defaulting to Continue. visitNode() is the single
// entry point the walker calls; it dispatches on the node kind with an
// exhaustive switch. A callback returning an error aborts the current file.
class NodeVisitor {
public:
    virtual ~NodeVisitor() = default;

    virtual llvm::Expected<WalkAction> visitNode(const Node &node);

#define SURVEYOR_NODE(Kind)                                                    \
    virtual llvm::Expected<WalkAction> visit##Kind(const Node &) {            \
        return WalkAction::Continue;                                           \
    }
#include "surveyor/ast/NodeKinds.def"
};

} // namespace surveyor
