#include "surveyor/ast/NodeVisitor.h"

namespace surveyor {

llvm::Expected<WalkAction> NodeVisitor::visitNode(const Node &node) {
    switch (node.kind()) {
#define SURVEYOR_NODE(Kind)                                                    \
    case NodeKind::Kind:                                                       \
        return visit##Kind(node);
#include "surveyor/ast/NodeKinds.def"
    }
    return WalkAction::Continue;
}

} // namespace surveyor
