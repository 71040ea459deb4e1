#include "surveyor/ast/SyntaxTree.h"

namespace surveyor {

std::string_view nodeKindName(NodeKind kind) {
    switch (kind) {
#define SURVEYOR_NODE(Kind)                                                    \
    case NodeKind::Kind:                                                       \
        return #Kind;
#include "surveyor/ast/NodeKinds.def"
    }
    return "Unknown";
}

const Node *Node::firstChildOfKind(NodeKind kind) const {
    for (const Node *c : children_) {
        if (c->kind() == kind)
            return c;
    }
    return nullptr;
}

std::string_view Node::text() const {
    const std::string &src = tree_->source();
    if (range_.offset >= src.size())
        return {};
    return std::string_view(src).substr(range_.offset, range_.length);
}

SourceLocation Node::location() const {
    SourceLocation loc;
    loc.file   = tree_->path();
    loc.offset = range_.offset;
    loc.line   = range_.line;
    loc.column = range_.column;
    return loc;
}

SyntaxTree::SyntaxTree(std::string path) : path_(std::move(path)) {
    nodes_.push_back(std::unique_ptr<Node>(
        new Node(this, nullptr, NodeKind::CompilationUnit, {}, {})));
}

Node &SyntaxTree::addChild(Node &parent, NodeKind kind, NodePayload payload,
                           SourceRange range) {
    nodes_.push_back(std::unique_ptr<Node>(
        new Node(this, &parent, kind, std::move(payload), range)));
    Node &node = *nodes_.back();
    parent.children_.push_back(&node);
    return node;
}

} // namespace surveyor
