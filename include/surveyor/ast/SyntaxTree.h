#pragma once

#include "surveyor/core/Evidence.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace surveyor {

enum class NodeKind : uint8_t {
#define SURVEYOR_NODE(Kind) Kind,
#include "surveyor/ast/NodeKinds.def"
};

inline constexpr size_t kNodeKindCount = 0
#define SURVEYOR_NODE(Kind) + 1
#include "surveyor/ast/NodeKinds.def"
    ;

std::string_view nodeKindName(NodeKind kind);

enum class SymbolKind : uint8_t {
    Unknown,
    Variable,
    Parameter,
    Field,
    Function,
    Method,
    Class,
    Enum,
    TypeAlias,
    TypeParameter,
    Namespace,
};

// Declarations that introduce a type, as opposed to values of a type.
constexpr bool isTypeDefining(SymbolKind k) {
    return k == SymbolKind::Class || k == SymbolKind::Enum ||
           k == SymbolKind::TypeAlias || k == SymbolKind::TypeParameter;
}

// Resolved declaration a node refers to. `id` is unique within one unit;
// 0 means unresolved.
struct Symbol {
    uint64_t    id   = 0;
    SymbolKind  kind = SymbolKind::Unknown;
    std::string name;

    bool isResolved() const { return id != 0; }
};

enum class TypeKind : uint8_t {
    None,       // no static type (declarations, statements, type names)
    Interface,  // class/struct/union type
    TypeValue,  // the reflective "type object" type
    Function,
    Builtin,
    Dynamic,    // dependent / unresolved
};

struct StaticType {
    TypeKind    kind = TypeKind::None;
    std::string name;
};

struct DeclarationInfo {
    std::string name;
    Symbol      symbol;
};

struct IdentifierInfo {
    std::string name;
    Symbol      symbol;
    StaticType  type;
};

struct CreationInfo {
    std::string typeName;
    std::string constructorName; // empty for the unnamed constructor
};

struct NamedArgumentInfo {
    std::string name;
};

using NodePayload = std::variant<std::monostate, DeclarationInfo,
                                 IdentifierInfo, CreationInfo,
                                 NamedArgumentInfo>;

struct SourceRange {
    uint32_t offset = 0;
    uint32_t length = 0;
    unsigned line   = 0;
    unsigned column = 0;
};

class SyntaxTree;

class Node {
public:
    NodeKind kind() const { return kind_; }
    const Node *parent() const { return parent_; }
    const std::vector<Node *> &children() const { return children_; }
    const SourceRange &range() const { return range_; }
    const SyntaxTree &tree() const { return *tree_; }

    size_t childCount() const { return children_.size(); }
    const Node *child(size_t i) const {
        return i < children_.size() ? children_[i] : nullptr;
    }
    const Node *firstChildOfKind(NodeKind kind) const;

    template <typename T> const T *as() const {
        return std::get_if<T>(&payload_);
    }

    // Source text covered by this node, or an empty view if the tree has no
    // source buffer for it.
    std::string_view text() const;

    SourceLocation location() const;

private:
    friend class SyntaxTree;

    Node(const SyntaxTree *tree, Node *parent, NodeKind kind,
         NodePayload payload, SourceRange range)
        : tree_(tree), parent_(parent), kind_(kind),
          payload_(std::move(payload)), range_(range) {}

    const SyntaxTree   *tree_;
    Node               *parent_;
    NodeKind            kind_;
    NodePayload         payload_;
    SourceRange         range_;
    std::vector<Node *> children_;
};

// Owns every node of one compilation unit. Nodes are stable in memory for
// the lifetime of the tree; parent/child links are non-owning.
class SyntaxTree {
public:
    explicit SyntaxTree(std::string path);

    SyntaxTree(const SyntaxTree &) = delete;
    SyntaxTree &operator=(const SyntaxTree &) = delete;

    const std::string &path() const { return path_; }

    Node &root() { return *nodes_.front(); }
    const Node &root() const { return *nodes_.front(); }

    Node &addChild(Node &parent, NodeKind kind, NodePayload payload = {},
                   SourceRange range = {});

    void setSource(std::string source) { source_ = std::move(source); }
    const std::string &source() const { return source_; }

    size_t size() const { return nodes_.size(); }

private:
    std::string                        path_;
    std::string                        source_;
    std::vector<std::unique_ptr<Node>> nodes_;
};

} // namespace surveyor
