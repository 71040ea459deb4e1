#pragma once

#include "surveyor/ast/SyntaxTree.h"

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

namespace surveyor::test {

// Builds syntax trees by hand, the shape the clang frontend would lower
// to, without running clang.
class TreeBuilder {
public:
    explicit TreeBuilder(std::string path = "unit.cc")
        : tree_(std::make_unique<SyntaxTree>(std::move(path))) {}

    Node &root() { return tree_->root(); }

    Node &add(Node &parent, NodeKind kind, NodePayload payload = {}) {
        return tree_->addChild(parent, kind, std::move(payload));
    }

    // FormalParameterList with one FormalParameter per (name, symbol id).
    Node &params(Node &owner,
                 std::initializer_list<std::pair<const char *, uint64_t>> ps) {
        Node &list = add(owner, NodeKind::FormalParameterList);
        for (const auto &[name, id] : ps) {
            add(list, NodeKind::FormalParameter,
                DeclarationInfo{name, Symbol{id, SymbolKind::Parameter, name}});
        }
        return list;
    }

    // `{ return <expr>; }` under `owner`; returns the ReturnStatement.
    Node &returnBody(Node &owner) {
        Node &body = add(owner, NodeKind::BlockBody);
        Node &block = add(body, NodeKind::Block);
        return add(block, NodeKind::ReturnStatement);
    }

    // `=> <expr>` under `owner`; returns the ExpressionBody.
    Node &expressionBody(Node &owner) {
        return add(owner, NodeKind::ExpressionBody);
    }

    Node &creation(Node &parent, std::string typeName,
                   std::string ctorName = "") {
        return add(parent, NodeKind::InstanceCreation,
                   CreationInfo{std::move(typeName), std::move(ctorName)});
    }

    Node &ident(Node &parent, std::string name, uint64_t id,
                SymbolKind kind = SymbolKind::Parameter,
                StaticType type = {TypeKind::Builtin, "int"}) {
        Symbol sym{id, kind, name};
        return add(parent, NodeKind::SimpleIdentifier,
                   IdentifierInfo{std::move(name), std::move(sym),
                                  std::move(type)});
    }

    Node &named(Node &parent, std::string name) {
        return add(parent, NodeKind::NamedArgument,
                   NamedArgumentInfo{std::move(name)});
    }

    Node &literal(Node &parent) { return add(parent, NodeKind::Literal); }

    const SyntaxTree &tree() const { return *tree_; }
    std::unique_ptr<SyntaxTree> take() { return std::move(tree_); }

private:
    std::unique_ptr<SyntaxTree> tree_;
};

} // namespace surveyor::test
