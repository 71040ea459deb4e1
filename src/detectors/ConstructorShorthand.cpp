#include "surveyor/core/Config.h"
#include "surveyor/core/DetectorRegistry.h"
#include "surveyor/core/Errors.h"
#include "surveyor/core/PatternDetector.h"

#include <llvm/ADT/DenseSet.h>

namespace surveyor {

namespace {

// The sole expression of a `{ return e; }` block body, if it has that shape.
const Node *singleReturnedExpression(const Node &blockBody) {
    const Node *block = blockBody.firstChildOfKind(NodeKind::Block);
    if (!block || block->childCount() != 1)
        return nullptr;
    const Node *stmt = block->child(0);
    if (stmt->kind() != NodeKind::ReturnStatement)
        return nullptr;
    return stmt->child(0);
}

} // anonymous namespace

// Flags function bodies that only forward their parameters to a
// constructor, e.g. `[](int x, int y) { return Point(x, y); }`. Such
// wrappers can be replaced by a reference to the constructor itself.
class ConstructorShorthandDetector : public PatternDetector {
public:
    explicit ConstructorShorthandDetector(const Config &cfg)
        : strictCoverage_(cfg.strictCoverage) {}

    std::string_view getID() const override { return "tearoffs"; }
    std::string_view getTitle() const override {
        return "Constructor shorthand candidates";
    }

    std::vector<NodeKind> subscribedKinds() const override {
        return {NodeKind::BlockBody, NodeKind::ExpressionBody};
    }

    std::vector<Category> categories() const override {
        return {Category::HighConfidenceUnnamedTearoff,
                Category::HighConfidenceNamedTearoff,
                Category::LowConfidenceUnnamedTearoff,
                Category::LowConfidenceNamedTearoff};
    }

    llvm::Expected<WalkAction> visitBlockBody(const Node &body) override {
        const Node *expr = singleReturnedExpression(body);
        if (!expr)
            return WalkAction::Continue;
        return inspect(body, *expr);
    }

    llvm::Expected<WalkAction> visitExpressionBody(const Node &body) override {
        const Node *expr = body.child(0);
        if (!expr)
            return WalkAction::Continue;
        return inspect(body, *expr);
    }

private:
    llvm::Expected<WalkAction> inspect(const Node &body, const Node &expr) {
        // Only worth classifying the owner when the body is a construction.
        if (expr.kind() != NodeKind::InstanceCreation)
            return WalkAction::Continue;

        auto owner = formalParameterOwner(body);
        if (!owner) {
            record(Category::DetectorCoverageGap, body);
            if (strictCoverage_)
                return owner.takeError();
            note(toString(owner.takeError()));
            return WalkAction::Continue;
        }

        if (!forwardsOnlyParameters(expr, **owner))
            return WalkAction::Continue;

        record(tearoffCategory(confidenceOf(**owner), namednessOf(expr)), expr);
        return WalkAction::Continue;
    }

    // The declaration whose formal parameters are in scope for `body`.
    llvm::Expected<const Node *> formalParameterOwner(const Node &body) const {
        const Node *parent = body.parent();
        if (parent) {
            switch (parent->kind()) {
                case NodeKind::FunctionLiteral:
                case NodeKind::MethodDeclaration:
                case NodeKind::ConstructorDeclaration:
                    return parent;
                default:
                    break;
            }
        }
        std::string shape = "function body under ";
        shape += parent ? nodeKindName(parent->kind()) : "no parent";
        return llvm::make_error<DetectorCoverageError>(
            std::string(getID()), std::move(shape), body.location());
    }

    // Every argument must be a bare reference to one of `owner`'s
    // parameters. Order does not matter; literals, compound expressions
    // and foreign references disqualify the wrapper.
    static bool forwardsOnlyParameters(const Node &creation,
                                       const Node &owner) {
        llvm::DenseSet<uint64_t> formals;
        if (const Node *params =
                owner.firstChildOfKind(NodeKind::FormalParameterList)) {
            for (const Node *p : params->children()) {
                if (p->kind() != NodeKind::FormalParameter)
                    continue;
                if (const auto *decl = p->as<DeclarationInfo>()) {
                    if (decl->symbol.isResolved())
                        formals.insert(decl->symbol.id);
                }
            }
        }

        for (const Node *arg : creation.children()) {
            if (arg->kind() == NodeKind::NamedArgument) {
                arg = arg->child(0);
                if (!arg)
                    return false;
            }
            if (arg->kind() != NodeKind::SimpleIdentifier)
                return false;
            const auto *ident = arg->as<IdentifierInfo>();
            if (!ident || !ident->symbol.isResolved() ||
                !formals.contains(ident->symbol.id))
                return false;
        }
        return true;
    }

    // Inline anonymous functions are the rewrite target. Anything reachable
    // by name changes a public signature when rewritten.
    static Confidence confidenceOf(const Node &owner) {
        if (owner.kind() != NodeKind::FunctionLiteral)
            return Confidence::Low;
        const Node *outer = owner.parent();
        if (outer && outer->kind() == NodeKind::FunctionDeclaration)
            return Confidence::Low;
        return Confidence::High;
    }

    static Namedness namednessOf(const Node &creation) {
        const auto *info = creation.as<CreationInfo>();
        return (info && !info->constructorName.empty()) ? Namedness::Named
                                                        : Namedness::Unnamed;
    }

    bool strictCoverage_;
};

SURVEYOR_REGISTER_DETECTOR(ConstructorShorthandDetector, "tearoffs")

} // namespace surveyor
