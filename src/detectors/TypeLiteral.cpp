#include "surveyor/core/Config.h"
#include "surveyor/core/DetectorRegistry.h"
#include "surveyor/core/PatternDetector.h"

namespace surveyor {

// Records identifiers that evaluate to a runtime type object, e.g. the
// operand of `typeid(Widget)`. Names inside type annotations are skipped.
class TypeLiteralDetector : public PatternDetector {
public:
    explicit TypeLiteralDetector(const Config & /*cfg*/) {}

    std::string_view getID() const override { return "type-literals"; }
    std::string_view getTitle() const override { return "Type literals"; }

    std::vector<NodeKind> subscribedKinds() const override {
        return {NodeKind::SimpleIdentifier, NodeKind::PrefixedIdentifier};
    }

    std::vector<Category> categories() const override {
        return {Category::TypeLiteral};
    }

    llvm::Expected<WalkAction> visitSimpleIdentifier(const Node &node) override {
        handleIdentifier(node);
        return WalkAction::Continue;
    }

    llvm::Expected<WalkAction>
    visitPrefixedIdentifier(const Node &node) override {
        handleIdentifier(node);
        return WalkAction::Continue;
    }

private:
    void handleIdentifier(const Node &node) {
        if (node.parent() && node.parent()->kind() == NodeKind::TypeAnnotation)
            return;
        const auto *ident = node.as<IdentifierInfo>();
        if (!ident || ident->type.kind != TypeKind::TypeValue)
            return;
        if (isTypeDefining(ident->symbol.kind))
            record(Category::TypeLiteral, node);
    }
};

SURVEYOR_REGISTER_DETECTOR(TypeLiteralDetector, "type-literals")

} // namespace surveyor
