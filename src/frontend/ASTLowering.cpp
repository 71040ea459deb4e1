#include "surveyor/frontend/ASTLowering.h"

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/DeclTemplate.h>
#include <clang/AST/Expr.h>
#include <clang/AST/ExprCXX.h>
#include <clang/AST/Stmt.h>
#include <clang/AST/TypeLoc.h>
#include <clang/Basic/SourceManager.h>
#include <clang/Lex/Lexer.h>

#include <cstdint>

namespace surveyor {

namespace {

SymbolKind symbolKindOf(const clang::NamedDecl *D) {
    if (llvm::isa<clang::ParmVarDecl>(D))
        return SymbolKind::Parameter;
    if (llvm::isa<clang::FieldDecl, clang::IndirectFieldDecl>(D))
        return SymbolKind::Field;
    if (llvm::isa<clang::VarDecl, clang::BindingDecl,
                  clang::EnumConstantDecl>(D))
        return SymbolKind::Variable;
    if (llvm::isa<clang::CXXMethodDecl>(D))
        return SymbolKind::Method;
    if (llvm::isa<clang::FunctionDecl, clang::FunctionTemplateDecl>(D))
        return SymbolKind::Function;
    if (llvm::isa<clang::EnumDecl>(D))
        return SymbolKind::Enum;
    if (llvm::isa<clang::RecordDecl, clang::ClassTemplateDecl>(D))
        return SymbolKind::Class;
    if (llvm::isa<clang::TypedefNameDecl, clang::TypeAliasTemplateDecl>(D))
        return SymbolKind::TypeAlias;
    if (llvm::isa<clang::TemplateTypeParmDecl>(D))
        return SymbolKind::TypeParameter;
    if (llvm::isa<clang::NamespaceDecl>(D))
        return SymbolKind::Namespace;
    return SymbolKind::Unknown;
}

// The declaration that introduces the type `T` names, if any.
const clang::NamedDecl *namedTypeDecl(clang::QualType T) {
    if (T.isNull())
        return nullptr;
    if (const auto *TT = T->getAs<clang::TypedefType>())
        return TT->getDecl();
    if (const auto *TP = T->getAs<clang::TemplateTypeParmType>())
        return TP->getDecl();
    return T->getAsTagDecl();
}

bool isTypeInfo(clang::QualType T) {
    const auto *RD = T.getNonReferenceType()->getAsCXXRecordDecl();
    if (!RD || !RD->isInStdNamespace())
        return false;
    const auto *II = RD->getIdentifier();
    return II && II->isStr("type_info");
}

// Parameters of free functions and lambdas are looked up by these ids.
// Unique within one ASTContext, which is all a tree ever spans.
uint64_t symbolId(const clang::Decl *D) {
    return static_cast<uint64_t>(D->getCanonicalDecl()->getID());
}

} // anonymous namespace

ASTLowering::ASTLowering(clang::ASTContext &ctx)
    : ctx_(ctx), sm_(ctx.getSourceManager()), langOpts_(ctx.getLangOpts()) {}

std::unique_ptr<SyntaxTree> ASTLowering::lower(llvm::StringRef path) {
    auto tree = std::make_unique<SyntaxTree>(path.str());
    tree_ = tree.get();

    bool invalid = false;
    llvm::StringRef buffer = sm_.getBufferData(sm_.getMainFileID(), &invalid);
    if (!invalid)
        tree->setSource(buffer.str());

    lowerDeclContext(ctx_.getTranslationUnitDecl(), tree->root());

    tree_ = nullptr;
    return tree;
}

// --- Source mapping ---

bool ASTLowering::inMainFile(clang::SourceLocation loc) const {
    if (loc.isInvalid())
        return false;
    return sm_.isWrittenInMainFile(sm_.getExpansionLoc(loc));
}

SourceRange ASTLowering::rangeOf(clang::SourceRange range) const {
    SourceRange out;
    if (range.isInvalid())
        return out;

    clang::SourceLocation begin = sm_.getExpansionLoc(range.getBegin());
    if (!sm_.isWrittenInMainFile(begin)) {
        // Keep the text empty rather than point into the wrong buffer.
        out.offset = UINT32_MAX;
        return out;
    }
    clang::SourceLocation end = clang::Lexer::getLocForEndOfToken(
        sm_.getExpansionLoc(range.getEnd()), 0, sm_, langOpts_);

    const unsigned b = sm_.getFileOffset(begin);
    out.offset = b;
    if (end.isValid() && sm_.getFileID(end) == sm_.getFileID(begin)) {
        const unsigned e = sm_.getFileOffset(end);
        if (e > b)
            out.length = e - b;
    }
    out.line = sm_.getExpansionLineNumber(begin);
    out.column = sm_.getExpansionColumnNumber(begin);
    return out;
}

Node &ASTLowering::add(Node &parent, NodeKind kind, clang::SourceRange range,
                       NodePayload payload) {
    return tree_->addChild(parent, kind, std::move(payload), rangeOf(range));
}

Symbol ASTLowering::symbolOf(const clang::NamedDecl *D) const {
    Symbol sym;
    if (!D)
        return sym;
    sym.id = symbolId(D);
    sym.kind = symbolKindOf(D);
    sym.name = D->getNameAsString();
    return sym;
}

StaticType ASTLowering::staticTypeOf(clang::QualType T) const {
    StaticType st;
    if (T.isNull())
        return st;
    st.name = T.getAsString(ctx_.getPrintingPolicy());
    if (T->isDependentType())
        st.kind = TypeKind::Dynamic;
    else if (isTypeInfo(T))
        st.kind = TypeKind::TypeValue;
    else if (T->isRecordType())
        st.kind = TypeKind::Interface;
    else if (T->isFunctionType() || T->isFunctionPointerType() ||
             T->isMemberFunctionPointerType())
        st.kind = TypeKind::Function;
    else
        st.kind = TypeKind::Builtin;
    return st;
}

CreationInfo ASTLowering::creationOf(clang::QualType T,
                                     std::string ctorName) const {
    CreationInfo info;
    if (const auto *D = namedTypeDecl(T))
        info.typeName = D->getNameAsString();
    else
        info.typeName = T.getAsString(ctx_.getPrintingPolicy());
    info.constructorName = std::move(ctorName);
    return info;
}

// --- Declarations ---

void ASTLowering::lowerDeclContext(const clang::DeclContext *DC,
                                   Node &parent) {
    for (const clang::Decl *D : DC->decls())
        lowerDecl(D, parent);
}

void ASTLowering::lowerDecl(const clang::Decl *D, Node &parent) {
    if (!D || D->isImplicit() || !inMainFile(D->getLocation()))
        return;

    if (const auto *NS = llvm::dyn_cast<clang::NamespaceDecl>(D)) {
        lowerDeclContext(NS, parent);
        return;
    }
    if (const auto *LS = llvm::dyn_cast<clang::LinkageSpecDecl>(D)) {
        lowerDeclContext(LS, parent);
        return;
    }
    if (const auto *FTD = llvm::dyn_cast<clang::FunctionTemplateDecl>(D)) {
        lowerDecl(FTD->getTemplatedDecl(), parent);
        return;
    }
    if (const auto *CTD = llvm::dyn_cast<clang::ClassTemplateDecl>(D)) {
        lowerDecl(CTD->getTemplatedDecl(), parent);
        return;
    }

    if (const auto *FD = llvm::dyn_cast<clang::FunctionDecl>(D)) {
        if (!FD->doesThisDeclarationHaveABody() ||
            FD->isTemplateInstantiation())
            return;
        DeclarationInfo info{FD->getNameAsString(), symbolOf(FD)};
        if (llvm::isa<clang::CXXConstructorDecl>(FD)) {
            Node &ctor = add(parent, NodeKind::ConstructorDeclaration,
                             FD->getSourceRange(), std::move(info));
            lowerFunction(FD, ctor);
        } else if (llvm::isa<clang::CXXMethodDecl>(FD)) {
            Node &method = add(parent, NodeKind::MethodDeclaration,
                               FD->getSourceRange(), std::move(info));
            lowerFunction(FD, method);
        } else {
            // A named function is a declaration wrapping a function literal.
            Node &decl = add(parent, NodeKind::FunctionDeclaration,
                             FD->getSourceRange(), std::move(info));
            Node &literal = add(decl, NodeKind::FunctionLiteral,
                                FD->getSourceRange());
            lowerFunction(FD, literal);
        }
        return;
    }

    if (const auto *RD = llvm::dyn_cast<clang::RecordDecl>(D)) {
        if (!RD->isThisDeclarationADefinition())
            return;
        if (const auto *CRD = llvm::dyn_cast<clang::CXXRecordDecl>(RD)) {
            if (CRD->isLambda())
                return;
            if (const auto *Spec =
                    llvm::dyn_cast<clang::ClassTemplateSpecializationDecl>(CRD)) {
                if (Spec->getSpecializationKind() ==
                    clang::TSK_ImplicitInstantiation)
                    return;
            }
        }
        Node &cls = add(parent, NodeKind::ClassDeclaration, RD->getSourceRange(),
                        DeclarationInfo{RD->getNameAsString(), symbolOf(RD)});
        lowerDeclContext(RD, cls);
        return;
    }

    if (const auto *VD = llvm::dyn_cast<clang::VarDecl>(D)) {
        if (llvm::isa<clang::ParmVarDecl>(VD))
            return;
        Node &var = add(parent, NodeKind::VariableDeclaration,
                        VD->getSourceRange(),
                        DeclarationInfo{VD->getNameAsString(), symbolOf(VD)});
        lowerTypeAnnotation(VD->getTypeSourceInfo(), var);
        if (VD->hasInit())
            lowerStmt(VD->getInit(), var);
        return;
    }

    if (const auto *FD = llvm::dyn_cast<clang::FieldDecl>(D)) {
        Node &field = add(parent, NodeKind::VariableDeclaration,
                          FD->getSourceRange(),
                          DeclarationInfo{FD->getNameAsString(), symbolOf(FD)});
        lowerTypeAnnotation(FD->getTypeSourceInfo(), field);
        if (FD->hasInClassInitializer())
            lowerStmt(FD->getInClassInitializer(), field);
        return;
    }
}

void ASTLowering::lowerFunction(const clang::FunctionDecl *FD, Node &owner) {
    Node &params = add(owner, NodeKind::FormalParameterList,
                       FD->getParametersSourceRange());
    for (const clang::ParmVarDecl *P : FD->parameters()) {
        Node &param = add(params, NodeKind::FormalParameter,
                          P->getSourceRange(),
                          DeclarationInfo{P->getNameAsString(), symbolOf(P)});
        lowerTypeAnnotation(P->getTypeSourceInfo(), param);
    }

    if (const auto *CD = llvm::dyn_cast<clang::CXXConstructorDecl>(FD)) {
        for (const clang::CXXCtorInitializer *Init : CD->inits()) {
            if (Init->isWritten())
                lowerStmt(Init->getInit(), owner);
        }
    }

    if (!FD->doesThisDeclarationHaveABody())
        return;
    const clang::Stmt *body = FD->getBody();
    if (!body)
        return;

    Node &blockBody = add(owner, NodeKind::BlockBody, body->getSourceRange());
    Node &block = add(blockBody, NodeKind::Block, body->getSourceRange());
    if (const auto *CS = llvm::dyn_cast<clang::CompoundStmt>(body)) {
        for (const clang::Stmt *S : CS->body())
            lowerStmt(S, block);
    } else {
        // Function-try-block.
        lowerStmt(body, block);
    }
}

void ASTLowering::lowerTypeAnnotation(const clang::TypeSourceInfo *TSI,
                                      Node &parent) {
    if (!TSI)
        return;
    clang::SourceRange range = TSI->getTypeLoc().getSourceRange();
    clang::QualType T = TSI->getType();

    Node &annotation = add(parent, NodeKind::TypeAnnotation, range);
    IdentifierInfo info;
    info.name = T.getAsString(ctx_.getPrintingPolicy());
    info.symbol = symbolOf(namedTypeDecl(T));
    add(annotation, NodeKind::SimpleIdentifier, range, std::move(info));
}

// --- Statements and expressions ---

void ASTLowering::lowerChildren(const clang::Stmt *S, Node &parent) {
    for (const clang::Stmt *child : S->children())
        lowerStmt(child, parent);
}

void ASTLowering::lowerStmt(const clang::Stmt *S, Node &parent) {
    if (!S)
        return;

    if (const auto *CS = llvm::dyn_cast<clang::CompoundStmt>(S)) {
        Node &block = add(parent, NodeKind::Block, CS->getSourceRange());
        for (const clang::Stmt *child : CS->body())
            lowerStmt(child, block);
        return;
    }
    if (const auto *RS = llvm::dyn_cast<clang::ReturnStmt>(S)) {
        Node &ret = add(parent, NodeKind::ReturnStatement, RS->getSourceRange());
        lowerStmt(RS->getRetValue(), ret);
        return;
    }
    if (const auto *DS = llvm::dyn_cast<clang::DeclStmt>(S)) {
        Node &stmt = add(parent, NodeKind::Statement, DS->getSourceRange());
        for (const clang::Decl *D : DS->decls())
            lowerDecl(D, stmt);
        return;
    }
    if (const auto *E = llvm::dyn_cast<clang::Expr>(S)) {
        lowerExpr(E, parent);
        return;
    }

    Node &stmt = add(parent, NodeKind::Statement, S->getSourceRange());
    lowerChildren(S, stmt);
}

void ASTLowering::lowerExpr(const clang::Expr *E, Node &parent) {
    // Transparent wrappers.
    if (const auto *ICE = llvm::dyn_cast<clang::ImplicitCastExpr>(E))
        return lowerStmt(ICE->getSubExpr(), parent);
    if (const auto *FE = llvm::dyn_cast<clang::FullExpr>(E))
        return lowerStmt(FE->getSubExpr(), parent);
    if (const auto *MTE = llvm::dyn_cast<clang::MaterializeTemporaryExpr>(E))
        return lowerStmt(MTE->getSubExpr(), parent);
    if (const auto *BTE = llvm::dyn_cast<clang::CXXBindTemporaryExpr>(E))
        return lowerStmt(BTE->getSubExpr(), parent);
    if (const auto *PE = llvm::dyn_cast<clang::ParenExpr>(E))
        return lowerStmt(PE->getSubExpr(), parent);
    if (llvm::isa<clang::CXXDefaultArgExpr, clang::CXXDefaultInitExpr>(E))
        return;

    if (lowerConstruction(E, parent))
        return;

    if (const auto *TE = llvm::dyn_cast<clang::CXXTypeidExpr>(E)) {
        lowerTypeid(TE, parent);
        return;
    }

    if (const auto *DRE = llvm::dyn_cast<clang::DeclRefExpr>(E)) {
        IdentifierInfo info;
        info.name = DRE->getNameInfo().getAsString();
        info.symbol = symbolOf(DRE->getDecl());
        info.type = staticTypeOf(DRE->getType());
        add(parent,
            DRE->hasQualifier() ? NodeKind::PrefixedIdentifier
                                : NodeKind::SimpleIdentifier,
            DRE->getSourceRange(), std::move(info));
        return;
    }

    if (const auto *LE = llvm::dyn_cast<clang::LambdaExpr>(E)) {
        Node &literal = add(parent, NodeKind::FunctionLiteral,
                            LE->getSourceRange());
        lowerFunction(LE->getCallOperator(), literal);
        return;
    }

    if (llvm::isa<clang::IntegerLiteral, clang::FloatingLiteral,
                  clang::StringLiteral, clang::CharacterLiteral,
                  clang::CXXBoolLiteralExpr, clang::CXXNullPtrLiteralExpr,
                  clang::UserDefinedLiteral, clang::ImaginaryLiteral,
                  clang::FixedPointLiteral>(E)) {
        add(parent, NodeKind::Literal, E->getSourceRange());
        return;
    }

    if (llvm::isa<clang::CallExpr>(E)) {
        Node &call = add(parent, NodeKind::Invocation, E->getSourceRange());
        lowerChildren(E, call);
        return;
    }

    Node &expr = add(parent, NodeKind::Expression, E->getSourceRange());
    lowerChildren(E, expr);
}

// Object construction written by the user, in any of its spellings.
bool ASTLowering::lowerConstruction(const clang::Expr *E, Node &parent) {
    // `T(a, b)`, `T{a, b}`, `T()`
    if (const auto *TOE = llvm::dyn_cast<clang::CXXTemporaryObjectExpr>(E)) {
        Node &creation = add(parent, NodeKind::InstanceCreation,
                             TOE->getSourceRange(),
                             creationOf(TOE->getType(), ""));
        for (const clang::Expr *arg : TOE->arguments())
            lowerStmt(arg, creation);
        return true;
    }

    // `T(a)` and `T{.x = a}`: a functional cast to a class type.
    if (const auto *FCE = llvm::dyn_cast<clang::CXXFunctionalCastExpr>(E)) {
        if (!FCE->getType()->isRecordType())
            return false;
        Node &creation = add(parent, NodeKind::InstanceCreation,
                             FCE->getSourceRange(),
                             creationOf(FCE->getType(), ""));
        const clang::Expr *sub = FCE->getSubExpr()->IgnoreImplicit();
        if (const auto *CE = llvm::dyn_cast<clang::CXXConstructExpr>(sub)) {
            for (const clang::Expr *arg : CE->arguments())
                lowerStmt(arg, creation);
        } else if (const auto *ILE = llvm::dyn_cast<clang::InitListExpr>(sub)) {
            lowerInitList(ILE, creation);
        } else {
            lowerStmt(sub, creation);
        }
        return true;
    }

    if (const auto *CE = llvm::dyn_cast<clang::CXXConstructExpr>(E)) {
        // Elided or implicit copies and conversions are not written
        // constructions; surface their operands instead.
        if (CE->isElidable() || CE->getParenOrBraceRange().isInvalid()) {
            for (const clang::Expr *arg : CE->arguments())
                lowerStmt(arg, parent);
            return true;
        }
        Node &creation = add(parent, NodeKind::InstanceCreation,
                             CE->getSourceRange(),
                             creationOf(CE->getType(), ""));
        for (const clang::Expr *arg : CE->arguments())
            lowerStmt(arg, creation);
        return true;
    }

    // Dependent `T(a, b)` inside a template.
    if (const auto *UCE = llvm::dyn_cast<clang::CXXUnresolvedConstructExpr>(E)) {
        Node &creation = add(parent, NodeKind::InstanceCreation,
                             UCE->getSourceRange(),
                             creationOf(UCE->getTypeAsWritten(), ""));
        for (const clang::Expr *arg : UCE->arguments())
            lowerStmt(arg, creation);
        return true;
    }

    // Named constructor idiom: a static member of T returning T by value.
    if (const auto *Call = llvm::dyn_cast<clang::CallExpr>(E)) {
        const auto *MD =
            llvm::dyn_cast_or_null<clang::CXXMethodDecl>(Call->getDirectCallee());
        if (!MD || !MD->isStatic())
            return false;
        clang::QualType ret = MD->getReturnType();
        const clang::CXXRecordDecl *RD = ret->getAsCXXRecordDecl();
        if (!RD || RD->getCanonicalDecl() != MD->getParent()->getCanonicalDecl())
            return false;
        Node &creation = add(parent, NodeKind::InstanceCreation,
                             Call->getSourceRange(),
                             creationOf(ret, MD->getNameAsString()));
        for (const clang::Expr *arg : Call->arguments())
            lowerStmt(arg, creation);
        return true;
    }

    return false;
}

void ASTLowering::lowerInitList(const clang::InitListExpr *ILE,
                                Node &creation) {
    // Designators only survive in the syntactic form.
    const clang::InitListExpr *syntactic = ILE;
    if (ILE->isSemanticForm() && ILE->getSyntacticForm())
        syntactic = ILE->getSyntacticForm();

    for (unsigned i = 0, n = syntactic->getNumInits(); i < n; ++i) {
        const clang::Expr *init = syntactic->getInit(i);
        const auto *DIE = llvm::dyn_cast<clang::DesignatedInitExpr>(init);
        if (!DIE) {
            lowerStmt(init, creation);
            continue;
        }
        NamedArgumentInfo info;
        if (DIE->size() == 1 && DIE->getDesignator(0)->isFieldDesignator()) {
            if (const auto *II = DIE->getDesignator(0)->getFieldName())
                info.name = II->getName().str();
        }
        Node &named = add(creation, NodeKind::NamedArgument,
                          DIE->getSourceRange(), std::move(info));
        lowerStmt(DIE->getInit(), named);
    }
}

// `typeid(T)` evaluates T as a runtime type object: lowered as an
// identifier for T whose static type is the type-value type.
void ASTLowering::lowerTypeid(const clang::CXXTypeidExpr *E, Node &parent) {
    Node &expr = add(parent, NodeKind::Expression, E->getSourceRange());
    if (!E->isTypeOperand()) {
        lowerStmt(E->getExprOperand(), expr);
        return;
    }

    clang::QualType T = E->getTypeOperand(ctx_);
    clang::SourceRange range = E->getSourceRange();
    NodeKind kind = NodeKind::SimpleIdentifier;
    if (const clang::TypeSourceInfo *TSI = E->getTypeOperandSourceInfo()) {
        clang::TypeLoc TL = TSI->getTypeLoc();
        range = TL.getSourceRange();
        if (auto ETL = TL.getAs<clang::ElaboratedTypeLoc>()) {
            if (ETL.getQualifierLoc())
                kind = NodeKind::PrefixedIdentifier;
        }
    }

    IdentifierInfo info;
    info.name = T.getAsString(ctx_.getPrintingPolicy());
    info.symbol = symbolOf(namedTypeDecl(T));
    info.type = StaticType{TypeKind::TypeValue, "std::type_info"};
    add(expr, kind, range, std::move(info));
}

} // namespace surveyor
