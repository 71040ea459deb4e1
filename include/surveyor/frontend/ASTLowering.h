#pragma once

#include "surveyor/ast/SyntaxTree.h"

#include <llvm/ADT/StringRef.h>

#include <memory>

namespace clang {
class ASTContext;
class Decl;
class DeclContext;
class Expr;
class FunctionDecl;
class InitListExpr;
class LangOptions;
class NamedDecl;
class QualType;
class SourceLocation;
class SourceManager;
class SourceRange;
class Stmt;
class CXXTypeidExpr;
class TypeSourceInfo;
} // namespace clang

namespace surveyor {

// Builds the surveyor syntax tree for the main file of a clang AST.
//
// Implicit nodes (implicit casts, cleanups, bound temporaries, implicit and
// elidable copies) and parentheses are transparent. Declarations outside the
// main file are not lowered, so a header is never counted once per including
// unit.
class ASTLowering {
public:
    explicit ASTLowering(clang::ASTContext &ctx);

    std::unique_ptr<SyntaxTree> lower(llvm::StringRef path);

private:
    void lowerDeclContext(const clang::DeclContext *DC, Node &parent);
    void lowerDecl(const clang::Decl *D, Node &parent);
    void lowerFunction(const clang::FunctionDecl *FD, Node &owner);
    void lowerTypeAnnotation(const clang::TypeSourceInfo *TSI, Node &parent);
    void lowerStmt(const clang::Stmt *S, Node &parent);
    void lowerChildren(const clang::Stmt *S, Node &parent);
    void lowerExpr(const clang::Expr *E, Node &parent);
    bool lowerConstruction(const clang::Expr *E, Node &parent);
    void lowerInitList(const clang::InitListExpr *ILE, Node &creation);
    void lowerTypeid(const clang::CXXTypeidExpr *E, Node &parent);

    Node &add(Node &parent, NodeKind kind, clang::SourceRange range,
              NodePayload payload = {});

    SourceRange rangeOf(clang::SourceRange range) const;
    bool inMainFile(clang::SourceLocation loc) const;
    Symbol symbolOf(const clang::NamedDecl *D) const;
    StaticType staticTypeOf(clang::QualType T) const;
    CreationInfo creationOf(clang::QualType T, std::string ctorName) const;

    clang::ASTContext &ctx_;
    const clang::SourceManager &sm_;
    const clang::LangOptions &langOpts_;
    SyntaxTree *tree_ = nullptr;
};

} // namespace surveyor
