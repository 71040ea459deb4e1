#pragma once

#include "surveyor/ast/SyntaxTree.h"

#include <clang/AST/ASTConsumer.h>
#include <clang/AST/ASTContext.h>

#include <memory>
#include <string>

namespace surveyor {

class SurveyorASTConsumer : public clang::ASTConsumer {
public:
    SurveyorASTConsumer(std::string file, std::unique_ptr<SyntaxTree> &out);

    void HandleTranslationUnit(clang::ASTContext &Ctx) override;

private:
    std::string file_;
    std::unique_ptr<SyntaxTree> &out_;
};

} // namespace surveyor
