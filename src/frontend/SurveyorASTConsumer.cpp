#include "surveyor/frontend/SurveyorASTConsumer.h"
#include "surveyor/frontend/ASTLowering.h"

namespace surveyor {

SurveyorASTConsumer::SurveyorASTConsumer(std::string file,
                                         std::unique_ptr<SyntaxTree> &out)
    : file_(std::move(file)), out_(out) {}

void SurveyorASTConsumer::HandleTranslationUnit(clang::ASTContext &Ctx) {
    // A unit with fatal errors still gets a tree for whatever parsed.
    ASTLowering lowering(Ctx);
    out_ = lowering.lower(file_);
}

} // namespace surveyor
