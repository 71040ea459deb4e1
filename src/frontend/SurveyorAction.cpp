#include "surveyor/frontend/SurveyorAction.h"
#include "surveyor/frontend/DiagnosticCollector.h"
#include "surveyor/frontend/SurveyorASTConsumer.h"

#include <clang/Frontend/CompilerInstance.h>

namespace surveyor {

SurveyorAction::SurveyorAction(std::string packagePath,
                               DiagnosticCollector &collector,
                               std::vector<PackageUnit> &units)
    : packagePath_(std::move(packagePath)), collector_(collector),
      units_(units) {}

std::unique_ptr<clang::ASTConsumer>
SurveyorAction::CreateASTConsumer(clang::CompilerInstance & /*CI*/,
                                  llvm::StringRef file) {
    currentFile_ = file.str();
    tree_.reset();
    return std::make_unique<SurveyorASTConsumer>(currentFile_, tree_);
}

void SurveyorAction::EndSourceFileAction() {
    PackageUnit unit;
    unit.packagePath = packagePath_;
    unit.path = currentFile_;
    unit.tree = tree_ ? std::move(tree_)
                      : std::make_unique<SyntaxTree>(currentFile_);
    unit.diagnostics = collector_.take();
    units_.push_back(std::move(unit));
}

// --- Factory ---

SurveyorActionFactory::SurveyorActionFactory(std::string packagePath,
                                             DiagnosticCollector &collector,
                                             std::vector<PackageUnit> &units)
    : packagePath_(std::move(packagePath)), collector_(collector),
      units_(units) {}

std::unique_ptr<clang::FrontendAction> SurveyorActionFactory::create() {
    return std::make_unique<SurveyorAction>(packagePath_, collector_, units_);
}

} // namespace surveyor
