#pragma once

#include "surveyor/ast/PackageUnit.h"

#include <clang/Frontend/FrontendAction.h>
#include <clang/Tooling/Tooling.h>

#include <memory>
#include <string>
#include <vector>

namespace surveyor {

class DiagnosticCollector;

// Lowers one translation unit and files it, with the diagnostics clang
// produced for it, as a PackageUnit.
class SurveyorAction : public clang::ASTFrontendAction {
public:
    SurveyorAction(std::string packagePath, DiagnosticCollector &collector,
                   std::vector<PackageUnit> &units);

    std::unique_ptr<clang::ASTConsumer>
    CreateASTConsumer(clang::CompilerInstance &CI,
                      llvm::StringRef file) override;

protected:
    void EndSourceFileAction() override;

private:
    std::string packagePath_;
    DiagnosticCollector &collector_;
    std::vector<PackageUnit> &units_;
    std::string currentFile_;
    std::unique_ptr<SyntaxTree> tree_;
};

class SurveyorActionFactory : public clang::tooling::FrontendActionFactory {
public:
    SurveyorActionFactory(std::string packagePath,
                          DiagnosticCollector &collector,
                          std::vector<PackageUnit> &units);

    std::unique_ptr<clang::FrontendAction> create() override;

private:
    std::string packagePath_;
    DiagnosticCollector &collector_;
    std::vector<PackageUnit> &units_;
};

} // namespace surveyor
