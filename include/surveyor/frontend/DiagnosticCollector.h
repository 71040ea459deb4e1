#pragma once

#include "surveyor/core/Diagnostic.h"

#include <clang/Basic/Diagnostic.h>

#include <string>
#include <vector>

namespace surveyor {

// Buffers clang diagnostics as surveyor Diagnostics until the frontend
// action for the current file takes them.
class DiagnosticCollector : public clang::DiagnosticConsumer {
public:
    void HandleDiagnostic(clang::DiagnosticsEngine::Level level,
                          const clang::Diagnostic &info) override;

    std::vector<Diagnostic> take();

    bool sawMissingDependency() const { return !missingDependency_.empty(); }
    const std::string &missingDependency() const { return missingDependency_; }

private:
    std::vector<Diagnostic> pending_;
    std::string missingDependency_;
};

} // namespace surveyor
