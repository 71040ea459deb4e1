#include "surveyor/analysis/DiagnosticAdvisor.h"
#include "surveyor/output/OutputFormatter.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Path.h>

#include <vector>

namespace surveyor {

DiagnosticAdvisor::DiagnosticAdvisor(OutputFormatter &formatter,
                                     size_t packageCap, bool showDiagnostics)
    : formatter_(formatter), packageCap_(packageCap),
      showDiagnostics_(showDiagnostics) {}

void DiagnosticAdvisor::preAnalysis(std::string_view root, bool subDir,
                                    size_t total) {
    ++stats_.packagesSeen;

    llvm::StringRef dir(root.data(), root.size());
    if (dir.size() > 1)
        dir = dir.rtrim("/");
    std::string name = llvm::sys::path::filename(dir).str();
    if (subDir) {
        // Qualify.
        llvm::StringRef parent = llvm::sys::path::parent_path(dir);
        if (!parent.empty())
            name = llvm::sys::path::filename(parent).str() + "/" + name;
    }
    formatter_.reportProgress(name, stats_.packagesSeen, total);
}

bool DiagnosticAdvisor::showDiagnostic(const Diagnostic &d) {
    switch (d.kind) {
        case DiagnosticKind::Hint:
        case DiagnosticKind::Lint:
        case DiagnosticKind::Todo:
        case DiagnosticKind::Info:
            return false;
        case DiagnosticKind::Error:
        case DiagnosticKind::Warning:
            return true;
    }
    return false;
}

void DiagnosticAdvisor::reportUnit(const PackageUnit &unit) {
    if (unit.parsed)
        ++stats_.filesAnalyzed;
    if (!showDiagnostics_)
        return;

    std::vector<Diagnostic> shown;
    for (const auto &d : unit.diagnostics) {
        if (showDiagnostic(d))
            shown.push_back(d);
    }
    if (shown.empty())
        return;

    for (const auto &d : shown) {
        if (d.kind == DiagnosticKind::Error)
            ++stats_.errors;
        else
            ++stats_.warnings;
    }

    formatter_.reportDiagnostics(shown);
    formatter_.flush();
}

void DiagnosticAdvisor::packageSkipped(std::string_view /*root*/,
                                       std::string_view /*reason*/) {
    ++stats_.packagesSkipped;
}

bool DiagnosticAdvisor::postAnalysis() {
    return packageCap_ == 0 || stats_.packagesSeen < packageCap_;
}

void DiagnosticAdvisor::onRunFinished() {
    formatter_.reportStats(stats_);
    formatter_.flush();
}

} // namespace surveyor
