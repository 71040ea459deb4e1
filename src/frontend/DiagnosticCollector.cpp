#include "surveyor/frontend/DiagnosticCollector.h"

#include <clang/Basic/DiagnosticIDs.h>
#include <clang/Basic/DiagnosticLex.h>
#include <clang/Basic/SourceManager.h>
#include <llvm/ADT/SmallString.h>

namespace surveyor {

namespace {

DiagnosticKind classify(clang::DiagnosticsEngine::Level level,
                        llvm::StringRef group, llvm::StringRef message) {
    switch (level) {
        case clang::DiagnosticsEngine::Fatal:
        case clang::DiagnosticsEngine::Error:
            return DiagnosticKind::Error;
        case clang::DiagnosticsEngine::Warning:
            if (group.startswith("documentation"))
                return DiagnosticKind::Lint;
            if (group == "#warnings" &&
                (message.startswith("TODO") || message.startswith("FIXME")))
                return DiagnosticKind::Todo;
            return DiagnosticKind::Warning;
        case clang::DiagnosticsEngine::Remark:
            return DiagnosticKind::Hint;
        case clang::DiagnosticsEngine::Note:
        case clang::DiagnosticsEngine::Ignored:
            return DiagnosticKind::Info;
    }
    return DiagnosticKind::Info;
}

} // anonymous namespace

void DiagnosticCollector::HandleDiagnostic(
    clang::DiagnosticsEngine::Level level, const clang::Diagnostic &info) {
    clang::DiagnosticConsumer::HandleDiagnostic(level, info);

    llvm::SmallString<256> text;
    info.FormatDiagnostic(text);

    llvm::StringRef group =
        clang::DiagnosticIDs::getWarningOptionForDiag(info.getID());

    Diagnostic d;
    d.kind = classify(level, group, text);
    d.message = text.str().str();
    if (!group.empty())
        d.code = ("-W" + group).str();

    if (info.hasSourceManager() && info.getLocation().isValid()) {
        const clang::SourceManager &SM = info.getSourceManager();
        clang::PresumedLoc PLoc = SM.getPresumedLoc(info.getLocation());
        if (PLoc.isValid()) {
            d.location.file = PLoc.getFilename();
            d.location.line = PLoc.getLine();
            d.location.column = PLoc.getColumn();
        }
        d.location.offset =
            SM.getFileOffset(SM.getExpansionLoc(info.getLocation()));
    }

    if (info.getID() == clang::diag::err_pp_file_not_found &&
        missingDependency_.empty()) {
        missingDependency_ = info.getNumArgs() > 0 &&
                                     info.getArgKind(0) ==
                                         clang::DiagnosticsEngine::ak_std_string
                                 ? info.getArgStdStr(0)
                                 : d.message;
    }

    pending_.push_back(std::move(d));
}

std::vector<Diagnostic> DiagnosticCollector::take() {
    std::vector<Diagnostic> out;
    out.swap(pending_);
    return out;
}

} // namespace surveyor
