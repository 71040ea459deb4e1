#include "surveyor/frontend/ClangPackageResolver.h"
#include "surveyor/core/Config.h"
#include "surveyor/core/Errors.h"
#include "surveyor/frontend/DiagnosticCollector.h"
#include "surveyor/frontend/SurveyorAction.h"

#include <clang/Tooling/ArgumentsAdjusters.h>
#include <clang/Tooling/JSONCompilationDatabase.h>
#include <clang/Tooling/Tooling.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/VirtualFileSystem.h>

#include <fnmatch.h>

#include <algorithm>

namespace surveyor {

ClangPackageResolver::ClangPackageResolver(const Config &cfg) : config_(cfg) {}

bool ClangPackageResolver::isExcluded(llvm::StringRef file) const {
    const std::string path = file.str();
    for (const auto &pattern : config_.excludePatterns) {
        if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0)
            return true;
    }
    return false;
}

llvm::Expected<ResolvedPackage>
ClangPackageResolver::resolvePackage(llvm::StringRef root) {
    llvm::SmallString<256> manifest(root);
    llvm::sys::path::append(manifest, config_.manifestName);

    if (!llvm::sys::fs::exists(manifest))
        return llvm::make_error<ConfigError>(
            root.str(), "no " + config_.manifestName + " in package");

    std::string loadError;
    auto db = clang::tooling::JSONCompilationDatabase::loadFromFile(
        manifest, loadError, clang::tooling::JSONCommandLineSyntax::AutoDetect);
    if (!db)
        return llvm::make_error<ConfigError>(
            manifest.str().str(), "malformed manifest: " + loadError);

    std::vector<std::string> files;
    for (const auto &file : db->getAllFiles()) {
        if (!isExcluded(file))
            files.push_back(file);
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    if (files.empty())
        return llvm::make_error<ResolveError>(
            ResolveError::Kind::NoSources, root.str(),
            "manifest lists no analyzable sources");

    // Per-instance working directory: the process-wide one is shared by
    // packages resolved in parallel.
    llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs(
        llvm::vfs::createPhysicalFileSystem().release());

    DiagnosticCollector collector;
    ResolvedPackage resolved;
    resolved.log.push_back("resolving " + std::to_string(files.size()) +
                           " files in '" + root.str() + "'");
    SurveyorActionFactory factory(root.str(), collector, resolved.units);
    int rc = 0;

    // One tool run per file, so diagnostics raised before a file's action
    // starts stay with that file.
    for (const auto &file : files) {
        clang::tooling::ClangTool tool(
            *db, {file}, std::make_shared<clang::PCHContainerOperations>(), fs);
        if (!config_.extraArgs.empty()) {
            tool.appendArgumentsAdjuster(
                clang::tooling::getInsertArgumentAdjuster(
                    config_.extraArgs,
                    clang::tooling::ArgumentInsertPosition::END));
        }
        tool.setDiagnosticConsumer(&collector);
        tool.setPrintErrorMessage(false);

        const size_t before = resolved.units.size();
        if (int status = tool.run(&factory))
            rc = status;

        if (collector.sawMissingDependency())
            return llvm::make_error<ResolveError>(
                ResolveError::Kind::MissingDependency, root.str(),
                "dependency not found: " + collector.missingDependency());

        std::vector<Diagnostic> leftover = collector.take();
        if (!leftover.empty()) {
            if (resolved.units.size() > before) {
                auto &diags = resolved.units.back().diagnostics;
                diags.insert(diags.end(), leftover.begin(), leftover.end());
            } else {
                PackageUnit unit;
                unit.packagePath = root.str();
                unit.path = file;
                unit.diagnostics = std::move(leftover);
                unit.parsed = false;
                resolved.units.push_back(std::move(unit));
            }
        }
    }

    if (rc != 0 && resolved.units.empty())
        return llvm::make_error<ResolveError>(
            ResolveError::Kind::ToolFailure, root.str(),
            "clang tooling failed with status " + std::to_string(rc));

    for (const auto &unit : resolved.units)
        resolved.log.push_back("resolved " + unit.path + " (" +
                               std::to_string(unit.diagnostics.size()) +
                               " diagnostics)");

    return resolved;
}

} // namespace surveyor
