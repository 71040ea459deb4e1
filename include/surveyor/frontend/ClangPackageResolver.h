#pragma once

#include "surveyor/frontend/PackageResolver.h"

#include <llvm/ADT/StringRef.h>

namespace surveyor {

struct Config;

// Resolves a package through clang LibTooling. The package manifest is its
// compilation database; every listed source that is not excluded becomes
// one PackageUnit. A fresh ClangTool is built per source file, so concurrent
// calls for different packages share no state.
class ClangPackageResolver : public PackageResolver {
public:
    explicit ClangPackageResolver(const Config &cfg);

    llvm::Expected<ResolvedPackage>
    resolvePackage(llvm::StringRef root) override;

private:
    bool isExcluded(llvm::StringRef file) const;

    const Config &config_;
};

} // namespace surveyor
