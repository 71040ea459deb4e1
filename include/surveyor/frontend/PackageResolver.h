#pragma once

#include "surveyor/ast/PackageUnit.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace surveyor {

struct ResolvedPackage {
    std::vector<PackageUnit> units;
    // Progress lines for --verbose, printed by the caller.
    std::vector<std::string> log;
};

// Parses and resolves every compilation unit of one package. Failures are
// reported as ConfigError or ResolveError. Implementations must tolerate
// concurrent calls for different packages.
class PackageResolver {
public:
    virtual ~PackageResolver() = default;

    virtual llvm::Expected<ResolvedPackage>
    resolvePackage(llvm::StringRef root) = 0;
};

} // namespace surveyor
