#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <optional>
#include <string>
#include <vector>

namespace surveyor {

struct PackageTarget {
    std::string path;
    bool subDir = false; // found by expanding a non-package root
};

struct DiscoveryResult {
    std::vector<PackageTarget> packages;
    std::optional<std::string> expandedRoot;
};

// Recognizes package roots by their manifest file. A single non-package
// directory is expanded one level into its visible subdirectories.
class PackageDiscovery {
public:
    explicit PackageDiscovery(std::string manifestName)
        : manifestName_(std::move(manifestName)) {}

    bool isPackageRoot(llvm::StringRef dir) const;

    llvm::Expected<DiscoveryResult>
    discover(const std::vector<std::string> &paths) const;

private:
    std::string manifestName_;
};

} // namespace surveyor
