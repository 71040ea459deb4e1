#include "surveyor/analysis/PackageDiscovery.h"
#include "surveyor/core/Errors.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <algorithm>

namespace surveyor {

bool PackageDiscovery::isPackageRoot(llvm::StringRef dir) const {
    llvm::SmallString<256> manifest(dir);
    llvm::sys::path::append(manifest, manifestName_);
    return llvm::sys::fs::is_regular_file(manifest);
}

llvm::Expected<DiscoveryResult>
PackageDiscovery::discover(const std::vector<std::string> &paths) const {
    DiscoveryResult result;

    if (paths.empty())
        return llvm::make_error<ConfigError>("", "no input paths given");

    // Several paths are taken as given; bad ones fail later, one at a time.
    if (paths.size() > 1) {
        for (const auto &p : paths)
            result.packages.push_back({p, false});
        return std::move(result);
    }

    const std::string &root = paths.front();
    if (!llvm::sys::fs::exists(root))
        return llvm::make_error<ConfigError>(root, "path does not exist");

    if (isPackageRoot(root)) {
        result.packages.push_back({root, false});
        return std::move(result);
    }

    if (!llvm::sys::fs::is_directory(root))
        return llvm::make_error<ConfigError>(
            root, "not a package and not a directory");

    // One level only: each visible subdirectory is a candidate package.
    std::error_code ec;
    for (llvm::sys::fs::directory_iterator it(root, ec), end;
         it != end && !ec; it.increment(ec)) {
        llvm::StringRef name = llvm::sys::path::filename(it->path());
        if (name.startswith("."))
            continue;
        if (!llvm::sys::fs::is_directory(it->path()))
            continue;
        result.packages.push_back({it->path(), true});
    }
    if (ec)
        return llvm::make_error<ConfigError>(root, ec.message());

    std::sort(result.packages.begin(), result.packages.end(),
              [](const PackageTarget &a, const PackageTarget &b) {
                  return a.path < b.path;
              });
    result.expandedRoot = root;
    return std::move(result);
}

} // namespace surveyor
