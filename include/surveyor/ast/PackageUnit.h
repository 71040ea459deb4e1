#pragma once

#include "surveyor/ast/SyntaxTree.h"
#include "surveyor/core/Diagnostic.h"

#include <memory>
#include <string>
#include <vector>

namespace surveyor {

// One resolved compilation unit. Transient: the driver walks it and then
// drops the tree; only the diagnostics outlive the walk.
struct PackageUnit {
    std::string                 packagePath;
    std::string                 path;
    std::unique_ptr<SyntaxTree> tree;
    std::vector<Diagnostic>     diagnostics;
    // False when the frontend gave up before parsing (bad command line,
    // missing input). Such units carry diagnostics but no tree.
    bool                        parsed = true;
};

} // namespace surveyor
