#pragma once

#include "surveyor/ast/PackageUnit.h"

#include <cstddef>
#include <string_view>

namespace surveyor {

// Package-level callbacks, always invoked on the driver's control thread.
class AnalysisObserver {
public:
    virtual ~AnalysisObserver() = default;

    // Before a package is analyzed. `subDir` is set when the package came
    // from expanding a non-package root into its subdirectories.
    virtual void preAnalysis(std::string_view /*root*/, bool /*subDir*/,
                             size_t /*total*/) {}

    // Once per compilation unit, after its diagnostics are final.
    virtual void reportUnit(const PackageUnit & /*unit*/) {}

    virtual void packageSkipped(std::string_view /*root*/,
                                std::string_view /*reason*/) {}

    // After a package completes. Returning false asks the driver to stop
    // scheduling further packages.
    virtual bool postAnalysis() { return true; }

    virtual void onRunFinished() {}
};

} // namespace surveyor
