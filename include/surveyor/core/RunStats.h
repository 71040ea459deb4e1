#pragma once

#include <cstddef>

namespace surveyor {

// Run-wide counters. Only the DiagnosticAdvisor mutates these; the driver
// reads them once for the summary line.
struct RunStats {
    size_t filesAnalyzed   = 0;
    size_t errors          = 0;
    size_t warnings        = 0;
    size_t packagesSeen    = 0;
    size_t packagesSkipped = 0;
};

} // namespace surveyor
