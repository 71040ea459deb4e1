#pragma once

#include "surveyor/analysis/AnalysisObserver.h"
#include "surveyor/core/Diagnostic.h"
#include "surveyor/core/RunStats.h"

namespace surveyor {

class OutputFormatter;

// Streams the diagnostics worth a human's attention (errors and warnings)
// as each unit completes, prints per-package progress, and keeps RunStats.
class DiagnosticAdvisor : public AnalysisObserver {
public:
    // `packageCap` of 0 means no cap. With `showDiagnostics` off only
    // progress and counters are maintained.
    DiagnosticAdvisor(OutputFormatter &formatter, size_t packageCap,
                      bool showDiagnostics);

    void preAnalysis(std::string_view root, bool subDir,
                     size_t total) override;
    void reportUnit(const PackageUnit &unit) override;
    void packageSkipped(std::string_view root,
                        std::string_view reason) override;
    bool postAnalysis() override;
    void onRunFinished() override;

    static bool showDiagnostic(const Diagnostic &d);

    const RunStats &stats() const { return stats_; }

private:
    OutputFormatter &formatter_;
    size_t packageCap_;
    bool showDiagnostics_;
    RunStats stats_;
};

} // namespace surveyor
