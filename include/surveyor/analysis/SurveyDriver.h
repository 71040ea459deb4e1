#pragma once

#include "surveyor/analysis/AnalysisObserver.h"
#include "surveyor/analysis/PackageDiscovery.h"
#include "surveyor/ast/PackageUnit.h"
#include "surveyor/core/Aggregator.h"
#include "surveyor/core/Category.h"

#include <llvm/Support/Error.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace surveyor {

struct Config;
class CompositeVisitor;
class OutputFormatter;
class PackageResolver;
class PatternDetector;

enum class RunState : uint8_t {
    Idle,
    Discovering,
    AnalyzingPackage,
    Reducing,
    Reporting,
    Done,
};

std::string_view runStateName(RunState state);

// Orchestrates one survey: discover packages, resolve and walk them one at
// a time (or through a bounded pool when `jobs > 1`), then reduce and report.
// Aggregation, observers and output only ever run on the calling thread.
class SurveyDriver {
public:
    SurveyDriver(const Config &cfg, PackageResolver &resolver,
                 OutputFormatter &formatter);
    ~SurveyDriver();

    void addObserver(AnalysisObserver &observer);

    // Returns the process exit status.
    int run(const std::vector<std::string> &paths);

    RunState state() const { return state_; }
    const Aggregator &evidence() const { return evidence_; }
    size_t packagesAnalyzed() const { return packagesAnalyzed_; }
    const std::vector<Category> &reportedCategories() const {
        return categories_;
    }

private:
    struct PackageOutcome {
        PackageTarget            target;
        Aggregator               evidence;
        std::vector<PackageUnit> units; // trees already released
        std::vector<std::string> fileWarnings;
        std::vector<std::string> log; // printed under --verbose
        std::optional<std::string> skipReason;
        bool                     fatal = false;
    };

    std::vector<std::unique_ptr<PatternDetector>> makeDetectors() const;
    PackageOutcome analyzePackage(const PackageTarget &target) const;
    void classifyFailure(llvm::Error err, PackageOutcome &out) const;
    llvm::Error walkUnit(const PackageUnit &unit,
                         CompositeVisitor &visitor) const;
    llvm::Error consume(PackageOutcome &outcome);
    llvm::Error analyzeAll(const std::vector<PackageTarget> &packages);
    void report(std::chrono::milliseconds elapsed);

    const Config &config_;
    PackageResolver &resolver_;
    OutputFormatter &formatter_;
    std::vector<AnalysisObserver *> observers_;
    std::vector<std::string> detectorIds_;
    std::vector<Category> categories_;
    Aggregator evidence_;
    RunState state_ = RunState::Idle;
    size_t packagesAnalyzed_ = 0;
};

} // namespace surveyor
