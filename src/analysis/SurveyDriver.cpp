#include "surveyor/analysis/SurveyDriver.h"
#include "surveyor/ast/CompositeVisitor.h"
#include "surveyor/ast/TreeWalker.h"
#include "surveyor/core/Config.h"
#include "surveyor/core/DetectorRegistry.h"
#include "surveyor/core/Errors.h"
#include "surveyor/core/PatternDetector.h"
#include "surveyor/frontend/PackageResolver.h"
#include "surveyor/output/OutputFormatter.h"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <deque>
#include <future>

namespace surveyor {

std::string_view runStateName(RunState state) {
    switch (state) {
        case RunState::Idle:             return "idle";
        case RunState::Discovering:      return "discovering";
        case RunState::AnalyzingPackage: return "analyzing";
        case RunState::Reducing:         return "reducing";
        case RunState::Reporting:        return "reporting";
        case RunState::Done:             return "done";
    }
    return "idle";
}

SurveyDriver::SurveyDriver(const Config &cfg, PackageResolver &resolver,
                           OutputFormatter &formatter)
    : config_(cfg), resolver_(resolver), formatter_(formatter),
      evidence_(cfg.maxExamples) {
    // "errors" is served by the DiagnosticAdvisor, not by a tree detector.
    const auto &registry = DetectorRegistry::instance();
    for (const auto &id : cfg.detectors) {
        if (id == "errors")
            continue;
        if (!registry.contains(id)) {
            std::string known;
            for (const auto &k : registry.ids())
                known += (known.empty() ? "" : ", ") + k;
            formatter_.reportWarning("unknown detector '" + id +
                                     "' (known: " + known + "), ignoring");
            continue;
        }
        auto prototype = registry.create(id, cfg);
        if (cfg.verbose)
            llvm::errs() << "surveyor: detector '" << id << "': "
                         << prototype->getTitle() << "\n";
        detectorIds_.push_back(id);
        for (Category c : prototype->categories()) {
            if (std::find(categories_.begin(), categories_.end(), c) ==
                categories_.end())
                categories_.push_back(c);
        }
    }
}

SurveyDriver::~SurveyDriver() = default;

void SurveyDriver::addObserver(AnalysisObserver &observer) {
    observers_.push_back(&observer);
}

std::vector<std::unique_ptr<PatternDetector>>
SurveyDriver::makeDetectors() const {
    std::vector<std::unique_ptr<PatternDetector>> out;
    const auto &registry = DetectorRegistry::instance();
    for (const auto &id : detectorIds_) {
        if (auto d = registry.create(id, config_))
            out.push_back(std::move(d));
    }
    return out;
}

void SurveyDriver::classifyFailure(llvm::Error err,
                                   PackageOutcome &out) const {
    llvm::handleAllErrors(
        std::move(err),
        [&](const ResolveError &e) {
            out.skipReason = e.reason();
            out.fatal = e.kind() == ResolveError::Kind::MissingDependency &&
                        config_.requireDependencies;
        },
        [&](const llvm::ErrorInfoBase &e) { out.skipReason = e.message(); });
}

llvm::Error SurveyDriver::walkUnit(const PackageUnit &unit,
                                   CompositeVisitor &visitor) const {
    if (auto err = TreeWalker::walk(*unit.tree, visitor))
        return llvm::make_error<TraversalError>(unit.path,
                                                toString(std::move(err)));
    return llvm::Error::success();
}

// Safe to run off the control thread: touches only the resolver and state
// local to this package.
SurveyDriver::PackageOutcome
SurveyDriver::analyzePackage(const PackageTarget &target) const {
    PackageOutcome out{target, Aggregator(config_.maxExamples), {}, {}, {},
                       std::nullopt, false};

    auto resolved = resolver_.resolvePackage(target.path);
    if (!resolved) {
        classifyFailure(resolved.takeError(), out);
        return out;
    }

    out.log = std::move(resolved->log);

    auto detectors = makeDetectors();
    CompositeVisitor visitor;
    for (auto &d : detectors) {
        d->attach(out.evidence, &out.log);
        visitor.add(*d);
    }

    out.units.reserve(resolved->units.size());
    for (auto &unit : resolved->units) {
        if (unit.tree && !visitor.empty()) {
            if (auto err = walkUnit(unit, visitor))
                out.fileWarnings.push_back(toString(std::move(err)));
        }
        // Only one package's trees are ever alive.
        unit.tree.reset();
        out.units.push_back(std::move(unit));
    }
    return out;
}

llvm::Error SurveyDriver::consume(PackageOutcome &outcome) {
    ++packagesAnalyzed_;

    if (outcome.skipReason) {
        formatter_.reportWarning("skipping '" + outcome.target.path +
                                 "': " + *outcome.skipReason);
        for (auto *o : observers_)
            o->packageSkipped(outcome.target.path, *outcome.skipReason);
        if (outcome.fatal)
            return llvm::make_error<ResolveError>(
                ResolveError::Kind::MissingDependency, outcome.target.path,
                *outcome.skipReason);
        return llvm::Error::success();
    }

    if (config_.verbose) {
        for (const auto &line : outcome.log)
            llvm::errs() << "surveyor: " << line << "\n";
    }

    for (const auto &w : outcome.fileWarnings)
        formatter_.reportWarning(w);

    for (const auto &unit : outcome.units) {
        if (config_.verbose)
            llvm::errs() << "surveyor: analyzed " << unit.path << "\n";
        for (auto *o : observers_)
            o->reportUnit(unit);
    }

    evidence_.merge(std::move(outcome.evidence));
    return llvm::Error::success();
}

llvm::Error
SurveyDriver::analyzeAll(const std::vector<PackageTarget> &packages) {
    // jobs == 1 runs every package lazily on this thread, one at a time.
    const unsigned jobs = std::max(1u, config_.jobs);
    const auto policy = jobs > 1 ? std::launch::async : std::launch::deferred;

    std::deque<std::future<PackageOutcome>> inflight;
    size_t next = 0;
    size_t started = 0;
    bool keepGoing = true;

    while (true) {
        while (keepGoing && next < packages.size() && inflight.size() < jobs) {
            const PackageTarget target = packages[next++];
            inflight.push_back(std::async(
                policy, [this, target] { return analyzePackage(target); }));
        }
        if (inflight.empty())
            break;

        const PackageTarget &target = packages[started++];
        for (auto *o : observers_)
            o->preAnalysis(target.path, target.subDir, packages.size());

        PackageOutcome outcome = inflight.front().get();
        inflight.pop_front();

        if (auto err = consume(outcome)) {
            // In-flight packages finish before the futures are destroyed.
            inflight.clear();
            return err;
        }

        for (auto *o : observers_) {
            if (!o->postAnalysis())
                keepGoing = false;
        }
        if (config_.packageLimit != 0 &&
            packagesAnalyzed_ >= config_.packageLimit)
            keepGoing = false;
    }
    return llvm::Error::success();
}

void SurveyDriver::report(std::chrono::milliseconds elapsed) {
    state_ = RunState::Reducing;
    auto results = evidence_.reduce(categories_);

    state_ = RunState::Reporting;
    for (const auto &r : results)
        formatter_.reportCategory(r.label, r.count, r.examples);
    for (auto *o : observers_)
        o->onRunFinished();
    formatter_.reportElapsed(elapsed);
    formatter_.flush();
}

int SurveyDriver::run(const std::vector<std::string> &paths) {
    const auto start = std::chrono::steady_clock::now();

    state_ = RunState::Discovering;
    PackageDiscovery discovery(config_.manifestName);
    auto found = discovery.discover(paths);
    if (!found) {
        llvm::errs() << "surveyor: error: " << toString(found.takeError())
                     << "\n";
        state_ = RunState::Done;
        return 1;
    }

    if (found->expandedRoot) {
        formatter_.reportNotice("Recursing into '" + *found->expandedRoot +
                                "'...");
        formatter_.reportNotice("(Found " +
                                std::to_string(found->packages.size()) +
                                " subdirectories.)");
    }

    std::vector<PackageTarget> packages = std::move(found->packages);
    if (config_.packageLimit != 0) {
        formatter_.reportNotice("Limiting analysis to " +
                                std::to_string(config_.packageLimit) +
                                " packages.");
        if (packages.size() > config_.packageLimit)
            packages.resize(config_.packageLimit);
    }

    if (packages.empty()) {
        llvm::errs() << "surveyor: error: no packages found\n";
        state_ = RunState::Done;
        return 1;
    }

    state_ = RunState::AnalyzingPackage;
    if (auto err = analyzeAll(packages)) {
        llvm::errs() << "surveyor: error: " << toString(std::move(err))
                     << "\n";
        formatter_.flush();
        state_ = RunState::Done;
        return 1;
    }

    report(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start));
    state_ = RunState::Done;
    return 0;
}

} // namespace surveyor
