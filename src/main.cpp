#include "surveyor/analysis/DiagnosticAdvisor.h"
#include "surveyor/analysis/SurveyDriver.h"
#include "surveyor/core/Config.h"
#include "surveyor/core/Version.h"
#include "surveyor/frontend/ClangPackageResolver.h"
#include "surveyor/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory SurveyorCat("surveyor options");

static llvm::cl::list<std::string> Paths(
    llvm::cl::Positional,
    llvm::cl::desc("<path>..."),
    llvm::cl::OneOrMore,
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to surveyor.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<unsigned> Limit(
    "limit",
    llvm::cl::desc("Analyze at most n packages (0 = unlimited)"),
    llvm::cl::value_desc("n"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::list<std::string> Detectors(
    "detectors",
    llvm::cl::desc("Detectors to run (tearoffs,type-literals,errors)"),
    llvm::cl::CommaSeparated,
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json)"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<unsigned> MaxExamples(
    "max-examples",
    llvm::cl::desc("Cap example lines per category (0 = unlimited)"),
    llvm::cl::value_desc("n"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Packages analyzed in parallel"),
    llvm::cl::value_desc("n"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<bool> RequireDeps(
    "require-deps",
    llvm::cl::desc("Abort the run when a package dependency is missing"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<bool> StrictCoverage(
    "strict-coverage",
    llvm::cl::desc("Abort the current file on a detector coverage gap"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::list<std::string> Exclude(
    "exclude",
    llvm::cl::desc("Skip source files matching glob (repeatable)"),
    llvm::cl::value_desc("glob"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::list<std::string> ExtraArgs(
    "extra-arg",
    llvm::cl::desc("Extra compiler argument (repeatable)"),
    llvm::cl::value_desc("arg"),
    llvm::cl::cat(SurveyorCat));

static llvm::cl::opt<bool> Verbose(
    "verbose",
    llvm::cl::desc("Log resolver progress per file"),
    llvm::cl::cat(SurveyorCat));

static void printVersion(llvm::raw_ostream &os) {
    os << "surveyor " << surveyor::kToolVersion << "\n";
}

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(SurveyorCat);
    llvm::cl::SetVersionPrinter(printVersion);
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "surveyor: survey source trees for code patterns\n");

    // Load config.
    surveyor::Config cfg = ConfigPath.empty()
        ? surveyor::Config::defaults()
        : surveyor::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (Limit.getNumOccurrences())
        cfg.packageLimit = Limit;
    if (!Detectors.empty())
        cfg.detectors.assign(Detectors.begin(), Detectors.end());
    if (!OutputFormat.empty())
        cfg.format = OutputFormat;
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (MaxExamples.getNumOccurrences())
        cfg.maxExamples = MaxExamples;
    if (Jobs.getNumOccurrences())
        cfg.jobs = Jobs;
    if (RequireDeps)
        cfg.requireDependencies = true;
    if (StrictCoverage)
        cfg.strictCoverage = true;
    if (Verbose)
        cfg.verbose = true;
    cfg.excludePatterns.insert(cfg.excludePatterns.end(), Exclude.begin(),
                               Exclude.end());
    cfg.extraArgs.insert(cfg.extraArgs.end(), ExtraArgs.begin(),
                         ExtraArgs.end());

    if (cfg.format != "cli" && cfg.format != "json") {
        llvm::errs() << "surveyor: error: unknown format '" << cfg.format
                     << "' (expected cli or json)\n";
        return 1;
    }
    if (cfg.jobs == 0) {
        llvm::errs() << "surveyor: error: --jobs must be at least 1\n";
        return 1;
    }

    std::unique_ptr<llvm::raw_fd_ostream> file;
    if (!cfg.outputFile.empty()) {
        std::error_code EC;
        file = std::make_unique<llvm::raw_fd_ostream>(cfg.outputFile, EC,
                                                      llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "surveyor: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 1;
        }
    }
    llvm::raw_ostream &os = file ? *file : llvm::outs();

    auto formatter = surveyor::makeOutputFormatter(cfg.format, os);
    surveyor::ClangPackageResolver resolver(cfg);
    surveyor::DiagnosticAdvisor advisor(*formatter, cfg.packageLimit,
                                        cfg.detectorEnabled("errors"));

    surveyor::SurveyDriver driver(cfg, resolver, *formatter);
    driver.addObserver(advisor);

    std::vector<std::string> paths(Paths.begin(), Paths.end());
    return driver.run(paths);
}
