#include "surveyor/output/OutputFormatter.h"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

namespace surveyor {

std::string formatElapsed(std::chrono::milliseconds elapsed) {
    auto ms = elapsed.count();
    if (ms < 0)
        ms = 0;
    const long long hours = ms / 3'600'000;
    const long long minutes = (ms / 60'000) % 60;
    const long long seconds = (ms / 1000) % 60;
    const long long millis = ms % 1000;

    std::string out;
    llvm::raw_string_ostream os(out);
    os << hours << ":" << llvm::format("%02lld:%02lld.%03lld", minutes, seconds,
                                       millis);
    return os.str();
}

void CLIOutputFormatter::reportProgress(std::string_view package,
                                        size_t index, size_t total) {
    os_ << "Analyzing '" << package << "' • [" << index << "/" << total
        << "]...\n";
}

void CLIOutputFormatter::reportNotice(std::string_view message) {
    os_ << message << "\n";
}

void CLIOutputFormatter::reportWarning(std::string_view message) {
    llvm::errs() << "surveyor: warning: " << message << "\n";
}

void CLIOutputFormatter::reportDiagnostics(
    const std::vector<Diagnostic> &diagnostics) {
    for (const auto &d : diagnostics) {
        os_ << d.location.file << ":" << d.location.line << ":"
            << d.location.column << ": " << diagnosticKindName(d.kind) << ": "
            << d.message;
        if (!d.code.empty())
            os_ << " [" << d.code << "]";
        os_ << "\n";
    }
}

void CLIOutputFormatter::reportCategory(
    std::string_view label, size_t count,
    const std::vector<std::string> &examples) {
    os_ << "***** Found " << count << " " << label << (count == 1 ? "" : "s")
        << "\n";
    for (const auto &e : examples)
        os_ << "  " << e << "\n";
    if (examples.size() < count)
        os_ << "  (" << (count - examples.size()) << " more not shown)\n";
}

void CLIOutputFormatter::reportStats(const RunStats &stats) {
    os_ << stats.errors << " error" << (stats.errors == 1 ? "" : "s") << ", "
        << stats.warnings << " warning" << (stats.warnings == 1 ? "" : "s")
        << " in " << stats.filesAnalyzed << " file"
        << (stats.filesAnalyzed == 1 ? "" : "s") << " across "
        << stats.packagesSeen << " package"
        << (stats.packagesSeen == 1 ? "" : "s") << " ("
        << stats.packagesSkipped << " skipped)\n";
}

void CLIOutputFormatter::reportElapsed(std::chrono::milliseconds elapsed) {
    os_ << "(Elapsed time: " << formatElapsed(elapsed) << ")\n";
}

void CLIOutputFormatter::flush() {
    os_.flush();
}

std::unique_ptr<OutputFormatter> makeOutputFormatter(std::string_view format,
                                                     llvm::raw_ostream &os) {
    if (format == "json")
        return std::make_unique<JSONOutputFormatter>(os);
    return std::make_unique<CLIOutputFormatter>(os);
}

} // namespace surveyor
