#pragma once

#include "surveyor/core/Diagnostic.h"
#include "surveyor/core/RunStats.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace surveyor {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;

    virtual void reportProgress(std::string_view package, size_t index,
                                size_t total) = 0;
    virtual void reportNotice(std::string_view message) = 0;
    virtual void reportWarning(std::string_view message) = 0;
    virtual void reportDiagnostics(const std::vector<Diagnostic> &diagnostics) = 0;
    virtual void reportCategory(std::string_view label, size_t count,
                                const std::vector<std::string> &examples) = 0;
    virtual void reportStats(const RunStats &stats) = 0;
    virtual void reportElapsed(std::chrono::milliseconds elapsed) = 0;
    virtual void flush() = 0;
};

// Human-readable text, one block per event. Warnings go to stderr.
class CLIOutputFormatter : public OutputFormatter {
public:
    explicit CLIOutputFormatter(llvm::raw_ostream &os) : os_(os) {}

    void reportProgress(std::string_view package, size_t index,
                        size_t total) override;
    void reportNotice(std::string_view message) override;
    void reportWarning(std::string_view message) override;
    void reportDiagnostics(const std::vector<Diagnostic> &diagnostics) override;
    void reportCategory(std::string_view label, size_t count,
                        const std::vector<std::string> &examples) override;
    void reportStats(const RunStats &stats) override;
    void reportElapsed(std::chrono::milliseconds elapsed) override;
    void flush() override;

private:
    llvm::raw_ostream &os_;
};

// One JSON object per line, so events can be consumed as they stream.
class JSONOutputFormatter : public OutputFormatter {
public:
    explicit JSONOutputFormatter(llvm::raw_ostream &os) : os_(os) {}

    void reportProgress(std::string_view package, size_t index,
                        size_t total) override;
    void reportNotice(std::string_view message) override;
    void reportWarning(std::string_view message) override;
    void reportDiagnostics(const std::vector<Diagnostic> &diagnostics) override;
    void reportCategory(std::string_view label, size_t count,
                        const std::vector<std::string> &examples) override;
    void reportStats(const RunStats &stats) override;
    void reportElapsed(std::chrono::milliseconds elapsed) override;
    void flush() override;

private:
    llvm::raw_ostream &os_;
};

std::unique_ptr<OutputFormatter> makeOutputFormatter(std::string_view format,
                                                     llvm::raw_ostream &os);

// `H:MM:SS.mmm`
std::string formatElapsed(std::chrono::milliseconds elapsed);

} // namespace surveyor
