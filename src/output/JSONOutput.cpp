#include "surveyor/output/OutputFormatter.h"

#include <llvm/Support/raw_ostream.h>

#include <cstdio>

namespace surveyor {

namespace {

std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // anonymous namespace

void JSONOutputFormatter::reportProgress(std::string_view package,
                                         size_t index, size_t total) {
    os_ << "{\"event\": \"progress\", \"package\": \"" << escape(package)
        << "\", \"index\": " << index << ", \"total\": " << total << "}\n";
}

void JSONOutputFormatter::reportNotice(std::string_view message) {
    os_ << "{\"event\": \"notice\", \"message\": \"" << escape(message)
        << "\"}\n";
}

void JSONOutputFormatter::reportWarning(std::string_view message) {
    os_ << "{\"event\": \"warning\", \"message\": \"" << escape(message)
        << "\"}\n";
}

void JSONOutputFormatter::reportDiagnostics(
    const std::vector<Diagnostic> &diagnostics) {
    for (const auto &d : diagnostics) {
        os_ << "{\"event\": \"diagnostic\", \"kind\": \""
            << diagnosticKindName(d.kind) << "\", \"code\": \""
            << escape(d.code) << "\", \"message\": \"" << escape(d.message)
            << "\", \"location\": {\"file\": \"" << escape(d.location.file)
            << "\", \"offset\": " << d.location.offset
            << ", \"line\": " << d.location.line
            << ", \"column\": " << d.location.column << "}}\n";
    }
}

void JSONOutputFormatter::reportCategory(
    std::string_view label, size_t count,
    const std::vector<std::string> &examples) {
    os_ << "{\"event\": \"category\", \"label\": \"" << escape(label)
        << "\", \"count\": " << count << ", \"examples\": [";
    for (size_t i = 0; i < examples.size(); ++i) {
        os_ << "\"" << escape(examples[i]) << "\"";
        if (i + 1 < examples.size())
            os_ << ", ";
    }
    os_ << "]}\n";
}

void JSONOutputFormatter::reportStats(const RunStats &stats) {
    os_ << "{\"event\": \"stats\", \"filesAnalyzed\": " << stats.filesAnalyzed
        << ", \"errors\": " << stats.errors
        << ", \"warnings\": " << stats.warnings
        << ", \"packagesSeen\": " << stats.packagesSeen
        << ", \"packagesSkipped\": " << stats.packagesSkipped << "}\n";
}

void JSONOutputFormatter::reportElapsed(std::chrono::milliseconds elapsed) {
    os_ << "{\"event\": \"elapsed\", \"milliseconds\": "
        << static_cast<long long>(elapsed.count()) << ", \"text\": \""
        << formatElapsed(elapsed) << "\"}\n";
}

void JSONOutputFormatter::flush() {
    os_.flush();
}

} // namespace surveyor
