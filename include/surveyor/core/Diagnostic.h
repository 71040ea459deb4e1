#pragma once

#include "surveyor/core/Evidence.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace surveyor {

enum class DiagnosticKind : uint8_t {
    Error,
    Warning,
    Hint,
    Lint,
    Todo,
    Info,
};

constexpr std::string_view diagnosticKindName(DiagnosticKind k) {
    switch (k) {
        case DiagnosticKind::Error:   return "error";
        case DiagnosticKind::Warning: return "warning";
        case DiagnosticKind::Hint:    return "hint";
        case DiagnosticKind::Lint:    return "lint";
        case DiagnosticKind::Todo:    return "todo";
        case DiagnosticKind::Info:    return "info";
    }
    return "info";
}

// Diagnostics produced by the resolver for one compilation unit.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Info;
    std::string    code;     // e.g. "-Wunused-variable"; empty for hard errors
    std::string    message;
    SourceLocation location;
};

} // namespace surveyor
