#include "models/Diagnostic.hpp"
#include <sstream>

namespace Songbook {

std::string severityToString(Severity severity) {
    return severity == Severity::Error ? "error" : "warning";
}

std::string categoryToString(DiagnosticCategory category) {
    switch (category) {
        case DiagnosticCategory::TokenizeAnomaly: return "TokenizeAnomaly";
        case DiagnosticCategory::StructuralWarning: return "StructuralWarning";
        case DiagnosticCategory::StructuralError: return "StructuralError";
        default: return "Unknown";
    }
}

ParseDiagnostic ParseDiagnostic::anomaly(const std::string& message, int line) {
    return ParseDiagnostic{Severity::Warning, DiagnosticCategory::TokenizeAnomaly, message, line};
}

ParseDiagnostic ParseDiagnostic::warning(const std::string& message, int line) {
    return ParseDiagnostic{Severity::Warning, DiagnosticCategory::StructuralWarning, message, line};
}

ParseDiagnostic ParseDiagnostic::error(const std::string& message, int line) {
    return ParseDiagnostic{Severity::Error, DiagnosticCategory::StructuralError, message, line};
}

std::string ParseDiagnostic::toString() const {
    std::stringstream ss;
    if (line > 0) {
        ss << "line " << line << ": ";
    }
    ss << severityToString(severity) << ": " << message;
    return ss.str();
}

json ParseDiagnostic::toJson() const {
    json j;
    j["severity"] = severityToString(severity);
    j["category"] = categoryToString(category);
    j["message"] = message;
    j["line"] = line;
    return j;
}

} // namespace Songbook
