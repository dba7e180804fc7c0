#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace Songbook {

using json = nlohmann::json;

enum class Severity {
    Warning,
    Error
};

/**
 * Where a diagnostic comes from
 */
enum class DiagnosticCategory {
    TokenizeAnomaly,      // malformed or unrecognized source syntax, never fatal
    StructuralWarning,    // unused part, ambiguous chord alignment
    StructuralError       // unresolved reference, duplicate definition
};

std::string severityToString(Severity severity);
std::string categoryToString(DiagnosticCategory category);

/**
 * A parse observation tied to a 1-indexed source line (0 = whole song)
 */
struct ParseDiagnostic {
    Severity severity;
    DiagnosticCategory category;
    std::string message;
    int line;

    static ParseDiagnostic anomaly(const std::string& message, int line);
    static ParseDiagnostic warning(const std::string& message, int line);
    static ParseDiagnostic error(const std::string& message, int line);

    bool isError() const { return severity == Severity::Error; }

    // "line 12: error: Unresolved reference to part 'Chorus'"
    std::string toString() const;

    json toJson() const;
};

} // namespace Songbook
