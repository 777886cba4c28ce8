// SPDX-License-Identifier: GPL-2.0-or-later
#include "diagnostics.h"

#include <algorithm>
#include <glib.h>
#include <glibmm/ustring.h>

namespace Svgfx {
namespace Debug {

char const *severity_name(Severity severity)
{
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

char const *code_name(DiagnosticCode code)
{
    switch (code) {
        case DiagnosticCode::PrimitiveFailed:      return "primitive-failed";
        case DiagnosticCode::PrimitiveTimeout:     return "primitive-timeout";
        case DiagnosticCode::FilterNotFound:       return "filter-not-found";
        case DiagnosticCode::EmfSizeExceeded:      return "emf-size-exceeded";
        case DiagnosticCode::EmfUnsupportedRecord: return "emf-unsupported-record";
        case DiagnosticCode::CacheCorruption:      return "cache-corruption";
        case DiagnosticCode::EmptyGraph:           return "empty-graph";
    }
    return "unknown";
}

std::string Diagnostic::to_string() const
{
    if (node_id.empty()) {
        return Glib::ustring::compose("%1 [%2] %3", severity_name(severity), code_name(code), message).raw();
    }
    return Glib::ustring::compose("%1 [%2] %3: %4", severity_name(severity), code_name(code), node_id, message).raw();
}

void LogDiagnosticsSink::report(Diagnostic const &diagnostic)
{
    auto const line = diagnostic.to_string();
    switch (diagnostic.severity) {
        case Severity::Info:
            g_message("%s", line.c_str());
            break;
        case Severity::Warning:
            g_warning("%s", line.c_str());
            break;
        case Severity::Error:
            g_critical("%s", line.c_str());
            break;
    }
}

void CollectingDiagnosticsSink::report(Diagnostic const &diagnostic)
{
    auto g = std::lock_guard(_mutex);
    _diagnostics.push_back(diagnostic);
}

std::vector<Diagnostic> CollectingDiagnosticsSink::diagnostics() const
{
    auto g = std::lock_guard(_mutex);
    return _diagnostics;
}

std::vector<Diagnostic> CollectingDiagnosticsSink::take()
{
    std::vector<Diagnostic> taken;
    auto g = std::lock_guard(_mutex);
    taken.swap(_diagnostics);
    return taken;
}

std::size_t CollectingDiagnosticsSink::count(DiagnosticCode code) const
{
    auto g = std::lock_guard(_mutex);
    return std::count_if(_diagnostics.begin(), _diagnostics.end(),
                         [code] (Diagnostic const &d) { return d.code == code; });
}

} // namespace Debug
} // namespace Svgfx
