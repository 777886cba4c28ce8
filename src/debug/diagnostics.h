// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Structured diagnostics emitted while converting filter graphs.
 */
#ifndef SVGFX_DEBUG_DIAGNOSTICS_H
#define SVGFX_DEBUG_DIAGNOSTICS_H

#include <mutex>
#include <string>
#include <vector>

namespace Svgfx {
namespace Debug {

enum class Severity
{
    Info,
    Warning,
    Error
};

enum class DiagnosticCode
{
    PrimitiveFailed,
    PrimitiveTimeout,
    FilterNotFound,
    EmfSizeExceeded,
    EmfUnsupportedRecord,
    CacheCorruption,
    EmptyGraph
};

char const *severity_name(Severity severity);
char const *code_name(DiagnosticCode code);

struct Diagnostic
{
    Severity severity = Severity::Warning;
    DiagnosticCode code = DiagnosticCode::PrimitiveFailed;
    std::string node_id; ///< Empty for chain-level diagnostics.
    std::string message;

    /// One-line rendering, e.g. "warning [primitive-timeout] blur1: ...".
    std::string to_string() const;
};

/**
 * Receiver for diagnostics. Implementations must be thread-safe: a sink may be shared by
 * chains running concurrently.
 */
class DiagnosticsSink
{
public:
    virtual ~DiagnosticsSink() = default;
    virtual void report(Diagnostic const &diagnostic) = 0;
};

/// Forwards each diagnostic to the GLib log under the "svgfx" domain.
class LogDiagnosticsSink final : public DiagnosticsSink
{
public:
    void report(Diagnostic const &diagnostic) override;
};

/// Keeps every diagnostic for later inspection.
class CollectingDiagnosticsSink final : public DiagnosticsSink
{
public:
    void report(Diagnostic const &diagnostic) override;

    std::vector<Diagnostic> diagnostics() const;
    std::vector<Diagnostic> take();
    std::size_t count(DiagnosticCode code) const;

private:
    mutable std::mutex _mutex;
    std::vector<Diagnostic> _diagnostics;
};

} // namespace Debug
} // namespace Svgfx

#endif // SVGFX_DEBUG_DIAGNOSTICS_H
