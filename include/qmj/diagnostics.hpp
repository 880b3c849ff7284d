#pragma once

/// @file include/qmj/diagnostics.hpp
/// @brief Non-fatal pipeline events.
///
/// Degenerate data never aborts the pipeline. Each event is recorded as a
/// Diagnostic and returned with the result; `log_diagnostic` renders one to
/// stderr.

#include "qmj/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace qmj {

enum class DiagnosticKind {
    ZeroVariance,  ///< σ = 0 for a (period, metric); z forced to 0
    EmptyPeriod,   ///< no rankable entity in a period; period skipped
    EmptyBucket,   ///< a bucket has no entity with a defined return
};

struct Diagnostic {
    DiagnosticKind kind;
    Period         period;
    std::string    subject;  ///< metric name or bucket label; empty otherwise
    std::string    message;
};

[[nodiscard]] std::string_view to_string(DiagnosticKind k) noexcept;

/// "[ZeroVariance] 2019 roe: ..."
[[nodiscard]] std::string format_diagnostic(const Diagnostic& d);

/// Write one "[WARN] ..." line to stderr.
void log_diagnostic(const Diagnostic& d);

/// Number of diagnostics of the given kind.
[[nodiscard]] std::size_t count_kind(const std::vector<Diagnostic>& ds,
                                     DiagnosticKind kind) noexcept;

} // namespace qmj
