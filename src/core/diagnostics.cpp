/// @file src/core/diagnostics.cpp
/// @brief Diagnostic formatting and stderr logging.

#include "qmj/diagnostics.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdio>

namespace qmj {

std::string_view to_string(DiagnosticKind k) noexcept {
    switch (k) {
        case DiagnosticKind::ZeroVariance: return "ZeroVariance";
        case DiagnosticKind::EmptyPeriod:  return "EmptyPeriod";
        case DiagnosticKind::EmptyBucket:  return "EmptyBucket";
    }
    return "Unknown";
}

std::string format_diagnostic(const Diagnostic& d) {
    if (d.subject.empty()) {
        return fmt::format("[{}] {}: {}", to_string(d.kind),
                           d.period.to_string(), d.message);
    }
    return fmt::format("[{}] {} {}: {}", to_string(d.kind),
                       d.period.to_string(), d.subject, d.message);
}

void log_diagnostic(const Diagnostic& d) {
    fmt::print(stderr, "[WARN] {}\n", format_diagnostic(d));
}

std::size_t count_kind(const std::vector<Diagnostic>& ds,
                       DiagnosticKind kind) noexcept {
    return static_cast<std::size_t>(std::count_if(
        ds.begin(), ds.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

} // namespace qmj
