/// @file src/core/types.cpp
/// @brief Helpers for the shared value types.

#include "qmj/types.hpp"

#include <fmt/format.h>

namespace qmj {

std::string Period::to_string() const {
    if (month == 0) {
        return fmt::format("{:04d}", year);
    }
    return fmt::format("{:04d}-{:02d}", year, month);
}

MetricValue find_metric(const MetricMap& m, std::string_view name) noexcept {
    const auto it = m.find(name);
    if (it == m.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view to_string(Dimension d) noexcept {
    switch (d) {
        case Dimension::Profitability: return "Profitability";
        case Dimension::Growth:        return "Growth";
        case Dimension::Safety:        return "Safety";
        case Dimension::Payout:        return "Payout";
    }
    return "Unknown";
}

std::string_view to_string(Bucket b) noexcept {
    switch (b) {
        case Bucket::Quality: return "Quality";
        case Bucket::Junk:    return "Junk";
        case Bucket::Neutral: return "Neutral";
    }
    return "Unknown";
}

// ─── DimensionScore ───────────────────────────────────────────────────────────

MetricValue DimensionScore::get(Dimension d) const noexcept {
    switch (d) {
        case Dimension::Profitability: return profitability;
        case Dimension::Growth:        return growth;
        case Dimension::Safety:        return safety;
        case Dimension::Payout:        return payout;
    }
    return std::nullopt;
}

MetricValue& DimensionScore::slot(Dimension d) noexcept {
    switch (d) {
        case Dimension::Profitability: return profitability;
        case Dimension::Growth:        return growth;
        case Dimension::Safety:        return safety;
        case Dimension::Payout:        break;
    }
    return payout;
}

} // namespace qmj
