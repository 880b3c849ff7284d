#pragma once

/// @file include/qmj/aggregator.hpp
/// @brief SubFactorAggregator and CompositeScorer.
///
/// # Module: Sub-Factor Aggregation
///
///   dimension(e, P) = mean of the configured component z-scores present for e
///   quality(e, P)   = mean of the present dimension scores   (Lenient)
///                   = missing if any dimension is missing     (Strict)
///
/// A dimension with no present component is missing. A composite with no
/// present dimension is missing under either policy and is never read as 0.

#include "qmj/config.hpp"
#include "qmj/types.hpp"

#include <span>
#include <vector>

namespace qmj::factor {

// ─── SubFactorAggregator ──────────────────────────────────────────────────────

class SubFactorAggregator {
public:
    explicit SubFactorAggregator(DimensionMetricMap map);

    [[nodiscard]] DimensionScore
    aggregate(const StandardizedRecord& rec) const;

    [[nodiscard]] std::vector<DimensionScore>
    aggregate(std::span<const StandardizedRecord> recs) const;

    [[nodiscard]] const DimensionMetricMap& map() const noexcept { return map_; }

private:
    DimensionMetricMap map_;
};

// ─── CompositeScorer ──────────────────────────────────────────────────────────

class CompositeScorer {
public:
    explicit CompositeScorer(CompositePolicy policy = CompositePolicy::Lenient) noexcept
        : policy_(policy) {}

    [[nodiscard]] CompositeScore score(const DimensionScore& d) const;

    [[nodiscard]] std::vector<CompositeScore>
    score(std::span<const DimensionScore> ds) const;

    [[nodiscard]] CompositePolicy policy() const noexcept { return policy_; }

private:
    CompositePolicy policy_;
};

/// Arithmetic mean of the present values; nullopt if none is present.
[[nodiscard]] MetricValue mean_of_present(std::span<const MetricValue> values) noexcept;

} // namespace qmj::factor
