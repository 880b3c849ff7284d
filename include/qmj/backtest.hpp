#pragma once

/// @file include/qmj/backtest.hpp
/// @brief ReturnCalculator and FactorReturnAggregator.
///
/// # Module: Factor Returns
///
/// ## Return convention
///   return(e, P) = price(P) − prev_price(P)
///
/// This is an absolute price difference, not a percentage return. Callers
/// wanting percentage returns divide by prev_price themselves. The return is
/// missing when prev_price is missing.
///
/// ## Factor return
///   quality_return = mean return over the Quality bucket
///   junk_return    = mean return over the Junk bucket
///   qmj            = quality_return − junk_return
///
/// Only entities with a defined return enter a mean. A bucket with no such
/// entity has an undefined mean (nullopt, never 0), which makes qmj
/// undefined too, and one EmptyBucket diagnostic is recorded.
///
/// ## NOT Responsible For
/// - Ranking or bucketing (see portfolio.hpp)
/// - Risk, cost or performance statistics

#include "qmj/diagnostics.hpp"
#include "qmj/types.hpp"

#include <span>
#include <vector>

namespace qmj::backtest {

class ReturnCalculator {
public:
    [[nodiscard]] static MetricValue compute(const MetricRecord& rec) noexcept;
};

/// A bucket label joined with the entity's return for the same period.
struct AssignedReturn {
    Bucket      bucket;
    MetricValue value;
};

class FactorReturnAggregator {
public:
    /// Aggregate one period.
    ///
    /// # Arguments
    /// * `period`      — the period being aggregated
    /// * `n_ranked`    — number of ranked entities in the period
    /// * `returns`     — one entry per ranked entity, in rank order
    /// * `diagnostics` — receives EmptyBucket entries
    [[nodiscard]] static PeriodFactorReturn
    aggregate(const Period& period,
              std::size_t n_ranked,
              std::span<const AssignedReturn> returns,
              std::vector<Diagnostic>& diagnostics);

    /// Mean of the defined returns in `bucket`; nullopt if there are none.
    [[nodiscard]] static MetricValue
    bucket_mean(std::span<const AssignedReturn> returns, Bucket bucket);
};

} // namespace qmj::backtest
