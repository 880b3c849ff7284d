/// @file src/backtest/factor_returns.cpp
/// @brief Per-entity returns and the per-period Quality − Junk spread.

#include "qmj/backtest.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

namespace qmj::backtest {

// ─── ReturnCalculator ─────────────────────────────────────────────────────────

MetricValue ReturnCalculator::compute(const MetricRecord& rec) noexcept {
    if (!rec.prev_price) {
        return std::nullopt;
    }
    // Absolute price change, not a percentage return.
    return rec.price - *rec.prev_price;
}

// ─── FactorReturnAggregator ───────────────────────────────────────────────────

MetricValue
FactorReturnAggregator::bucket_mean(std::span<const AssignedReturn> returns,
                                    Bucket bucket) {
    std::vector<double> values;
    for (const auto& r : returns) {
        if (r.bucket == bucket && r.value) {
            values.push_back(*r.value);
        }
    }
    if (values.empty()) {
        return std::nullopt;
    }
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        v[static_cast<Eigen::Index>(i)] = values[i];
    }
    return v.mean();
}

PeriodFactorReturn
FactorReturnAggregator::aggregate(const Period& period,
                                  std::size_t n_ranked,
                                  std::span<const AssignedReturn> returns,
                                  std::vector<Diagnostic>& diagnostics) {
    PeriodFactorReturn out{
        .period         = period,
        .quality_return = bucket_mean(returns, Bucket::Quality),
        .junk_return    = bucket_mean(returns, Bucket::Junk),
        .qmj            = std::nullopt,
        .n_ranked       = n_ranked,
        .n_quality      = 0,
        .n_junk         = 0,
    };

    for (const auto& r : returns) {
        if (r.bucket == Bucket::Quality) ++out.n_quality;
        if (r.bucket == Bucket::Junk)    ++out.n_junk;
    }

    auto report_empty = [&](Bucket b, std::size_t members) {
        diagnostics.push_back(Diagnostic{
            .kind    = DiagnosticKind::EmptyBucket,
            .period  = period,
            .subject = std::string(to_string(b)),
            .message = fmt::format(
                "no defined return among {} member(s); bucket mean undefined",
                members),
        });
    };
    if (!out.quality_return) report_empty(Bucket::Quality, out.n_quality);
    if (!out.junk_return)    report_empty(Bucket::Junk, out.n_junk);

    if (out.quality_return && out.junk_return) {
        out.qmj = *out.quality_return - *out.junk_return;
    }
    return out;
}

} // namespace qmj::backtest
