/// @file src/engine/pipeline.cpp
/// @brief Pipeline: period-partitioned QMJ computation and ordered merge.

#include "qmj/pipeline.hpp"
#include "qmj/aggregator.hpp"
#include "qmj/backtest.hpp"
#include "qmj/errors.hpp"
#include "qmj/growth.hpp"
#include "qmj/normalizer.hpp"
#include "qmj/portfolio.hpp"
#include "qmj/worker_pool.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

namespace qmj::engine {

using backtest::AssignedReturn;
using backtest::FactorReturnAggregator;
using backtest::ReturnCalculator;
using core::PanelStore;
using factor::CompositeScorer;
using factor::CrossSectionalNormalizer;
using factor::GrowthDeltaCalculator;
using factor::SubFactorAggregator;
using portfolio::PortfolioAssigner;
using portfolio::Ranker;

namespace {

void log_period_summary(const PeriodFactorReturn& f) {
    fmt::print(stderr, "[INFO] {}: ranked {} (quality {}, junk {})\n",
               f.period.to_string(), f.n_ranked, f.n_quality, f.n_junk);
}

}  // anonymous namespace

// ─── Pipeline constructor ─────────────────────────────────────────────────────

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config))
{
    config_.validate();
    metrics_     = config_.standardized_metrics();
    delta_bases_ = config_.delta_base_metrics();
}

// ─── Pipeline::check_columns ──────────────────────────────────────────────────

void Pipeline::check_columns(const PanelStore& panel) const {
    std::vector<std::string> missing;
    for (const auto& m : config_.required_input_metrics()) {
        if (!panel.has_metric(m)) {
            missing.push_back(m);
        }
    }
    if (!missing.empty()) {
        throw ConfigError(fmt::format(
            "panel is missing required metric column(s): {}",
            fmt::join(missing, ", ")));
    }
}

// ─── Pipeline::run_period ─────────────────────────────────────────────────────

PeriodOutput Pipeline::run_period(const Period& period,
                                  std::span<const MetricRecord> records) const {
    PeriodOutput out{.period = period};
    std::vector<Diagnostic> diags;

    // ── 4.1 Standardize ───────────────────────────────────────────────────────
    const CrossSectionalNormalizer normalizer(config_.missing_value_policy);
    const auto standardized = normalizer.normalize(records, metrics_, diags);

    // ── 4.2 / 4.3 Dimension and composite scores ──────────────────────────────
    const SubFactorAggregator aggregator(config_.dimension_metric_map);
    const CompositeScorer     scorer(config_.composite_policy);
    const auto composite = scorer.score(aggregator.aggregate(standardized));

    // ── 4.4 Rank ──────────────────────────────────────────────────────────────
    auto ranked = Ranker(config_.tie_break_key).rank(composite);
    if (ranked.empty()) {
        diags.push_back(Diagnostic{
            .kind    = DiagnosticKind::EmptyPeriod,
            .period  = period,
            .subject = {},
            .message = fmt::format(
                "none of {} entities has a Quality score; period skipped",
                records.size()),
        });
        out.diagnostics = std::move(diags);
        return out;
    }

    // ── 4.5 Bucket ────────────────────────────────────────────────────────────
    const PortfolioAssigner assigner(config_.top_decile_fraction,
                                     config_.bottom_decile_fraction);
    auto assignments = assigner.assign(ranked);

    // ── 4.6 Returns, joined to buckets by entity ──────────────────────────────
    std::map<std::string_view, const MetricRecord*> by_entity;
    for (const auto& r : records) {
        by_entity.emplace(r.entity_id, &r);
    }
    std::vector<AssignedReturn> joined;
    joined.reserve(assignments.size());
    for (const auto& a : assignments) {
        const auto it = by_entity.find(a.entity_id);
        joined.push_back(AssignedReturn{
            .bucket = a.bucket,
            .value  = it != by_entity.end()
                          ? ReturnCalculator::compute(*it->second)
                          : MetricValue{},
        });
    }

    // ── 4.7 Factor return ─────────────────────────────────────────────────────
    auto factor = FactorReturnAggregator::aggregate(period, ranked.size(), joined, diags);

    // Publish only once the whole chain has completed.
    out.factor_return = std::move(factor);
    out.rankings      = std::move(ranked);
    out.assignments   = std::move(assignments);
    out.diagnostics   = std::move(diags);
    return out;
}

// ─── Pipeline::run ────────────────────────────────────────────────────────────

PipelineResult Pipeline::run(const PanelStore& panel) const {
    check_columns(panel);

    // The only cross-period step: change series from per-entity histories.
    const auto with_deltas = GrowthDeltaCalculator::apply(panel, delta_bases_);

    // Lay each period's records out contiguously so a partition is one span.
    const std::size_t n_periods = panel.periods().size();
    std::vector<std::vector<MetricRecord>> partitions(n_periods);
    for (std::size_t p = 0; p < n_periods; ++p) {
        const auto group = panel.period_group(p);
        partitions[p].reserve(group.size());
        for (const std::size_t idx : group) {
            partitions[p].push_back(with_deltas[idx]);
        }
    }

    // Each worker owns exactly one output slot per period it handles.
    std::vector<PeriodOutput> slots(n_periods);
    {
        WorkerPool pool(config_.workers);
        pool.for_each_index(n_periods, [&](std::size_t p) {
            slots[p] = run_period(panel.periods()[p], partitions[p]);
        });
    }

    // Merge: slots may have completed in any order.
    std::sort(slots.begin(), slots.end(),
              [](const PeriodOutput& a, const PeriodOutput& b) {
                  return a.period < b.period;
              });

    PipelineResult result;
    for (auto& s : slots) {
        if (s.factor_return) {
            if (config_.verbose && !config_.quiet) {
                log_period_summary(*s.factor_return);
            }
            result.factor_returns.push_back(*s.factor_return);
        }
        std::move(s.rankings.begin(), s.rankings.end(),
                  std::back_inserter(result.rankings));
        std::move(s.assignments.begin(), s.assignments.end(),
                  std::back_inserter(result.assignments));
        for (auto& d : s.diagnostics) {
            if (!config_.quiet) {
                log_diagnostic(d);
            }
            result.diagnostics.push_back(std::move(d));
        }
    }
    return result;
}

} // namespace qmj::engine
