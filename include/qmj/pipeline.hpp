#pragma once

/// @file include/qmj/pipeline.hpp
/// @brief Pipeline: full-panel QMJ batch computation.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Orchestrate the complete factor construction:
///
///   PanelStore → GrowthDeltaCalculator → [per period:
///     CrossSectionalNormalizer → SubFactorAggregator → CompositeScorer
///     → Ranker → PortfolioAssigner → ReturnCalculator
///     → FactorReturnAggregator] → merge by period
///
/// ## Usage
/// ```cpp
/// PipelineConfig cfg;
/// cfg.workers = 4;
/// Pipeline pipeline(cfg);
/// auto panel  = PanelLoader::load_csv("panel.csv");
/// auto result = pipeline.run(panel);
/// FactorReturnWriter::write_csv("qmj.csv", result.factor_returns);
/// ```
///
/// ## Guarantees
/// - Every period is computed from its own records only; the growth deltas
///   are prepared beforehand from per-entity histories
/// - A period appears in `factor_returns` fully computed or not at all
/// - Output is bit-identical for any worker count
/// - Nothing persists between runs

#include "qmj/config.hpp"
#include "qmj/diagnostics.hpp"
#include "qmj/panel.hpp"
#include "qmj/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace qmj::engine {

/// Everything derived for one period.
struct PeriodOutput {
    Period                            period;
    std::optional<PeriodFactorReturn> factor_return;  ///< nullopt: period skipped
    std::vector<RankedEntity>         rankings;
    std::vector<PortfolioAssignment>  assignments;
    std::vector<Diagnostic>           diagnostics;
};

struct PipelineResult {
    std::vector<PeriodFactorReturn>  factor_returns;  ///< ascending by period
    std::vector<RankedEntity>        rankings;        ///< by period, then rank
    std::vector<PortfolioAssignment> assignments;     ///< by period, then rank
    std::vector<Diagnostic>          diagnostics;     ///< by period
};

class Pipeline {
public:
    /// Validates `config`; throws ConfigError if it is invalid.
    explicit Pipeline(PipelineConfig config = PipelineConfig{});

    /// Run the full pipeline over `panel`.
    ///
    /// # Throws
    /// ConfigError, before any period is processed, if `panel` lacks a metric
    /// column the dimension map depends on.
    [[nodiscard]] PipelineResult run(const core::PanelStore& panel) const;

    /// Stages 4.1 – 4.7 for one period. `records` must all share `period`
    /// and already carry their delta metrics.
    [[nodiscard]] PeriodOutput
    run_period(const Period& period,
               std::span<const MetricRecord> records) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    /// Throw ConfigError if `panel` lacks a required metric column.
    void check_columns(const core::PanelStore& panel) const;

    PipelineConfig           config_;
    std::vector<std::string> metrics_;      ///< standardized metric names
    std::vector<std::string> delta_bases_;  ///< metrics needing a change series
};

} // namespace qmj::engine
