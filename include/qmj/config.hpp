#pragma once

/// @file include/qmj/config.hpp
/// @brief PipelineConfig: every recognised option of the QMJ pipeline.
///
/// # Module: Configuration
///
/// ## Options
/// | Field                  | Default                                   |
/// |------------------------|-------------------------------------------|
/// | dimension_metric_map   | 6 / 5 / 5 / 3 components (see below)      |
/// | missing_value_policy   | Exclude                                   |
/// | composite_policy       | Lenient                                   |
/// | top_decile_fraction    | 0.1                                       |
/// | bottom_decile_fraction | 0.1                                       |
/// | tie_break_key          | EntityAscending                           |
/// | workers                | 1                                         |
/// | verbose                | false                                     |
///
/// ## Default dimension map
///   Profitability: gpoa, roe, roa, cfoa, gmar, acc
///   Growth:        d_gpoa, d_roe, d_roa, d_cfoa, d_gmar
///   Safety:        bab, lev, o, z, evol
///   Payout:        eiss, diss, npop
///
/// `d_<metric>` names a period-over-period change series computed per entity
/// before standardization.

#include "qmj/constants.hpp"
#include "qmj/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace qmj {

/// How a missing metric is represented after standardization.
enum class MissingValuePolicy {
    Exclude,   ///< z stays missing and the metric drops out of its dimension
    ZeroFill,  ///< z becomes 0.0, the cross-sectional mean
};

/// How missing dimension scores affect the composite.
enum class CompositePolicy {
    Lenient,  ///< mean of the dimensions that are present
    Strict,   ///< any missing dimension makes the composite missing
};

/// Secondary sort key for entities with equal Quality scores.
enum class TieBreak {
    EntityAscending,
    EntityDescending,
};

using DimensionMetricMap = std::map<Dimension, std::vector<std::string>>;

/// The standard QMJ dimension → metric mapping.
[[nodiscard]] DimensionMetricMap default_dimension_metric_map();

struct PipelineConfig {
    DimensionMetricMap dimension_metric_map = default_dimension_metric_map();
    MissingValuePolicy missing_value_policy = MissingValuePolicy::Exclude;
    CompositePolicy    composite_policy     = CompositePolicy::Lenient;
    double             top_decile_fraction    = constants::DEFAULT_TOP_FRACTION;
    double             bottom_decile_fraction = constants::DEFAULT_BOTTOM_FRACTION;
    TieBreak           tie_break_key        = TieBreak::EntityAscending;

    /// Number of worker threads that process period partitions.
    std::size_t workers = 1;

    /// Diagnostics are logged to stderr as "[WARN]" lines as they are merged.
    /// `quiet` suppresses them; `verbose` adds an "[INFO]" line per period.
    bool quiet   = false;
    bool verbose = false;

    /// Throw ConfigError if any option is out of range.
    ///
    /// Rejected:
    /// - a dimension absent from the map or with an empty metric list
    /// - an empty metric name, or a bare "d_" prefix
    /// - fractions outside (0, 0.5] or non-finite
    /// - workers == 0
    void validate() const;

    /// Every metric named in the map, delta names included, sorted and unique.
    [[nodiscard]] std::vector<std::string> standardized_metrics() const;

    /// Raw input columns the map depends on: plain names plus the base name
    /// of every `d_` delta. Sorted and unique.
    [[nodiscard]] std::vector<std::string> required_input_metrics() const;

    /// Base metrics that need a change series, e.g. "gpoa" for "d_gpoa".
    [[nodiscard]] std::vector<std::string> delta_base_metrics() const;
};

/// True if `name` carries the delta prefix.
[[nodiscard]] bool is_delta_metric(std::string_view name) noexcept;

/// "gpoa" → "d_gpoa".
[[nodiscard]] std::string delta_metric_name(std::string_view base);

[[nodiscard]] std::string_view to_string(MissingValuePolicy p) noexcept;
[[nodiscard]] std::string_view to_string(CompositePolicy p) noexcept;
[[nodiscard]] std::string_view to_string(TieBreak t) noexcept;

} // namespace qmj
