#pragma once

/// @file include/qmj/types.hpp
/// @brief Shared value types for the Quality Minus Junk (QMJ) factor system.
///
/// All modules include this file. It defines the panel key (entity, period),
/// the per-stage record types flowing through the pipeline, and the enums
/// used to label dimensions and portfolio buckets.
///
/// A value that is undefined (missing input, empty bucket, no prior period)
/// is carried as `std::nullopt`. It is never encoded as 0.0 or NaN.

#include <array>
#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace qmj {

// ─── Period ───────────────────────────────────────────────────────────────────

/// Panel time key. Annual data leaves `month` at 0.
struct Period {
    int year  = 0;
    int month = 0;  ///< 1..12, or 0 for annual observations

    auto operator<=>(const Period&) const = default;

    /// "2019" for annual periods, "2019-03" for monthly ones.
    [[nodiscard]] std::string to_string() const;
};

// ─── Metric values ────────────────────────────────────────────────────────────

/// A metric observation; `nullopt` marks a missing value.
using MetricValue = std::optional<double>;

/// Metric name → value. Ordered so iteration (and therefore summation
/// order) is identical on every run.
using MetricMap = std::map<std::string, MetricValue, std::less<>>;

/// Look up `name` in `m`; missing keys read as a missing value.
[[nodiscard]] MetricValue find_metric(const MetricMap& m,
                                      std::string_view name) noexcept;

// ─── Dimensions and buckets ───────────────────────────────────────────────────

/// The four quality dimensions combined into the composite score.
enum class Dimension { Profitability, Growth, Safety, Payout };

inline constexpr std::array<Dimension, 4> ALL_DIMENSIONS = {
    Dimension::Profitability,
    Dimension::Growth,
    Dimension::Safety,
    Dimension::Payout,
};

[[nodiscard]] std::string_view to_string(Dimension d) noexcept;

/// Portfolio label assigned to a ranked entity.
enum class Bucket { Quality, Junk, Neutral };

[[nodiscard]] std::string_view to_string(Bucket b) noexcept;

// ─── Pipeline records ─────────────────────────────────────────────────────────

/// Immutable input row.
struct MetricRecord {
    std::string entity_id;
    Period      period;
    MetricMap   raw_metrics;
    double      price      = 0.0;
    MetricValue prev_price;   ///< Missing when no prior price is known
};

/// Cross-sectionally standardized metrics for one entity-period.
struct StandardizedRecord {
    std::string entity_id;
    Period      period;
    MetricMap   z;
};

/// Per-dimension scores for one entity-period.
struct DimensionScore {
    std::string entity_id;
    Period      period;
    MetricValue profitability;
    MetricValue growth;
    MetricValue safety;
    MetricValue payout;

    [[nodiscard]] MetricValue  get(Dimension d) const noexcept;
    [[nodiscard]] MetricValue& slot(Dimension d) noexcept;
};

struct CompositeScore {
    std::string entity_id;
    Period      period;
    MetricValue quality;
};

/// A ranked entity. Within a period ranks are exactly 1..N; rank 1 is best.
struct RankedEntity {
    std::string entity_id;
    Period      period;
    double      quality = 0.0;
    std::size_t rank    = 0;
};

struct PortfolioAssignment {
    std::string entity_id;
    Period      period;
    Bucket      bucket = Bucket::Neutral;
};

/// One row of the factor return series.
struct PeriodFactorReturn {
    Period      period;
    MetricValue quality_return;  ///< Mean return of the Quality bucket
    MetricValue junk_return;     ///< Mean return of the Junk bucket
    MetricValue qmj;             ///< quality_return − junk_return
    std::size_t n_ranked  = 0;
    std::size_t n_quality = 0;
    std::size_t n_junk    = 0;
};

} // namespace qmj
