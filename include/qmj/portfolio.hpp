#pragma once

/// @file include/qmj/portfolio.hpp
/// @brief Ranker and PortfolioAssigner.
///
/// # Module: Ranking and Bucketing
///
/// ## Ranking
/// Entities of one period with a present Quality score are sorted by
///   1. quality, descending
///   2. entity_id, ascending (or descending, per TieBreak)
/// and ranked 1..N in that order. Entities with missing Quality are dropped.
///
/// ## Bucketing
/// With N the number of ranked entities in the period:
///   Quality: rank ≤ ceil(f_top · N)
///   Junk:    rank > N − ceil(f_bottom · N)
///   Neutral: otherwise
///
/// For f = 0.1 the Junk rule equals rank > floor(0.9 · N). N is always the
/// per-period count. When both rules match one entity (N = 1), Quality wins.

#include "qmj/config.hpp"
#include "qmj/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace qmj::portfolio {

// ─── Ranker ───────────────────────────────────────────────────────────────────

class Ranker {
public:
    explicit Ranker(TieBreak tie_break = TieBreak::EntityAscending) noexcept
        : tie_break_(tie_break) {}

    /// Rank one period's scores. Output is in rank order.
    [[nodiscard]] std::vector<RankedEntity>
    rank(std::span<const CompositeScore> period_scores) const;

    /// True if `a` sorts strictly before `b`.
    [[nodiscard]] bool precedes(const RankedEntity& a,
                                const RankedEntity& b) const noexcept;

private:
    TieBreak tie_break_;
};

// ─── PortfolioAssigner ────────────────────────────────────────────────────────

/// Rank cut-offs for one period.
struct BucketThresholds {
    std::size_t n               = 0;  ///< ranked entities in the period
    std::size_t quality_cutoff  = 0;  ///< Quality iff rank ≤ quality_cutoff
    std::size_t junk_threshold  = 0;  ///< Junk iff rank > junk_threshold
};

class PortfolioAssigner {
public:
    PortfolioAssigner(double top_fraction    = constants::DEFAULT_TOP_FRACTION,
                      double bottom_fraction = constants::DEFAULT_BOTTOM_FRACTION) noexcept
        : top_fraction_(top_fraction), bottom_fraction_(bottom_fraction) {}

    [[nodiscard]] BucketThresholds thresholds(std::size_t n) const noexcept;

    [[nodiscard]] static Bucket classify(std::size_t rank,
                                         const BucketThresholds& t) noexcept;

    /// Label one period's ranked entities. N is `ranked.size()`.
    [[nodiscard]] std::vector<PortfolioAssignment>
    assign(std::span<const RankedEntity> ranked) const;

    /// ceil(fraction · n), clamped to [0, n].
    [[nodiscard]] static std::size_t bucket_size(double fraction,
                                                 std::size_t n) noexcept;

private:
    double top_fraction_;
    double bottom_fraction_;
};

} // namespace qmj::portfolio
