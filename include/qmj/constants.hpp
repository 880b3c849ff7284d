#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/// @file include/qmj/constants.hpp
/// @brief Column names, default fractions and numerical tolerances.

namespace qmj::constants {

// ─── Input Columns ────────────────────────────────────────────────────────────

inline constexpr std::string_view COL_ENTITY_ID  = "entity_id";
inline constexpr std::string_view COL_PERIOD     = "period";
inline constexpr std::string_view COL_PRICE      = "price";
inline constexpr std::string_view COL_PREV_PRICE = "prev_price";

/// The fourteen raw fundamental metrics every panel must carry.
inline constexpr std::array<std::string_view, 14> RAW_METRICS = {
    "gpoa", "roe", "roa", "cfoa", "gmar", "acc",   // profitability
    "bab",  "lev", "o",   "z",    "evol",          // safety
    "eiss", "diss", "npop",                        // payout
};

/// Prefix naming a period-over-period change series: "d_gpoa" is the
/// change of "gpoa" against the entity's previous period.
inline constexpr std::string_view DELTA_PREFIX = "d_";

// ─── Portfolio Defaults ───────────────────────────────────────────────────────

/// Share of ranked entities placed in the Quality (top) bucket.
inline constexpr double DEFAULT_TOP_FRACTION = 0.1;

/// Share of ranked entities placed in the Junk (bottom) bucket.
inline constexpr double DEFAULT_BOTTOM_FRACTION = 0.1;

/// Bucket fractions must lie in (0, MAX_BUCKET_FRACTION].
inline constexpr double MAX_BUCKET_FRACTION = 0.5;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// A cross-section is degenerate when σ ≤ ZERO_VARIANCE_EPSILON · max|x|.
/// Absorbs the rounding left in σ when every value is identical; the bound
/// scales with the data, so tiny but distinct values still standardize.
inline constexpr double ZERO_VARIANCE_EPSILON = 1e-12;

/// Slack applied before ceil() when sizing buckets, so that f·N landing a
/// rounding step above an integer does not add an extra entity.
inline constexpr double BUCKET_SIZE_EPSILON = 1e-9;

} // namespace qmj::constants
