#pragma once

/// @file include/qmj/normalizer.hpp
/// @brief CrossSectionalNormalizer: per-period z-score standardization.
///
/// # Module: Cross-Sectional Normalizer
///
/// ## Responsibility
/// Standardize each metric of one period's records against that period's
/// population, before the metrics are averaged into dimension scores.
///
/// ## Why This Matters
/// Raw fundamentals live on unrelated scales:
///   - gross profit / assets  ~0.3
///   - leverage               ~2
///   - Altman z               ~5
///
/// Averaging them unscaled lets the widest metric dominate every dimension.
/// After standardization each metric contributes on a common scale.
///
/// ## Formula
/// For metric m in period P, over the n entities with a present value:
///   μ = (1/n) Σ x
///   σ = √((1/n) Σ (x − μ)²)        (population, not Bessel-corrected)
///   z = (x − μ) / σ
///
/// ## Edge Cases
/// - σ = 0 up to rounding (σ ≤ 1e-12 · max|x|, i.e. every present value
///   equal): z = 0 for every present value, and one ZeroVariance diagnostic
///   for the (period, metric)
/// - Entity missing the metric: z missing under MissingValuePolicy::Exclude,
///   0.0 under ZeroFill
/// - No entity has the metric: every z missing (ZeroFill: 0.0), no diagnostic
///
/// ## Guarantees
/// - Reads only the records passed in; the caller passes one period at a time
/// - Output order matches input order
/// - Never divides by zero

#include "qmj/config.hpp"
#include "qmj/diagnostics.hpp"
#include "qmj/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace qmj::factor {

/// Population moments of one cross-section.
struct CrossSectionStats {
    std::size_t count   = 0;
    double      mean    = 0.0;
    double      stddev  = 0.0;
    double      max_abs = 0.0;  ///< largest |x|; scales the degeneracy bound

    /// True when σ is rounding noise relative to the values themselves.
    [[nodiscard]] bool degenerate() const noexcept;
};

class CrossSectionalNormalizer {
public:
    explicit CrossSectionalNormalizer(
        MissingValuePolicy policy = MissingValuePolicy::Exclude) noexcept;

    /// Standardize `metrics` across `period_records`.
    ///
    /// # Arguments
    /// * `period_records` — every record of a single period
    /// * `metrics`        — metric names to standardize; names absent from a
    ///                      record read as missing
    /// * `diagnostics`    — receives one ZeroVariance entry per degenerate metric
    ///
    /// # Returns
    /// One StandardizedRecord per input record, same order, carrying a z entry
    /// for every name in `metrics`.
    [[nodiscard]] std::vector<StandardizedRecord>
    normalize(std::span<const MetricRecord> period_records,
              std::span<const std::string> metrics,
              std::vector<Diagnostic>& diagnostics) const;

    /// Population mean and standard deviation of `values`.
    /// Returns nullopt for an empty span.
    [[nodiscard]] static std::optional<CrossSectionStats>
    stats(std::span<const double> values);

    /// z-score of `value` against `s`; 0.0 for a degenerate cross-section.
    [[nodiscard]] static double zscore(double value,
                                       const CrossSectionStats& s) noexcept;

    [[nodiscard]] MissingValuePolicy policy() const noexcept { return policy_; }

private:
    MissingValuePolicy policy_;
};

} // namespace qmj::factor
