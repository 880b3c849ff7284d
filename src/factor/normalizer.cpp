/// @file src/factor/normalizer.cpp
/// @brief CrossSectionalNormalizer: per-period z-score standardization.
///
/// For each requested metric:
///   1. Gathers the present values of the period into an Eigen vector
///   2. Computes population mean and standard deviation
///   3. Writes z = (x − μ) / σ, or 0 for a degenerate cross-section
///   4. Applies the missing-value policy to entities without a value

#include "qmj/normalizer.hpp"
#include "qmj/constants.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <cmath>

namespace qmj::factor {

// ─── CrossSectionStats ────────────────────────────────────────────────────────

bool CrossSectionStats::degenerate() const noexcept {
    return !(stddev > constants::ZERO_VARIANCE_EPSILON * max_abs);
}

// ─── Constructor ──────────────────────────────────────────────────────────────

CrossSectionalNormalizer::CrossSectionalNormalizer(MissingValuePolicy policy) noexcept
    : policy_(policy) {}

// ─── stats ────────────────────────────────────────────────────────────────────

std::optional<CrossSectionStats>
CrossSectionalNormalizer::stats(std::span<const double> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    // Owned (aligned) storage: the reduction order depends only on the size.
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        v[static_cast<Eigen::Index>(i)] = values[i];
    }
    const double mean     = v.mean();
    const double variance = (v.array() - mean).square().mean();
    return CrossSectionStats{
        .count   = values.size(),
        .mean    = mean,
        .stddev  = std::sqrt(variance),
        .max_abs = v.cwiseAbs().maxCoeff(),
    };
}

// ─── zscore ───────────────────────────────────────────────────────────────────

double CrossSectionalNormalizer::zscore(double value,
                                        const CrossSectionStats& s) noexcept {
    if (s.degenerate()) {
        // Flat cross-section: nothing to normalize against.
        return 0.0;
    }
    return (value - s.mean) / s.stddev;
}

// ─── normalize ────────────────────────────────────────────────────────────────

std::vector<StandardizedRecord>
CrossSectionalNormalizer::normalize(std::span<const MetricRecord> period_records,
                                    std::span<const std::string> metrics,
                                    std::vector<Diagnostic>& diagnostics) const {
    std::vector<StandardizedRecord> out;
    out.reserve(period_records.size());
    for (const auto& rec : period_records) {
        out.push_back(StandardizedRecord{
            .entity_id = rec.entity_id,
            .period    = rec.period,
            .z         = {},
        });
    }

    const MetricValue fill = policy_ == MissingValuePolicy::ZeroFill
                                 ? MetricValue{0.0}
                                 : MetricValue{};

    std::vector<double> present;
    present.reserve(period_records.size());

    for (const auto& metric : metrics) {
        present.clear();
        for (const auto& rec : period_records) {
            if (const auto x = find_metric(rec.raw_metrics, metric)) {
                present.push_back(*x);
            }
        }

        const auto s = stats(present);
        if (s && s->degenerate()) {
            diagnostics.push_back(Diagnostic{
                .kind    = DiagnosticKind::ZeroVariance,
                .period  = period_records.front().period,
                .subject = metric,
                .message = fmt::format(
                    "zero cross-sectional variance over {} entities "
                    "(value {}); z set to 0", s->count, s->mean),
            });
        }

        for (std::size_t i = 0; i < period_records.size(); ++i) {
            const auto x = find_metric(period_records[i].raw_metrics, metric);
            out[i].z.emplace(metric, x ? MetricValue{zscore(*x, *s)} : fill);
        }
    }

    return out;
}

} // namespace qmj::factor
