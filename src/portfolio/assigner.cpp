/// @file src/portfolio/assigner.cpp
/// @brief Rank → {Quality, Junk, Neutral} using per-period counts.

#include "qmj/portfolio.hpp"

#include <algorithm>
#include <cmath>

namespace qmj::portfolio {

std::size_t PortfolioAssigner::bucket_size(double fraction, std::size_t n) noexcept {
    if (n == 0 || !(fraction > 0.0)) {
        return 0;
    }
    const double raw = std::ceil(fraction * static_cast<double>(n)
                                 - constants::BUCKET_SIZE_EPSILON);
    if (raw <= 0.0) {
        return 0;
    }
    return std::min(n, static_cast<std::size_t>(raw));
}

BucketThresholds PortfolioAssigner::thresholds(std::size_t n) const noexcept {
    return BucketThresholds{
        .n              = n,
        .quality_cutoff = bucket_size(top_fraction_, n),
        .junk_threshold = n - bucket_size(bottom_fraction_, n),
    };
}

Bucket PortfolioAssigner::classify(std::size_t rank,
                                   const BucketThresholds& t) noexcept {
    if (rank <= t.quality_cutoff) return Bucket::Quality;
    if (rank > t.junk_threshold)  return Bucket::Junk;
    return Bucket::Neutral;
}

std::vector<PortfolioAssignment>
PortfolioAssigner::assign(std::span<const RankedEntity> ranked) const {
    const auto t = thresholds(ranked.size());

    std::vector<PortfolioAssignment> out;
    out.reserve(ranked.size());
    for (const auto& r : ranked) {
        out.push_back(PortfolioAssignment{
            .entity_id = r.entity_id,
            .period    = r.period,
            .bucket    = classify(r.rank, t),
        });
    }
    return out;
}

} // namespace qmj::portfolio
