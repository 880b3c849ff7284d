/// @file src/portfolio/ranker.cpp
/// @brief Deterministic per-period ranking by composite Quality score.

#include "qmj/portfolio.hpp"

#include <algorithm>

namespace qmj::portfolio {

bool Ranker::precedes(const RankedEntity& a, const RankedEntity& b) const noexcept {
    if (a.quality != b.quality) {
        return a.quality > b.quality;
    }
    return tie_break_ == TieBreak::EntityAscending
               ? a.entity_id < b.entity_id
               : a.entity_id > b.entity_id;
}

std::vector<RankedEntity>
Ranker::rank(std::span<const CompositeScore> period_scores) const {
    std::vector<RankedEntity> ranked;
    ranked.reserve(period_scores.size());
    for (const auto& s : period_scores) {
        if (!s.quality) {
            continue;  // excluded: never ranked, never bucketed
        }
        ranked.push_back(RankedEntity{
            .entity_id = s.entity_id,
            .period    = s.period,
            .quality   = *s.quality,
            .rank      = 0,
        });
    }

    // (quality, entity_id) is unique within a period, so the order is total.
    std::sort(ranked.begin(), ranked.end(),
              [this](const RankedEntity& a, const RankedEntity& b) {
                  return precedes(a, b);
              });

    for (std::size_t i = 0; i < ranked.size(); ++i) {
        ranked[i].rank = i + 1;
    }
    return ranked;
}

} // namespace qmj::portfolio
