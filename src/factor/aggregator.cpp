/// @file src/factor/aggregator.cpp
/// @brief SubFactorAggregator and CompositeScorer.

#include "qmj/aggregator.hpp"

#include <utility>

namespace qmj::factor {

MetricValue mean_of_present(std::span<const MetricValue> values) noexcept {
    double      sum = 0.0;
    std::size_t n   = 0;
    for (const auto& v : values) {
        if (v) {
            sum += *v;
            ++n;
        }
    }
    if (n == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(n);
}

// ─── SubFactorAggregator ──────────────────────────────────────────────────────

SubFactorAggregator::SubFactorAggregator(DimensionMetricMap map)
    : map_(std::move(map)) {}

DimensionScore SubFactorAggregator::aggregate(const StandardizedRecord& rec) const {
    DimensionScore out{
        .entity_id = rec.entity_id,
        .period    = rec.period,
    };

    std::vector<MetricValue> components;
    for (const auto& [dim, metrics] : map_) {
        components.clear();
        for (const auto& m : metrics) {
            components.push_back(find_metric(rec.z, m));
        }
        out.slot(dim) = mean_of_present(components);
    }
    return out;
}

std::vector<DimensionScore>
SubFactorAggregator::aggregate(std::span<const StandardizedRecord> recs) const {
    std::vector<DimensionScore> out;
    out.reserve(recs.size());
    for (const auto& r : recs) {
        out.push_back(aggregate(r));
    }
    return out;
}

// ─── CompositeScorer ──────────────────────────────────────────────────────────

CompositeScore CompositeScorer::score(const DimensionScore& d) const {
    std::array<MetricValue, ALL_DIMENSIONS.size()> dims{};
    for (std::size_t i = 0; i < ALL_DIMENSIONS.size(); ++i) {
        dims[i] = d.get(ALL_DIMENSIONS[i]);
    }

    CompositeScore out{
        .entity_id = d.entity_id,
        .period    = d.period,
        .quality   = std::nullopt,
    };

    if (policy_ == CompositePolicy::Strict) {
        for (const auto& v : dims) {
            if (!v) return out;
        }
    }
    out.quality = mean_of_present(dims);
    return out;
}

std::vector<CompositeScore>
CompositeScorer::score(std::span<const DimensionScore> ds) const {
    std::vector<CompositeScore> out;
    out.reserve(ds.size());
    for (const auto& d : ds) {
        out.push_back(score(d));
    }
    return out;
}

} // namespace qmj::factor
