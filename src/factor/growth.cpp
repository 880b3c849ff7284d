/// @file src/factor/growth.cpp
/// @brief Per-entity period-over-period change series.

#include "qmj/growth.hpp"
#include "qmj/config.hpp"

namespace qmj::factor {

MetricValue GrowthDeltaCalculator::delta(const MetricRecord& prev,
                                         const MetricRecord& curr,
                                         std::string_view name) noexcept {
    const auto a = find_metric(prev.raw_metrics, name);
    const auto b = find_metric(curr.raw_metrics, name);
    if (!a || !b) {
        return std::nullopt;
    }
    return *b - *a;
}

std::vector<MetricRecord>
GrowthDeltaCalculator::apply(const core::PanelStore& panel,
                             std::span<const std::string> base_metrics) {
    std::vector<MetricRecord> out = panel.records();

    std::vector<std::string> names;
    names.reserve(base_metrics.size());
    for (const auto& m : base_metrics) {
        names.push_back(delta_metric_name(m));
    }

    for (const auto& [entity, history] : panel.entity_histories()) {
        for (std::size_t k = 0; k < history.size(); ++k) {
            auto& rec = out[history[k]];
            for (std::size_t j = 0; j < base_metrics.size(); ++j) {
                // First record of an entity has no prior period to difference.
                const MetricValue d = k == 0
                    ? MetricValue{}
                    : delta(panel.records()[history[k - 1]],
                            panel.records()[history[k]],
                            base_metrics[j]);
                rec.raw_metrics.insert_or_assign(names[j], d);
            }
        }
    }
    return out;
}

} // namespace qmj::factor
