/// @file src/core/panel.cpp
/// @brief PanelStore: period and entity groupings over immutable records.

#include "qmj/panel.hpp"
#include "qmj/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <string_view>
#include <utility>

namespace qmj::core {

namespace {

/// Present values must be finite; missing is carried as nullopt, never NaN.
void check_finite(const MetricRecord& rec) {
    auto fail = [&](std::string_view field, double v) {
        throw DataError(fmt::format(
            "entity '{}' in period {}: {} holds non-finite value {}",
            rec.entity_id, rec.period.to_string(), field, v));
    };
    if (!std::isfinite(rec.price)) {
        fail("price", rec.price);
    }
    if (rec.prev_price && !std::isfinite(*rec.prev_price)) {
        fail("prev_price", *rec.prev_price);
    }
    for (const auto& [name, value] : rec.raw_metrics) {
        if (value && !std::isfinite(*value)) {
            fail(name, *value);
        }
    }
}

} // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

PanelStore::PanelStore(std::vector<MetricRecord> records,
                       std::vector<std::string> metric_columns)
    : records_(std::move(records))
    , metric_columns_(std::move(metric_columns))
{
    if (metric_columns_.empty()) {
        std::set<std::string> names;
        for (const auto& r : records_) {
            for (const auto& [name, value] : r.raw_metrics) {
                names.insert(name);
            }
        }
        metric_columns_.assign(names.begin(), names.end());
    } else {
        std::sort(metric_columns_.begin(), metric_columns_.end());
        metric_columns_.erase(
            std::unique(metric_columns_.begin(), metric_columns_.end()),
            metric_columns_.end());
    }

    // Sort record indices by (period, entity) once; both groupings read from it.
    std::vector<std::size_t> order(records_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        const auto& ra = records_[a];
        const auto& rb = records_[b];
        if (ra.period != rb.period) return ra.period < rb.period;
        return ra.entity_id < rb.entity_id;
    });

    for (std::size_t k = 0; k < order.size(); ++k) {
        const auto& rec = records_[order[k]];
        if (rec.entity_id.empty()) {
            throw DataError(fmt::format(
                "record in period {} has an empty entity_id",
                rec.period.to_string()));
        }
        check_finite(rec);
        if (k > 0) {
            const auto& prev = records_[order[k - 1]];
            if (prev.period == rec.period && prev.entity_id == rec.entity_id) {
                throw DataError(fmt::format(
                    "duplicate record for entity '{}' in period {}",
                    rec.entity_id, rec.period.to_string()));
            }
        }
        if (periods_.empty() || periods_.back() != rec.period) {
            periods_.push_back(rec.period);
            period_groups_.emplace_back();
        }
        period_groups_.back().push_back(order[k]);
        histories_[rec.entity_id].push_back(order[k]);
    }
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::span<const std::size_t> PanelStore::period_group(std::size_t i) const noexcept {
    if (i >= period_groups_.size()) {
        return {};
    }
    return period_groups_[i];
}

bool PanelStore::has_metric(std::string_view name) const noexcept {
    return std::binary_search(metric_columns_.begin(), metric_columns_.end(),
                              name, std::less<>{});
}

} // namespace qmj::core
