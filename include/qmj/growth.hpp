#pragma once

/// @file include/qmj/growth.hpp
/// @brief Period-over-period change series for the Growth dimension.
///
/// Growth is measured on changes of profitability metrics, not on their
/// levels. For every base metric m and entity e:
///
///   d_m(e, t) = m(e, t) − m(e, t_prev)
///
/// where t_prev is the entity's previous record in its own period-ordered
/// history. The change is missing when either side is missing or when the
/// entity has no earlier record.
///
/// This is the only cross-period computation in the system. It runs once
/// over the whole panel before the panel is partitioned by period.

#include "qmj/panel.hpp"
#include "qmj/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace qmj::factor {

class GrowthDeltaCalculator {
public:
    /// Copy every record of `panel` (same indices as `panel.records()`) and
    /// add a `d_<m>` entry for each m in `base_metrics`.
    [[nodiscard]] static std::vector<MetricRecord>
    apply(const core::PanelStore& panel, std::span<const std::string> base_metrics);

    /// Change of `name` from `prev` to `curr`; missing if either is missing.
    [[nodiscard]] static MetricValue
    delta(const MetricRecord& prev, const MetricRecord& curr,
          std::string_view name) noexcept;
};

} // namespace qmj::factor
