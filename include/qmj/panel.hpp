#pragma once

/// @file include/qmj/panel.hpp
/// @brief PanelStore: immutable entity × period input table.
///
/// # Module: Panel Store
///
/// ## Responsibility
/// Own the MetricRecords of one run and expose the two groupings the
/// pipeline needs:
///   - by period: record indices of each period, periods ascending,
///     entities ascending within a period
///   - by entity: record indices of each entity, periods ascending
///     (the per-entity history used for period-over-period deltas)
///
/// ## Guarantees
/// - Records are never modified after construction
/// - (entity_id, period) is unique; duplicates raise DataError
/// - Every present value is finite; NaN and ±inf raise DataError
/// - Both groupings are deterministic regardless of input row order

#include "qmj/types.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qmj::core {

class PanelStore {
public:
    /// Take ownership of `records`.
    ///
    /// # Arguments
    /// * `records`        — input rows, any order
    /// * `metric_columns` — metric columns present in the source table. When
    ///                      empty, the union of the records' metric names is used.
    ///
    /// # Throws
    /// DataError on an empty entity_id, a duplicated (entity_id, period), or
    /// a NaN / infinite price, prev_price or metric value.
    explicit PanelStore(std::vector<MetricRecord> records,
                        std::vector<std::string> metric_columns = {});

    [[nodiscard]] const std::vector<MetricRecord>& records() const noexcept {
        return records_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// Distinct periods, ascending.
    [[nodiscard]] const std::vector<Period>& periods() const noexcept {
        return periods_;
    }

    /// Record indices of `periods()[i]`, ordered by entity_id.
    [[nodiscard]] std::span<const std::size_t>
    period_group(std::size_t i) const noexcept;

    /// Entity → record indices ordered by period.
    [[nodiscard]] const std::map<std::string, std::vector<std::size_t>, std::less<>>&
    entity_histories() const noexcept {
        return histories_;
    }

    /// Metric columns of the source table, sorted.
    [[nodiscard]] const std::vector<std::string>& metric_columns() const noexcept {
        return metric_columns_;
    }

    [[nodiscard]] bool has_metric(std::string_view name) const noexcept;

private:
    std::vector<MetricRecord>                          records_;
    std::vector<std::string>                           metric_columns_;
    std::vector<Period>                                periods_;
    std::vector<std::vector<std::size_t>>              period_groups_;
    std::map<std::string, std::vector<std::size_t>, std::less<>> histories_;
};

} // namespace qmj::core
