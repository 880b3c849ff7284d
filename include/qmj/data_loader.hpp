#pragma once

/// @file include/qmj/data_loader.hpp
/// @brief CSV ingestion of the entity-period panel and output of the factor
///        return table.
///
/// # Module: PanelLoader
///
/// ## Expected CSV Format
/// ```
/// entity_id,period,price,prev_price,gpoa,roe,roa,cfoa,gmar,acc,bab,lev,o,z,evol,eiss,diss,npop
/// AAPL,2019,157.7,142.2,0.31,0.55,...
/// ```
/// Columns are matched by case-insensitive name in any order; unknown
/// columns are ignored. `period` is `YYYY` or `YYYY-MM`.
///
/// ## Missing vs malformed
/// - An empty cell, `NA` or `NaN` in a metric or `prev_price` column is a
///   missing value.
/// - Any other non-numeric or non-finite cell is malformed: the load fails
///   with DataError naming the line and column. Nothing is coerced to 0.
/// - `entity_id`, `period` and `price` may not be missing.
///
/// ## Errors
/// - ConfigError: a required column is absent from the header
/// - DataError:   malformed cell, wrong field count, duplicate key
/// - std::runtime_error: file cannot be opened

#include "qmj/panel.hpp"
#include "qmj/types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qmj::core {

class PanelLoader {
public:
    /// Parse a whole CSV document (header line first).
    ///
    /// # Arguments
    /// * `csv_content`      — document text
    /// * `required_metrics` — metric columns that must be present. Defaults
    ///                        to the fourteen standard QMJ metrics.
    [[nodiscard]] static PanelStore
    parse_csv_string(std::string_view csv_content,
                     std::span<const std::string> required_metrics);

    [[nodiscard]] static PanelStore
    parse_csv_string(std::string_view csv_content);

    /// Read and parse a CSV file.
    [[nodiscard]] static PanelStore
    load_csv(const std::string& filepath,
             std::span<const std::string> required_metrics);

    [[nodiscard]] static PanelStore
    load_csv(const std::string& filepath);

    /// Parse "2019" or "2019-03". Throws DataError otherwise.
    [[nodiscard]] static Period parse_period(std::string_view token);

    /// The fourteen standard metric names as owned strings.
    [[nodiscard]] static std::vector<std::string> standard_metrics();
};

/// Serialises a factor return series.
///
/// Columns: period,quality_return,junk_return,qmj,n_ranked,n_quality,n_junk.
/// Missing values are empty cells. Doubles use shortest round-trip
/// formatting, so identical series always serialise to identical bytes.
class FactorReturnWriter {
public:
    [[nodiscard]] static std::string
    to_csv(std::span<const PeriodFactorReturn> series);

    /// Write `to_csv(series)` to `filepath`. Throws std::runtime_error if
    /// the file cannot be written.
    static void write_csv(const std::string& filepath,
                          std::span<const PeriodFactorReturn> series);
};

} // namespace qmj::core
