/// @file src/core/config.cpp
/// @brief PipelineConfig defaults and validation.

#include "qmj/config.hpp"
#include "qmj/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace qmj {

DimensionMetricMap default_dimension_metric_map() {
    return DimensionMetricMap{
        {Dimension::Profitability, {"gpoa", "roe", "roa", "cfoa", "gmar", "acc"}},
        {Dimension::Growth,        {"d_gpoa", "d_roe", "d_roa", "d_cfoa", "d_gmar"}},
        {Dimension::Safety,        {"bab", "lev", "o", "z", "evol"}},
        {Dimension::Payout,        {"eiss", "diss", "npop"}},
    };
}

bool is_delta_metric(std::string_view name) noexcept {
    return name.size() > constants::DELTA_PREFIX.size() &&
           name.substr(0, constants::DELTA_PREFIX.size()) == constants::DELTA_PREFIX;
}

std::string delta_metric_name(std::string_view base) {
    std::string out(constants::DELTA_PREFIX);
    out += base;
    return out;
}

// ─── PipelineConfig::validate ─────────────────────────────────────────────────

namespace {

void check_fraction(const char* name, double f) {
    if (!std::isfinite(f) || f <= 0.0 || f > constants::MAX_BUCKET_FRACTION) {
        throw ConfigError(fmt::format(
            "{} must lie in (0, {}], got {}", name,
            constants::MAX_BUCKET_FRACTION, f));
    }
}

} // namespace

void PipelineConfig::validate() const {
    for (const Dimension d : ALL_DIMENSIONS) {
        const auto it = dimension_metric_map.find(d);
        if (it == dimension_metric_map.end() || it->second.empty()) {
            throw ConfigError(fmt::format(
                "dimension_metric_map has no metrics for {}", to_string(d)));
        }
        for (const auto& name : it->second) {
            if (name.empty() || name == constants::DELTA_PREFIX) {
                throw ConfigError(fmt::format(
                    "dimension_metric_map: invalid metric name '{}' in {}",
                    name, to_string(d)));
            }
        }
    }
    check_fraction("top_decile_fraction", top_decile_fraction);
    check_fraction("bottom_decile_fraction", bottom_decile_fraction);
    if (workers == 0) {
        throw ConfigError("workers must be at least 1");
    }
}

// ─── Metric name sets ─────────────────────────────────────────────────────────

std::vector<std::string> PipelineConfig::standardized_metrics() const {
    std::set<std::string> names;
    for (const auto& [dim, metrics] : dimension_metric_map) {
        names.insert(metrics.begin(), metrics.end());
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> PipelineConfig::delta_base_metrics() const {
    std::set<std::string> names;
    for (const auto& [dim, metrics] : dimension_metric_map) {
        for (const auto& m : metrics) {
            if (is_delta_metric(m)) {
                names.insert(m.substr(constants::DELTA_PREFIX.size()));
            }
        }
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> PipelineConfig::required_input_metrics() const {
    std::set<std::string> names;
    for (const auto& [dim, metrics] : dimension_metric_map) {
        for (const auto& m : metrics) {
            if (is_delta_metric(m)) {
                names.insert(m.substr(constants::DELTA_PREFIX.size()));
            } else {
                names.insert(m);
            }
        }
    }
    return {names.begin(), names.end()};
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(MissingValuePolicy p) noexcept {
    return p == MissingValuePolicy::Exclude ? "exclude" : "zero-fill";
}

std::string_view to_string(CompositePolicy p) noexcept {
    return p == CompositePolicy::Lenient ? "lenient" : "strict";
}

std::string_view to_string(TieBreak t) noexcept {
    return t == TieBreak::EntityAscending ? "entity-asc" : "entity-desc";
}

} // namespace qmj
