/// @file src/core/data_loader.cpp
/// @brief CSV PanelLoader and FactorReturnWriter.

#include "qmj/data_loader.hpp"
#include "qmj/constants.hpp"
#include "qmj/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace qmj::core {

namespace {

// ─── Token helpers ────────────────────────────────────────────────────────────

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_csv(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_missing_token(std::string_view token) {
    if (token.empty()) return true;
    const auto l = lower(token);
    return l == "na" || l == "nan";
}

/// Strict finite double parse; nullopt on any leftover characters.
std::optional<double> parse_double(std::string_view token) noexcept {
    if (token.empty()) return std::nullopt;
    if (token.front() == '+') token.remove_prefix(1);
    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

int find_col(const std::vector<std::string>& header, std::string_view name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

// ─── Column layout ────────────────────────────────────────────────────────────

struct Layout {
    int col_entity     = -1;
    int col_period     = -1;
    int col_price      = -1;
    int col_prev_price = -1;
    std::vector<std::pair<std::string, int>> metrics;  ///< name → column
    std::size_t width = 0;
};

Layout read_header(std::string_view line,
                   std::span<const std::string> required_metrics) {
    std::vector<std::string> header;
    for (auto f : split_csv(line)) {
        header.push_back(lower(f));
    }

    Layout layout;
    layout.width          = header.size();
    layout.col_entity     = find_col(header, constants::COL_ENTITY_ID);
    layout.col_period     = find_col(header, constants::COL_PERIOD);
    layout.col_price      = find_col(header, constants::COL_PRICE);
    layout.col_prev_price = find_col(header, constants::COL_PREV_PRICE);

    std::vector<std::string> missing;
    if (layout.col_entity < 0)     missing.emplace_back(constants::COL_ENTITY_ID);
    if (layout.col_period < 0)     missing.emplace_back(constants::COL_PERIOD);
    if (layout.col_price < 0)      missing.emplace_back(constants::COL_PRICE);
    if (layout.col_prev_price < 0) missing.emplace_back(constants::COL_PREV_PRICE);

    for (const auto& m : required_metrics) {
        const int col = find_col(header, lower(m));
        if (col < 0) {
            missing.push_back(m);
        } else {
            layout.metrics.emplace_back(m, col);
        }
    }

    if (!missing.empty()) {
        throw ConfigError(fmt::format(
            "panel is missing required column(s): {}", fmt::join(missing, ", ")));
    }
    return layout;
}

MetricRecord parse_row(std::string_view line, std::size_t line_no,
                       const Layout& layout) {
    const auto fields = split_csv(line);
    if (fields.size() != layout.width) {
        throw DataError(fmt::format(
            "line {}: expected {} fields, found {}",
            line_no, layout.width, fields.size()));
    }

    auto field = [&](int col) { return fields[static_cast<std::size_t>(col)]; };

    auto number = [&](int col, std::string_view name) -> MetricValue {
        const auto token = field(col);
        if (is_missing_token(token)) {
            return std::nullopt;
        }
        auto v = parse_double(token);
        if (!v) {
            throw DataError(fmt::format(
                "line {}: column '{}' holds malformed value '{}'",
                line_no, name, token));
        }
        return v;
    };

    MetricRecord rec;
    rec.entity_id = std::string(field(layout.col_entity));
    if (rec.entity_id.empty()) {
        throw DataError(fmt::format("line {}: entity_id is empty", line_no));
    }

    try {
        rec.period = PanelLoader::parse_period(field(layout.col_period));
    } catch (const DataError& e) {
        throw DataError(fmt::format("line {}: {}", line_no, e.what()));
    }

    const auto price = number(layout.col_price, constants::COL_PRICE);
    if (!price) {
        throw DataError(fmt::format("line {}: price is missing", line_no));
    }
    rec.price      = *price;
    rec.prev_price = number(layout.col_prev_price, constants::COL_PREV_PRICE);

    for (const auto& [name, col] : layout.metrics) {
        rec.raw_metrics.emplace(name, number(col, name));
    }
    return rec;
}

} // namespace

// ─── PanelLoader::parse_period ────────────────────────────────────────────────

Period PanelLoader::parse_period(std::string_view token) {
    token = trim(token);
    auto to_int = [&](std::string_view s, int& out) {
        if (s.empty()) return false;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc{} && ptr == s.data() + s.size();
    };

    Period p;
    const auto dash = token.find('-');
    const auto year_part = token.substr(0, dash);
    if (year_part.size() != 4 || !to_int(year_part, p.year)) {
        throw DataError(fmt::format("malformed period '{}'", token));
    }
    if (dash != std::string_view::npos) {
        const auto month_part = token.substr(dash + 1);
        if (month_part.size() > 2 || !to_int(month_part, p.month) ||
            p.month < 1 || p.month > 12) {
            throw DataError(fmt::format("malformed period '{}'", token));
        }
    }
    return p;
}

std::vector<std::string> PanelLoader::standard_metrics() {
    return {constants::RAW_METRICS.begin(), constants::RAW_METRICS.end()};
}

// ─── PanelLoader::parse_csv_string ────────────────────────────────────────────

PanelStore PanelLoader::parse_csv_string(std::string_view csv_content,
                                         std::span<const std::string> required_metrics) {
    std::vector<MetricRecord> records;
    std::optional<Layout> layout;
    std::size_t line_no = 0;
    std::size_t start   = 0;

    while (start <= csv_content.size()) {
        auto end = csv_content.find('\n', start);
        if (end == std::string_view::npos) end = csv_content.size();
        auto line = csv_content.substr(start, end - start);
        start = end + 1;
        ++line_no;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        // Skip blank lines and comment lines.
        if (trim(line).empty() || line.front() == '#') {
            continue;
        }

        if (!layout) {
            layout = read_header(line, required_metrics);
            continue;
        }
        records.push_back(parse_row(line, line_no, *layout));
    }

    if (!layout) {
        throw ConfigError("panel has no header row");
    }

    std::vector<std::string> columns;
    columns.reserve(layout->metrics.size());
    for (const auto& [name, col] : layout->metrics) {
        columns.push_back(name);
    }
    return PanelStore(std::move(records), std::move(columns));
}

PanelStore PanelLoader::parse_csv_string(std::string_view csv_content) {
    const auto metrics = standard_metrics();
    return parse_csv_string(csv_content, metrics);
}

// ─── PanelLoader::load_csv ────────────────────────────────────────────────────

PanelStore PanelLoader::load_csv(const std::string& filepath,
                                 std::span<const std::string> required_metrics) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open panel file: " + filepath);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str(), required_metrics);
}

PanelStore PanelLoader::load_csv(const std::string& filepath) {
    const auto metrics = standard_metrics();
    return load_csv(filepath, metrics);
}

// ─── FactorReturnWriter ───────────────────────────────────────────────────────

namespace {

std::string cell(const MetricValue& v) {
    return v ? fmt::format("{}", *v) : std::string{};
}

} // namespace

std::string FactorReturnWriter::to_csv(std::span<const PeriodFactorReturn> series) {
    std::string out = "period,quality_return,junk_return,qmj,n_ranked,n_quality,n_junk\n";
    for (const auto& row : series) {
        out += fmt::format("{},{},{},{},{},{},{}\n",
                           row.period.to_string(),
                           cell(row.quality_return),
                           cell(row.junk_return),
                           cell(row.qmj),
                           row.n_ranked, row.n_quality, row.n_junk);
    }
    return out;
}

void FactorReturnWriter::write_csv(const std::string& filepath,
                                   std::span<const PeriodFactorReturn> series) {
    std::ofstream out(filepath, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open output file: " + filepath);
    }
    out << to_csv(series);
    if (!out) {
        throw std::runtime_error("failed writing output file: " + filepath);
    }
}

} // namespace qmj::core
