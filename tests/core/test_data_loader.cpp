/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for PanelLoader and FactorReturnWriter.
///
/// Test categories:
///   - Header handling: order, case, extra columns, missing columns
///   - Missing tokens vs malformed cells
///   - Period parsing
///   - Output serialisation

#include <gtest/gtest.h>
#include "qmj/data_loader.hpp"
#include "qmj/errors.hpp"

#include "panel_fixtures.hpp"

#include <string>
#include <vector>

using namespace qmj;
using namespace qmj::core;

namespace {

const std::string HEADER =
    "entity_id,period,price,prev_price,gpoa,roe,roa,cfoa,gmar,acc,"
    "bab,lev,o,z,evol,eiss,diss,npop\n";

std::string row(const std::string& id, const std::string& period,
                const std::string& tail = "1,2,3,4,5,6,7,8,9,10,11,12,13,14") {
    return id + "," + period + ",105,100," + tail + "\n";
}

}  // anonymous namespace

// ─── Well-formed input ────────────────────────────────────────────────────────

TEST(PanelLoader, ParsesStandardHeader) {
    const auto panel = PanelLoader::parse_csv_string(
        HEADER + row("AAA", "2019") + row("BBB", "2019"));
    ASSERT_EQ(panel.size(), 2u);
    const auto& r = panel.records()[0];
    EXPECT_EQ(r.entity_id, "AAA");
    EXPECT_EQ(r.period, (Period{2019, 0}));
    EXPECT_DOUBLE_EQ(r.price, 105.0);
    ASSERT_TRUE(r.prev_price.has_value());
    EXPECT_DOUBLE_EQ(*r.prev_price, 100.0);
    EXPECT_DOUBLE_EQ(*find_metric(r.raw_metrics, "gpoa"), 1.0);
    EXPECT_DOUBLE_EQ(*find_metric(r.raw_metrics, "npop"), 14.0);
    EXPECT_EQ(panel.metric_columns().size(), 14u);
}

TEST(PanelLoader, ColumnsMatchedByNameInAnyOrderAndCase) {
    const std::string csv =
        "NPOP,diss,eiss,evol,z,o,lev,bab,acc,gmar,cfoa,roa,roe,GPOA,"
        "Prev_Price,Price,Period,Entity_ID,comment\n"
        "14,13,12,11,10,9,8,7,6,5,4,3,2,1,100,105,2020-06,XYZ,ignored\n";
    const auto panel = PanelLoader::parse_csv_string(csv);
    ASSERT_EQ(panel.size(), 1u);
    const auto& r = panel.records()[0];
    EXPECT_EQ(r.entity_id, "XYZ");
    EXPECT_EQ(r.period, (Period{2020, 6}));
    EXPECT_DOUBLE_EQ(*find_metric(r.raw_metrics, "gpoa"), 1.0);
    EXPECT_DOUBLE_EQ(*find_metric(r.raw_metrics, "npop"), 14.0);
    EXPECT_FALSE(find_metric(r.raw_metrics, "comment").has_value());
}

TEST(PanelLoader, BlankAndCommentLinesSkipped) {
    const auto panel = PanelLoader::parse_csv_string(
        "# exported panel\n" + HEADER + "\n" + row("AAA", "2019") + "\r\n");
    EXPECT_EQ(panel.size(), 1u);
}

// ─── Missing values ───────────────────────────────────────────────────────────

TEST(PanelLoader, EmptyAndNaTokensAreMissing) {
    const auto panel = PanelLoader::parse_csv_string(
        HEADER + row("AAA", "2019", ",NA,nan,NaN,5,6,7,8,9,10,11,12,13,14"));
    const auto& m = panel.records()[0].raw_metrics;
    EXPECT_FALSE(find_metric(m, "gpoa").has_value());
    EXPECT_FALSE(find_metric(m, "roe").has_value());
    EXPECT_FALSE(find_metric(m, "roa").has_value());
    EXPECT_FALSE(find_metric(m, "cfoa").has_value());
    EXPECT_DOUBLE_EQ(*find_metric(m, "gmar"), 5.0);
}

TEST(PanelLoader, MissingPrevPriceAllowed) {
    const auto panel = PanelLoader::parse_csv_string(
        HEADER + "AAA,2019,105,,1,2,3,4,5,6,7,8,9,10,11,12,13,14\n");
    EXPECT_FALSE(panel.records()[0].prev_price.has_value());
}

// ─── Fail-fast ────────────────────────────────────────────────────────────────

TEST(PanelLoader, MissingMetricColumnIsConfigError) {
    const std::string csv =
        "entity_id,period,price,prev_price,gpoa,roe,roa,cfoa,gmar,acc,"
        "bab,lev,o,z,evol,eiss,diss\n"
        "AAA,2019,1,1,1,2,3,4,5,6,7,8,9,10,11,12,13\n";
    EXPECT_THROW(PanelLoader::parse_csv_string(csv), ConfigError);
}

TEST(PanelLoader, MissingPriceColumnIsConfigError) {
    const std::string csv =
        "entity_id,period,prev_price,gpoa,roe,roa,cfoa,gmar,acc,"
        "bab,lev,o,z,evol,eiss,diss,npop\n";
    try {
        (void)PanelLoader::parse_csv_string(csv);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("price"), std::string::npos);
    }
}

TEST(PanelLoader, EmptyDocumentIsConfigError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(""), ConfigError);
}

TEST(PanelLoader, MalformedMetricIsDataError) {
    const auto csv = HEADER + row("AAA", "2019", "1,abc,3,4,5,6,7,8,9,10,11,12,13,14");
    try {
        (void)PanelLoader::parse_csv_string(csv);
        FAIL() << "expected DataError";
    } catch (const DataError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("line 2"), std::string::npos) << what;
        EXPECT_NE(what.find("roe"), std::string::npos) << what;
    }
}

TEST(PanelLoader, TrailingGarbageIsDataError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(
                     HEADER + row("AAA", "2019", "1.5x,2,3,4,5,6,7,8,9,10,11,12,13,14")),
                 DataError);
}

TEST(PanelLoader, InfinityIsDataError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(
                     HEADER + row("AAA", "2019", "inf,2,3,4,5,6,7,8,9,10,11,12,13,14")),
                 DataError);
}

TEST(PanelLoader, MissingPriceIsDataError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(
                     HEADER + "AAA,2019,NA,100,1,2,3,4,5,6,7,8,9,10,11,12,13,14\n"),
                 DataError);
}

TEST(PanelLoader, WrongFieldCountIsDataError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(HEADER + "AAA,2019,105,100,1,2\n"),
                 DataError);
}

TEST(PanelLoader, DuplicateEntityPeriodIsDataError) {
    EXPECT_THROW(PanelLoader::parse_csv_string(
                     HEADER + row("AAA", "2019") + row("AAA", "2019")),
                 DataError);
}

TEST(PanelLoader, MissingFileThrows) {
    EXPECT_THROW(PanelLoader::load_csv("/nonexistent/panel.csv"), std::runtime_error);
}

// ─── Period parsing ───────────────────────────────────────────────────────────

TEST(PanelLoader_ParsePeriod, AnnualAndMonthly) {
    EXPECT_EQ(PanelLoader::parse_period("1999"), (Period{1999, 0}));
    EXPECT_EQ(PanelLoader::parse_period("2021-03"), (Period{2021, 3}));
    EXPECT_EQ(PanelLoader::parse_period("2021-3"), (Period{2021, 3}));
}

TEST(PanelLoader_ParsePeriod, RejectsMalformed) {
    EXPECT_THROW(PanelLoader::parse_period(""), DataError);
    EXPECT_THROW(PanelLoader::parse_period("99"), DataError);
    EXPECT_THROW(PanelLoader::parse_period("2021-13"), DataError);
    EXPECT_THROW(PanelLoader::parse_period("2021-00"), DataError);
    EXPECT_THROW(PanelLoader::parse_period("2021-"), DataError);
    EXPECT_THROW(PanelLoader::parse_period("20x1"), DataError);
}

TEST(Period, ToStringAndOrdering) {
    EXPECT_EQ((Period{2019, 0}).to_string(), "2019");
    EXPECT_EQ((Period{2019, 4}).to_string(), "2019-04");
    EXPECT_LT((Period{2019, 0}), (Period{2019, 1}));
    EXPECT_LT((Period{2019, 12}), (Period{2020, 1}));
}

// ─── Fixture round trip ───────────────────────────────────────────────────────

TEST(PanelLoader, FixtureCsvLoadsBack) {
    const auto records = fixtures::random_panel(12, 3, 7, 0.1);
    const auto panel   = PanelLoader::parse_csv_string(fixtures::to_csv(records));
    EXPECT_EQ(panel.size(), records.size());
    EXPECT_EQ(panel.periods().size(), 3u);
}

// ─── FactorReturnWriter ───────────────────────────────────────────────────────

TEST(FactorReturnWriter, MissingValuesAreEmptyCells) {
    std::vector<PeriodFactorReturn> series = {
        {.period = {2019, 0}, .quality_return = 0.8, .junk_return = 0.3,
         .qmj = 0.5, .n_ranked = 10, .n_quality = 1, .n_junk = 1},
        {.period = {2020, 0}, .quality_return = 1.25, .junk_return = std::nullopt,
         .qmj = std::nullopt, .n_ranked = 1, .n_quality = 1, .n_junk = 0},
    };
    EXPECT_EQ(FactorReturnWriter::to_csv(series),
              "period,quality_return,junk_return,qmj,n_ranked,n_quality,n_junk\n"
              "2019,0.8,0.3,0.5,10,1,1\n"
              "2020,1.25,,,1,1,0\n");
}
