/// @file tests/factor/test_aggregator.cpp
/// @brief SubFactorAggregator and CompositeScorer.

#include <gtest/gtest.h>
#include "qmj/aggregator.hpp"

#include <vector>

using namespace qmj;
using namespace qmj::factor;

namespace {

StandardizedRecord zrec(std::initializer_list<std::pair<const char*, MetricValue>> z) {
    StandardizedRecord r;
    r.entity_id = "A";
    r.period    = {2019, 0};
    for (const auto& [k, v] : z) r.z.emplace(k, v);
    return r;
}

DimensionMetricMap small_map() {
    return {
        {Dimension::Profitability, {"p1", "p2"}},
        {Dimension::Growth,        {"d_p1"}},
        {Dimension::Safety,        {"s1", "s2", "s3"}},
        {Dimension::Payout,        {"y1"}},
    };
}

}  // anonymous namespace

// ─── mean_of_present ──────────────────────────────────────────────────────────

TEST(MeanOfPresent, SkipsMissing) {
    const std::vector<MetricValue> v = {1.0, std::nullopt, 3.0};
    EXPECT_DOUBLE_EQ(*mean_of_present(v), 2.0);
}

TEST(MeanOfPresent, AllMissingIsNullopt) {
    const std::vector<MetricValue> v = {std::nullopt, std::nullopt};
    EXPECT_FALSE(mean_of_present(v).has_value());
    EXPECT_FALSE(mean_of_present({}).has_value());
}

// ─── SubFactorAggregator ──────────────────────────────────────────────────────

TEST(SubFactorAggregator, MeanOfPresentComponents) {
    const SubFactorAggregator agg(small_map());
    const auto d = agg.aggregate(zrec({
        {"p1", 1.0}, {"p2", 2.0},
        {"d_p1", -0.5},
        {"s1", 3.0}, {"s2", std::nullopt}, {"s3", 0.0},
        {"y1", std::nullopt},
    }));
    EXPECT_EQ(d.entity_id, "A");
    EXPECT_DOUBLE_EQ(*d.profitability, 1.5);
    EXPECT_DOUBLE_EQ(*d.growth, -0.5);
    EXPECT_DOUBLE_EQ(*d.safety, 1.5);
    EXPECT_FALSE(d.payout.has_value());
}

TEST(SubFactorAggregator, AbsentKeysReadAsMissing) {
    const SubFactorAggregator agg(small_map());
    const auto d = agg.aggregate(zrec({{"p1", 4.0}}));
    EXPECT_DOUBLE_EQ(*d.profitability, 4.0);
    EXPECT_FALSE(d.growth.has_value());
    EXPECT_FALSE(d.safety.has_value());
    EXPECT_FALSE(d.payout.has_value());
}

TEST(SubFactorAggregator, DefaultMapUsesDeltaForGrowth) {
    const SubFactorAggregator agg(default_dimension_metric_map());
    const auto d = agg.aggregate(zrec({{"gpoa", 1.0}, {"d_gpoa", -1.0}}));
    EXPECT_DOUBLE_EQ(*d.profitability, 1.0);
    EXPECT_DOUBLE_EQ(*d.growth, -1.0);
}

TEST(SubFactorAggregator, BatchPreservesOrder) {
    const SubFactorAggregator agg(small_map());
    std::vector<StandardizedRecord> recs = {zrec({{"p1", 1.0}}), zrec({{"p1", 2.0}})};
    recs[1].entity_id = "B";
    const auto out = agg.aggregate(recs);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].entity_id, "B");
    EXPECT_DOUBLE_EQ(*out[1].profitability, 2.0);
}

// ─── CompositeScorer ──────────────────────────────────────────────────────────

namespace {

DimensionScore dims(MetricValue p, MetricValue g, MetricValue s, MetricValue y) {
    DimensionScore d;
    d.entity_id     = "A";
    d.period        = {2019, 0};
    d.profitability = p;
    d.growth        = g;
    d.safety        = s;
    d.payout        = y;
    return d;
}

}  // anonymous namespace

TEST(CompositeScorer, LenientAveragesPresentDimensions) {
    const CompositeScorer scorer(CompositePolicy::Lenient);
    EXPECT_DOUBLE_EQ(*scorer.score(dims(1.0, 2.0, 3.0, 6.0)).quality, 3.0);
    EXPECT_DOUBLE_EQ(*scorer.score(dims(1.0, std::nullopt, 3.0, std::nullopt)).quality, 2.0);
}

TEST(CompositeScorer, LenientAllMissingIsMissingNotZero) {
    const CompositeScorer scorer(CompositePolicy::Lenient);
    const auto c = scorer.score(dims(std::nullopt, std::nullopt, std::nullopt, std::nullopt));
    EXPECT_FALSE(c.quality.has_value());
}

TEST(CompositeScorer, StrictRequiresAllFour) {
    const CompositeScorer scorer(CompositePolicy::Strict);
    EXPECT_DOUBLE_EQ(*scorer.score(dims(1.0, 2.0, 3.0, 6.0)).quality, 3.0);
    EXPECT_FALSE(scorer.score(dims(1.0, std::nullopt, 3.0, 6.0)).quality.has_value());
}

TEST(CompositeScorer, CarriesKey) {
    const auto c = CompositeScorer{}.score(dims(1.0, 1.0, 1.0, 1.0));
    EXPECT_EQ(c.entity_id, "A");
    EXPECT_EQ(c.period, (Period{2019, 0}));
}
